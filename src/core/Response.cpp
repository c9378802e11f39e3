#include "hb/Response.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace hb {

Response Response::success(rapidjson::Document result) {
  Response r;
  r.ok_ = true;
  r.result_ = std::move(result);
  return r;
}

Response Response::failure(std::string error) {
  Response r;
  r.ok_ = false;
  r.error_ = std::move(error);
  return r;
}

std::string Response::serialize() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("ok");
  w.Bool(ok_);
  if (ok_) {
    w.Key("result");
    result_.Accept(w);
  } else {
    w.Key("error");
    w.String(error_.c_str(), static_cast<rapidjson::SizeType>(error_.size()));
  }
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace hb
