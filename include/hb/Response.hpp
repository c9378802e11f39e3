#pragma once

#include <rapidjson/document.h>

#include <functional>
#include <string>

namespace hb {

/// One parsed client request. Params is always an object ({} when absent).
struct Request {
  std::string         method;
  rapidjson::Document params{rapidjson::kObjectType};
};

/// Tagged result written back on the connection: {ok:true,result} or {ok:false,error}.
class Response {
public:
  static Response success(rapidjson::Document result);
  static Response failure(std::string error);

  Response(Response&&) = default;
  Response& operator=(Response&&) = default;

  bool ok() const noexcept { return ok_; }
  const rapidjson::Value& result() const noexcept { return result_; }
  const std::string& error() const noexcept { return error_; }

  std::string serialize() const;

  // Host action to run only after the response has been written.
  const std::function<void()>& afterSend() const noexcept { return afterSend_; }
  void setAfterSend(std::function<void()> fn) { afterSend_ = std::move(fn); }

private:
  Response() = default;

  bool                  ok_ = false;
  rapidjson::Document   result_;
  std::string           error_;
  std::function<void()> afterSend_;
};

} // namespace hb
