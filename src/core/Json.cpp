#include "hb/Json.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace hb::json {

std::string toString(const rapidjson::Value& v) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  v.Accept(writer);
  return std::string(sb.GetString(), sb.GetSize());
}

rapidjson::Value string(const std::string& s, Allocator& alloc) {
  rapidjson::Value v;
  v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
  return v;
}

rapidjson::Value stringArray(const std::vector<std::string>& items, Allocator& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  arr.Reserve(static_cast<rapidjson::SizeType>(items.size()), alloc);
  for (const auto& s : items) {
    arr.PushBack(string(s, alloc), alloc);
  }
  return arr;
}

rapidjson::Document copy(const rapidjson::Value& v) {
  rapidjson::Document d;
  d.CopyFrom(v, d.GetAllocator());
  return d;
}

rapidjson::Document successMessage(const std::string& message) {
  rapidjson::Document d(rapidjson::kObjectType);
  auto& a = d.GetAllocator();
  d.AddMember("success", true, a);
  d.AddMember("message", string(message, a), a);
  return d;
}

} // namespace hb::json
