#include "hb/JsonValidator.hpp"

#include "hb/Command.hpp"
#include "hb/Errors.hpp"
#include "hb/Json.hpp"

#include <string>

namespace hb {

Request JsonValidator::validateRequest(const rapidjson::Document& doc) {
  if (!doc.IsObject()) {
    throw ProtocolError("Request must be a JSON object");
  }

  auto m = doc.FindMember("method");
  // A missing or non-string method is just another unknown method.
  if (m == doc.MemberEnd()) {
    throw UnknownMethodError("", methodNames());
  }
  if (!m->value.IsString()) {
    throw UnknownMethodError(json::toString(m->value), methodNames());
  }

  Request req;
  req.method.assign(m->value.GetString(), m->value.GetStringLength());

  auto p = doc.FindMember("params");
  if (p != doc.MemberEnd() && !p->value.IsNull()) {
    if (!p->value.IsObject()) {
      throw ValidationError("params must be an object");
    }
    req.params.CopyFrom(p->value, req.params.GetAllocator());
  }
  return req;
}

std::string JsonValidator::requireString(const rapidjson::Value& params,
                                         const char* name,
                                         const std::string& message) {
  if (!params.IsObject()) throw ValidationError(message);
  auto it = params.FindMember(name);
  if (it == params.MemberEnd() || !it->value.IsString() || it->value.GetStringLength() == 0) {
    throw ValidationError(message);
  }
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::optional<std::string> JsonValidator::optionalString(const rapidjson::Value& params,
                                                         const char* name) {
  if (!params.IsObject()) return std::nullopt;
  auto it = params.FindMember(name);
  if (it == params.MemberEnd() || it->value.IsNull()) return std::nullopt;
  if (!it->value.IsString()) {
    throw ValidationError(std::string(name) + " must be a string");
  }
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::optional<double> JsonValidator::optionalNumber(const rapidjson::Value& params,
                                                    const char* name) {
  if (!params.IsObject()) return std::nullopt;
  auto it = params.FindMember(name);
  if (it == params.MemberEnd() || it->value.IsNull()) return std::nullopt;
  if (!it->value.IsNumber()) {
    throw ValidationError(std::string(name) + " must be a number");
  }
  return it->value.GetDouble();
}

} // namespace hb
