#pragma once
#include <rapidjson/document.h>

#include <optional>
#include <string>

#include "hb/Response.hpp"

namespace hb {
class JsonValidator {
public:
    // Turns a parsed request body into a Request.
    // Throws ProtocolError if doc is not an object, ValidationError if
    // "method" is missing or not a string or "params" is not an object.
    static Request validateRequest(const rapidjson::Document& doc);

    // Non-empty string member or ValidationError(message).
    static std::string requireString(const rapidjson::Value& params,
                                     const char* name,
                                     const std::string& message);

    // Absent or null -> nullopt; present with another type -> ValidationError.
    static std::optional<std::string> optionalString(const rapidjson::Value& params,
                                                     const char* name);

    static std::optional<double> optionalNumber(const rapidjson::Value& params,
                                                const char* name);
};
}
