#pragma once

#include <rapidjson/document.h>

#include <string>
#include <vector>

namespace hb::json {

using Allocator = rapidjson::Document::AllocatorType;

// Compact serialization.
std::string toString(const rapidjson::Value& v);

// Copy-owning string value.
rapidjson::Value string(const std::string& s, Allocator& alloc);

rapidjson::Value stringArray(const std::vector<std::string>& items, Allocator& alloc);

// Deep copy into a fresh document.
rapidjson::Document copy(const rapidjson::Value& v);

// {"success":true,"message":<message>}
rapidjson::Document successMessage(const std::string& message);

} // namespace hb::json
