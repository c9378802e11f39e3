#include "hb/host/ConfigRegistry.hpp"

#include "hb/Json.hpp"
#include "hb/util/Logger.hpp"
#include "hb/util/Metrics.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace hb {
namespace host {

namespace fs = std::filesystem;
using rapidjson::Document;
using rapidjson::Value;

ConfigRegistry::ConfigRegistry(std::string registryFile, Loader loader)
  : _file(std::move(registryFile)),
    _loader(std::move(loader))
{}

ConfigRegistry::Entries ConfigRegistry::read() const {
  Entries out;
  std::ifstream in(_file);
  if (!in) return out;

  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();

  Document d;
  d.Parse(text.c_str(), text.size());
  if (d.HasParseError() || !d.IsObject()) {
    util::logger().log(util::LogLevel::Warn, "config_registry.unreadable", {{"file", _file}});
    return out;
  }
  for (auto it = d.MemberBegin(); it != d.MemberEnd(); ++it) {
    if (!it->value.IsString()) continue;
    out.emplace_back(std::string(it->name.GetString(), it->name.GetStringLength()),
                     std::string(it->value.GetString(), it->value.GetStringLength()));
  }
  return out;
}

Result<bool> ConfigRegistry::write(const Entries& entries) const {
  std::error_code ec;
  const fs::path parent = fs::path(_file).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) return Result<bool>::failure(ec.message(), _file);
  }

  rapidjson::StringBuffer sb;
  rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
  w.SetIndent(' ', 2);
  w.StartObject();
  for (const auto& e : entries) {
    w.Key(e.first.c_str(), static_cast<rapidjson::SizeType>(e.first.size()));
    w.String(e.second.c_str(), static_cast<rapidjson::SizeType>(e.second.size()));
  }
  w.EndObject();

  std::ofstream out(_file, std::ios::trunc);
  if (!out) return Result<bool>::failure("cannot open registry file for writing", _file);
  out << sb.GetString();
  if (!out) return Result<bool>::failure("cannot write registry file", _file);
  return Result<bool>(true);
}

bool ConfigRegistry::load(const std::string& name, const std::string& filePath) {
  {
    std::lock_guard<std::mutex> lk(_mutex);
    _active.erase(name);
  }
  if (!_loader) return false;

  try {
    _loader(name, filePath);
  } catch (const std::exception& ex) {
    HB_METRIC_HIT("config.load_failed");
    util::logger().log(util::LogLevel::Error, "config.load_failed",
                       {{"name", name}, {"file", filePath}, {"error", ex.what()}});
    return false;
  }

  std::lock_guard<std::mutex> lk(_mutex);
  _active.insert(name);
  util::logger().log(util::LogLevel::Info, "config.loaded", {{"name", name}, {"file", filePath}});
  return true;
}

ConfigRegistry::Entries ConfigRegistry::snapshot() const {
  std::lock_guard<std::mutex> lk(_fileMutex);
  return read();
}

Result<Document> ConfigRegistry::registerConfig(const std::string& name, const std::string& filePath) {
  {
    std::lock_guard<std::mutex> lk(_fileMutex);
    Entries entries = read();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const auto& e) { return e.first == name; });
    if (it != entries.end()) it->second = filePath;
    else entries.emplace_back(name, filePath);

    auto saved = write(entries);
    if (!saved) return saved.error();
  }

  // A failed load still leaves the config registered, just inactive.
  load(name, filePath);
  return json::successMessage("Config '" + name + "' registered");
}

Result<Document> ConfigRegistry::unregisterConfig(const std::string& name) {
  {
    std::lock_guard<std::mutex> lk(_fileMutex);
    Entries entries = read();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const auto& e) { return e.first == name; });
    if (it == entries.end()) {
      return Result<Document>::failure("Config '" + name + "' not found");
    }
    entries.erase(it);

    auto saved = write(entries);
    if (!saved) return saved.error();
  }
  {
    std::lock_guard<std::mutex> lk(_mutex);
    _active.erase(name);
  }
  return json::successMessage("Config '" + name + "' unregistered");
}

Result<Document> ConfigRegistry::listConfigs() {
  const Entries entries = snapshot();

  Document d(rapidjson::kObjectType);
  auto& a = d.GetAllocator();
  Value configs(rapidjson::kArrayType);
  for (const auto& e : entries) {
    Value c(rapidjson::kObjectType);
    c.AddMember("name", json::string(e.first, a), a);
    c.AddMember("filePath", json::string(e.second, a), a);
    c.AddMember("active", isActive(e.first), a);
    configs.PushBack(c, a);
  }
  d.AddMember("configs", configs, a);
  return Result<Document>(std::move(d));
}

std::size_t ConfigRegistry::loadAll() {
  std::size_t loaded = 0;
  for (const auto& e : snapshot()) {
    std::error_code ec;
    if (!fs::exists(e.second, ec)) {
      util::logger().log(util::LogLevel::Warn, "config.missing_file", {{"name", e.first}, {"file", e.second}});
      continue;
    }
    if (load(e.first, e.second)) ++loaded;
  }
  return loaded;
}

bool ConfigRegistry::isActive(const std::string& name) const {
  std::lock_guard<std::mutex> lk(_mutex);
  return _active.count(name) != 0;
}

ConfigRegistry::Entries ConfigRegistry::entries() const {
  return snapshot();
}

} // namespace host
} // namespace hb
