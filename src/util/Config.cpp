#include "hb/util/Config.hpp"
#include "hb/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace hb {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  return !k.empty();
}

static bool parseUnsigned(const std::string& s, unsigned long& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  unsigned long v = std::strtoul(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0' || s[0] == '-') return false;
  out = v;
  return true;
}

bool Config::apply(const std::string& key, const std::string& val) {
  unsigned long n = 0;

  if (key == "port") {
    if (!parseUnsigned(val, n) || n > 65535) return false;
    port = static_cast<unsigned short>(n);
  } else if (key == "bindAddress") {
    if (val.empty()) return false;
    bindAddress = val;
  } else if (key == "maxRequestBytes") {
    if (!parseUnsigned(val, n) || n == 0) return false;
    maxRequestBytes = n;
  } else if (key == "hostWorkers") {
    if (!parseUnsigned(val, n)) return false;
    hostWorkers = std::max<unsigned long>(1, n);
  } else if (key == "webhookTimeoutMs") {
    if (!parseUnsigned(val, n) || n == 0) return false;
    webhookTimeoutMs = static_cast<unsigned>(n);
  } else if (key == "logLevel") {
    logLevel = val;
  } else if (key == "logFormat") {
    if (val != "plain" && val != "json") return false;
    logFormat = val;
  } else if (key == "logFile") {
    logFile = val;
  } else if (key == "workspaceRoot") {
    workspaceRoot = val;
  } else if (key == "configRegistryFile") {
    configRegistryFile = val;
  } else if (key == "metricsIntervalSeconds") {
    if (!parseUnsigned(val, n)) return false;
    metricsIntervalSeconds = static_cast<unsigned>(n);
  } else {
    return false;
  }
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  char tmp[1024];
  while (std::fgets(tmp, sizeof(tmp), f)) {
    line.assign(tmp);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty() || s[0] == '#' || s[0] == ';') continue;

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if (!apply(key, val)) {
      logger().log(LogLevel::Warn, "config.ignored", {{"key", key}, {"value", val}});
    }
  }

  std::fclose(f);
  return true;
}

std::string Config::registryPath() const {
  if (!configRegistryFile.empty()) return configRegistryFile;
  std::string root = workspaceRoot.empty() ? std::string(".") : workspaceRoot;
  if (root.back() != '/') root.push_back('/');
  return root + ".hostbridge-configs.json";
}

} // namespace util
} // namespace hb
