#pragma once

#include <cstddef>
#include <string>

#include "hb/Config.hpp"

namespace hb {
namespace util {

class Config {
public:
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns false only if the file cannot be opened.
  bool loadFromFile(const std::string& path);

  // Apply a single key; returns false for unknown keys or unparsable values.
  bool apply(const std::string& key, const std::string& value);

  // --- listener ---
  std::string    bindAddress     = "127.0.0.1";
  unsigned short port            = hb::Config::DefaultPort;
  std::size_t    maxRequestBytes = hb::Config::MaxRequestBytes;

  // --- dispatch ---
  std::size_t hostWorkers = hb::Config::HostWorkers;

  // --- broadcast ---
  unsigned webhookTimeoutMs = 5000;

  // --- logging ---
  std::string logLevel  = "info";
  std::string logFormat = "plain"; // plain | json
  std::string logFile;             // empty -> stdout

  // --- host ---
  std::string workspaceRoot;
  std::string configRegistryFile; // empty -> <workspaceRoot>/.hostbridge-configs.json

  unsigned metricsIntervalSeconds = 0; // 0 disables the reporter

  std::string registryPath() const;

  static std::string trim(const std::string& s);

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
};

} // namespace util
} // namespace hb
