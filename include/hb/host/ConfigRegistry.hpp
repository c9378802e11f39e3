#pragma once

#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "hb/Collaborators.hpp"

namespace hb {
namespace host {

/// Named config scripts persisted as a JSON object {name: filePath} and
/// loaded through a caller-supplied loader (the script host in the daemon).
class ConfigRegistry : public IConfigHost {
public:
  // Throws on failure; the registry logs it and leaves the config inactive.
  using Loader = std::function<void(const std::string& name, const std::string& filePath)>;
  using Entries = std::vector<std::pair<std::string, std::string>>;

  ConfigRegistry(std::string registryFile, Loader loader);

  Result<rapidjson::Document> registerConfig(const std::string& name, const std::string& filePath) override;
  Result<rapidjson::Document> unregisterConfig(const std::string& name) override;
  Result<rapidjson::Document> listConfigs() override;

  // Loads every registered config whose file exists. Returns how many loaded.
  std::size_t loadAll();

  bool isActive(const std::string& name) const;
  Entries entries() const;
  const std::string& registryFile() const noexcept { return _file; }

private:
  // Unreadable or malformed files read as empty. Callers hold _fileMutex.
  Entries read() const;
  Result<bool> write(const Entries& entries) const;
  Entries snapshot() const;
  bool load(const std::string& name, const std::string& filePath);

private:
  std::string _file;
  Loader _loader;

  // Serializes every read-modify-write of the registry file. Never held
  // together with _mutex.
  mutable std::mutex _fileMutex;

  mutable std::mutex _mutex;
  std::set<std::string> _active;
};

} // namespace host
} // namespace hb
