#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hb {
namespace util {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4
};

struct Field {
  std::string k;
  std::string v;
};

LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel lvl);

class Logger {
public:
  // Receives fully formatted lines (no trailing newline). Replaces file output while set.
  using Sink = std::function<void(LogLevel, const std::string&)>;

  Logger();
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);
  void setFile(const std::string& path); // empty -> stdout
  void setSink(Sink sink);               // empty -> back to file/stdout

  LogLevel level() const;
  bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) >= static_cast<int>(level()); }

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  std::string format(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) const;

private:
  void writeLine(LogLevel lvl, const std::string& line);

private:
  mutable std::mutex mx_;
  void* file_ = nullptr; // FILE*, kept out of the header
  Sink sink_;
  LogLevel lvl_ = LogLevel::Info;
  bool json_ = false;
};

Logger& logger();

} // namespace util
} // namespace hb
