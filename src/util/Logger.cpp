#include "hb/util/Logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hb::util {

const char* levelName(LogLevel l) {
  switch (l) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "trace") return LogLevel::Trace;
  if (x == "debug") return LogLevel::Debug;
  if (x == "info")  return LogLevel::Info;
  if (x == "warn" || x == "warning") return LogLevel::Warn;
  if (x == "error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() = default;

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = nullptr;
}

void Logger::setLevel(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mx_);
  lvl_ = lvl;
}

void Logger::setFormatJson(bool json) {
  std::lock_guard<std::mutex> lk(mx_);
  json_ = json;
}

void Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = path.empty() ? stdout : static_cast<void*>(std::fopen(path.c_str(), "a"));
  if (!file_) file_ = stdout;
}

void Logger::setSink(Sink sink) {
  std::lock_guard<std::mutex> lk(mx_);
  sink_ = std::move(sink);
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mx_);
  return lvl_;
}

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, format(lvl, msg, fields));
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static void appendEscaped(std::ostringstream& oss, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
        } else {
          oss << c;
        }
    }
  }
}

std::string Logger::format(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) const {
  bool json;
  {
    std::lock_guard<std::mutex> lk(mx_);
    json = json_;
  }

  std::ostringstream oss;
  if (json) {
    oss << "{\"ts\":\"" << nowIso() << "\",\"lvl\":\"" << levelName(lvl) << "\",\"msg\":\"";
    appendEscaped(oss, msg);
    oss << "\"";
    for (auto& kv : fields) {
      oss << ",\"";
      appendEscaped(oss, kv.k);
      oss << "\":\"";
      appendEscaped(oss, kv.v);
      oss << "\"";
    }
    oss << "}";
  } else {
    oss << "[" << nowIso() << "] " << std::left << std::setw(5) << levelName(lvl) << " " << msg;
    for (auto& kv : fields) oss << " " << kv.k << "=" << kv.v;
  }
  return oss.str();
}

void Logger::writeLine(LogLevel lvl, const std::string& line) {
  std::lock_guard<std::mutex> lk(mx_);
  if (sink_) {
    sink_(lvl, line);
    return;
  }
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);
  std::fwrite(line.data(), 1, line.size(), f);
  std::fputc('\n', f);
  std::fflush(f);
}

} // namespace hb::util
