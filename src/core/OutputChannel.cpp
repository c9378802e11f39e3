#include "hb/OutputChannel.hpp"
#include "hb/util/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hb {

OutputChannel::OutputChannel(std::shared_ptr<OutputBuffer> buffer)
  : buffer_(std::move(buffer))
{
  if (!buffer_) buffer_ = std::make_shared<OutputBuffer>();
}

std::string OutputChannel::timestampPrefix() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << '[' << std::put_time(&tm, "%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << "] ";
  return oss.str();
}

void OutputChannel::appendLine(const std::string& text) {
  buffer_->push(timestampPrefix() + text);
  util::logger().log(util::LogLevel::Info, text, {{"channel", "output"}});
}

} // namespace hb
