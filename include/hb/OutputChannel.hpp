#pragma once

#include <memory>
#include <string>

#include "hb/OutputBuffer.hpp"

namespace hb {

// Timestamps each line, stores it in the output history and mirrors it to
// the process logger. Everything the server wants remotely visible through
// getOutput goes through here.
class OutputChannel {
public:
  explicit OutputChannel(std::shared_ptr<OutputBuffer> buffer);

  void appendLine(const std::string& text);

  OutputBuffer& buffer() noexcept { return *buffer_; }
  const OutputBuffer& buffer() const noexcept { return *buffer_; }

  // "[HH:MM:SS.mmm] "
  static std::string timestampPrefix();

private:
  std::shared_ptr<OutputBuffer> buffer_;
};

} // namespace hb
