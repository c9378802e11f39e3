#pragma once

#include <rapidjson/document.h>

#include <cstddef>
#include <string>

namespace hb {
namespace server {

// Accumulates the bytes of one connection until they hold a complete JSON
// value. The first complete value is the request; anything after it is
// ignored. A parse failure at the very end of the buffer only means "more
// bytes needed", any earlier failure means the input is malformed.
class RequestReader {
public:
  enum class State {
    Incomplete, // keep reading
    Complete,   // document() holds the request
    Malformed,  // error() describes the parse failure
    TooLarge    // the request exceeded the byte limit
  };

  explicit RequestReader(std::size_t maxBytes);

  State feed(const char* data, std::size_t n);

  // Peer finished writing. Incomplete input becomes Malformed.
  State finish();

  State state() const noexcept { return state_; }
  rapidjson::Document& document() noexcept { return doc_; }
  const std::string& error() const noexcept { return error_; }
  std::size_t buffered() const noexcept { return buf_.size(); }
  bool empty() const noexcept { return buf_.find_first_not_of(" \t\r\n") == std::string::npos; }

private:
  State tryParse();

private:
  std::size_t         maxBytes_;
  std::string         buf_;
  rapidjson::Document doc_;
  std::string         error_;
  State               state_{State::Incomplete};
};

} // namespace server
} // namespace hb
