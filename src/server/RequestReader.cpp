#include "hb/server/RequestReader.hpp"

#include <rapidjson/error/en.h>

namespace hb {
namespace server {

RequestReader::RequestReader(std::size_t maxBytes)
  : maxBytes_(maxBytes)
{}

RequestReader::State RequestReader::feed(const char* data, std::size_t n) {
  if (state_ != State::Incomplete) return state_;

  buf_.append(data, n);
  if (buf_.size() > maxBytes_) {
    error_ = "request exceeds " + std::to_string(maxBytes_) + " bytes";
    state_ = State::TooLarge;
    return state_;
  }
  return tryParse();
}

RequestReader::State RequestReader::finish() {
  if (state_ != State::Incomplete) return state_;

  if (empty()) {
    error_ = "empty request";
  } else if (error_.empty()) {
    error_ = "incomplete JSON request";
  }
  state_ = State::Malformed;
  return state_;
}

RequestReader::State RequestReader::tryParse() {
  if (empty()) return state_;

  doc_.SetNull();
  doc_.GetAllocator().Clear();
  doc_.Parse<rapidjson::kParseStopWhenDoneFlag>(buf_.data(), buf_.size());
  if (!doc_.HasParseError()) {
    error_.clear();
    state_ = State::Complete;
    return state_;
  }

  const auto code = doc_.GetParseError();
  const std::size_t offset = doc_.GetErrorOffset();
  error_ = std::string("Invalid JSON: ") + rapidjson::GetParseError_En(code) +
           " (offset " + std::to_string(offset) + ")";

  // Running out of input is not an error yet.
  if (code == rapidjson::kParseErrorDocumentEmpty || offset >= buf_.size()) {
    return state_;
  }
  state_ = State::Malformed;
  return state_;
}

} // namespace server
} // namespace hb
