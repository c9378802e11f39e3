#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "hb/Config.hpp"

namespace hb {

/// Fixed-capacity FIFO of diagnostic lines; the oldest line is evicted first.
class OutputBuffer {
public:
  struct Tail {
    std::vector<std::string> lines; // oldest first
    std::size_t total = 0;          // lines currently retained
  };

  explicit OutputBuffer(std::size_t capacity = Config::OutputHistoryMax);

  void push(std::string line);

  /// Last min(n, size()) lines in insertion order, plus the retained count.
  Tail tail(std::size_t n) const;

  std::size_t size() const;
  std::size_t capacity() const noexcept { return capacity_; }
  void clear();

private:
  mutable std::mutex      mx_;
  std::deque<std::string> lines_;
  std::size_t             capacity_;
};

} // namespace hb
