#include "hb/OutputBuffer.hpp"

#include <algorithm>

namespace hb {

OutputBuffer::OutputBuffer(std::size_t capacity)
  : capacity_(std::max<std::size_t>(1, capacity))
{}

void OutputBuffer::push(std::string line) {
  std::lock_guard<std::mutex> lk(mx_);
  lines_.push_back(std::move(line));
  while (lines_.size() > capacity_) {
    lines_.pop_front();
  }
}

OutputBuffer::Tail OutputBuffer::tail(std::size_t n) const {
  std::lock_guard<std::mutex> lk(mx_);
  Tail t;
  t.total = lines_.size();
  const std::size_t take = std::min(n, lines_.size());
  t.lines.assign(lines_.end() - static_cast<std::ptrdiff_t>(take), lines_.end());
  return t;
}

std::size_t OutputBuffer::size() const {
  std::lock_guard<std::mutex> lk(mx_);
  return lines_.size();
}

void OutputBuffer::clear() {
  std::lock_guard<std::mutex> lk(mx_);
  lines_.clear();
}

} // namespace hb
