#pragma once

#include <functional>
#include <string>
#include <variant>

namespace hb {

struct ExecutingEvent {
  std::string method;
};

struct ReadyEvent {
  unsigned short port = 0;
};

// Observability hook, emitted synchronously at the transition it names.
using ProgressEvent = std::variant<ExecutingEvent, ReadyEvent>;
using ProgressFn    = std::function<void(const ProgressEvent&)>;

} // namespace hb
