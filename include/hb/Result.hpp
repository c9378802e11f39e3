#pragma once

#include <string>
#include <utility>
#include <variant>

namespace hb {

struct Error {
  std::string message;
  std::string where;

  std::string describe() const {
    return where.empty() ? message : where + ": " + message;
  }
};

// Value-or-error for collaborators that report failure as data rather than
// by throwing. T may be move-only.
template <typename T>
class Result {
public:
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Error& error) : _value(error) {}
  Result(Error&& error) : _value(std::move(error)) {}

  static Result failure(std::string message, std::string where = {}) {
    return Result(Error{std::move(message), std::move(where)});
  }

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Error& error() const { return std::get<Error>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }

private:
  std::variant<T, Error> _value;
};

} // namespace hb
