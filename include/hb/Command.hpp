#pragma once

#include <rapidjson/document.h>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hb {

/// One strongly-typed parameter shape per method in the command table.
namespace cmd {

struct Status {};

struct Eval {
  std::string code; // as received; see prepareEvalSource()
};

struct Webview {
  // Optional here so "host not initialized" is reported before a missing name.
  std::optional<std::string> viewName;
  std::optional<std::string> title;
  std::optional<std::string> customPath;
};

struct RegisterConfig {
  std::string name;
  std::string filePath;
};

struct UnregisterConfig {
  std::string name;
};

struct ListConfigs {};

struct Subscribe {
  std::string url;
};

struct Unsubscribe {
  std::string url;
};

struct ListSubscribers {};

struct GetOutput {
  std::size_t lines;
};

struct RestartExtension {};

} // namespace cmd

using Command = std::variant<
  cmd::Status,
  cmd::Eval,
  cmd::Webview,
  cmd::RegisterConfig,
  cmd::UnregisterConfig,
  cmd::ListConfigs,
  cmd::Subscribe,
  cmd::Unsubscribe,
  cmd::ListSubscribers,
  cmd::GetOutput,
  cmd::RestartExtension>;

/// Every method name the dispatcher accepts, in table order.
const std::vector<std::string>& methodNames();

const char* methodName(const Command& command);

/// Throws UnknownMethodError or ValidationError.
Command parseCommand(const std::string& method, const rapidjson::Value& params);

struct EvalSource {
  std::string body;
  bool        wrapped = false;
};

// Implicit-return rule: trimmed input with no newline, no ';' and no
// `return` keyword becomes "return (<code>)"; anything else runs verbatim.
// Purely syntactic, so e.g. a ';' inside a string literal disables wrapping.
EvalSource prepareEvalSource(const std::string& code);

} // namespace hb
