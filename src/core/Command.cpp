#include "hb/Command.hpp"

#include "hb/Config.hpp"
#include "hb/Errors.hpp"
#include "hb/JsonValidator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace hb {

namespace {

using Parser = Command (*)(const rapidjson::Value& params);

struct Entry {
  const char* name;
  Parser      parse;
};

Command parseStatus(const rapidjson::Value&) { return cmd::Status{}; }

Command parseEval(const rapidjson::Value& p) {
  return cmd::Eval{JsonValidator::requireString(p, "code", "code parameter required")};
}

Command parseWebview(const rapidjson::Value& p) {
  cmd::Webview w;
  auto name = JsonValidator::optionalString(p, "viewName");
  if (name && !name->empty()) w.viewName = std::move(name);
  w.title = JsonValidator::optionalString(p, "title");
  w.customPath = JsonValidator::optionalString(p, "customPath");
  return w;
}

Command parseRegisterConfig(const rapidjson::Value& p) {
  const std::string message = "name and filePath required";
  cmd::RegisterConfig c;
  c.name = JsonValidator::requireString(p, "name", message);
  c.filePath = JsonValidator::requireString(p, "filePath", message);
  return c;
}

Command parseUnregisterConfig(const rapidjson::Value& p) {
  return cmd::UnregisterConfig{JsonValidator::requireString(p, "name", "name required")};
}

Command parseListConfigs(const rapidjson::Value&) { return cmd::ListConfigs{}; }

Command parseSubscribe(const rapidjson::Value& p) {
  return cmd::Subscribe{JsonValidator::requireString(p, "url", "url parameter required")};
}

Command parseUnsubscribe(const rapidjson::Value& p) {
  return cmd::Unsubscribe{JsonValidator::requireString(p, "url", "url parameter required")};
}

Command parseListSubscribers(const rapidjson::Value&) { return cmd::ListSubscribers{}; }

Command parseGetOutput(const rapidjson::Value& p) {
  std::size_t lines = Config::DefaultOutputLines;
  if (auto n = JsonValidator::optionalNumber(p, "lines")) {
    // Zero, negative and NaN fall back to the default.
    if (std::isfinite(*n) && *n >= 1.0) {
      lines = static_cast<std::size_t>(std::min(std::floor(*n), 1e9));
    }
  }
  return cmd::GetOutput{lines};
}

Command parseRestartExtension(const rapidjson::Value&) { return cmd::RestartExtension{}; }

const std::vector<Entry>& table() {
  static const std::vector<Entry> t = {
    {"status",           &parseStatus},
    {"eval",             &parseEval},
    {"webview",          &parseWebview},
    {"registerConfig",   &parseRegisterConfig},
    {"unregisterConfig", &parseUnregisterConfig},
    {"listConfigs",      &parseListConfigs},
    {"subscribe",        &parseSubscribe},
    {"unsubscribe",      &parseUnsubscribe},
    {"listSubscribers",  &parseListSubscribers},
    {"getOutput",        &parseGetOutput},
    {"restartExtension", &parseRestartExtension},
  };
  return t;
}

struct NameOf {
  const char* operator()(const cmd::Status&) const           { return "status"; }
  const char* operator()(const cmd::Eval&) const             { return "eval"; }
  const char* operator()(const cmd::Webview&) const          { return "webview"; }
  const char* operator()(const cmd::RegisterConfig&) const   { return "registerConfig"; }
  const char* operator()(const cmd::UnregisterConfig&) const { return "unregisterConfig"; }
  const char* operator()(const cmd::ListConfigs&) const      { return "listConfigs"; }
  const char* operator()(const cmd::Subscribe&) const        { return "subscribe"; }
  const char* operator()(const cmd::Unsubscribe&) const      { return "unsubscribe"; }
  const char* operator()(const cmd::ListSubscribers&) const  { return "listSubscribers"; }
  const char* operator()(const cmd::GetOutput&) const        { return "getOutput"; }
  const char* operator()(const cmd::RestartExtension&) const { return "restartExtension"; }
};

std::string trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

} // namespace

const std::vector<std::string>& methodNames() {
  static const std::vector<std::string> names = []{
    std::vector<std::string> v;
    for (const auto& e : table()) v.emplace_back(e.name);
    return v;
  }();
  return names;
}

const char* methodName(const Command& command) {
  return std::visit(NameOf{}, command);
}

Command parseCommand(const std::string& method, const rapidjson::Value& params) {
  for (const auto& e : table()) {
    if (method == e.name) return e.parse(params);
  }
  throw UnknownMethodError(method, methodNames());
}

EvalSource prepareEvalSource(const std::string& code) {
  static const std::regex explicitReturn(R"(\breturn\b)");

  EvalSource src;
  src.body = trim(code);
  const bool hasReturn = std::regex_search(src.body, explicitReturn);
  const bool singleExpression = src.body.find('\n') == std::string::npos &&
                                src.body.find(';') == std::string::npos;
  if (!hasReturn && singleExpression) {
    src.body = "return (" + src.body + ")";
    src.wrapped = true;
  }
  return src;
}

} // namespace hb
