#include "hb/CommandDispatcher.hpp"

#include "hb/Broadcaster.hpp"
#include "hb/Errors.hpp"
#include "hb/Json.hpp"
#include "hb/OutputChannel.hpp"
#include "hb/SubscriberRegistry.hpp"
#include "hb/util/Logger.hpp"
#include "hb/util/Metrics.hpp"

#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

namespace hb {

using rapidjson::Document;
using rapidjson::Value;

namespace {

std::int64_t epochMs(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

std::string isoUtc(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

Value terminalJson(const TerminalInfo& t, std::int64_t nowMs, json::Allocator& a) {
  Value v(rapidjson::kObjectType);
  v.AddMember("name", json::string(t.name, a), a);
  if (t.processId) v.AddMember("processId", *t.processId, a);
  else v.AddMember("processId", Value(), a);
  v.AddMember("state", json::string(t.state, a), a);
  v.AddMember("isActive", t.isActive, a);
  if (t.startTime) {
    v.AddMember("startTime", *t.startTime, a);
    v.AddMember("uptime", static_cast<std::int64_t>((nowMs - *t.startTime) / 1000), a);
  } else {
    v.AddMember("startTime", Value(), a);
    v.AddMember("uptime", Value(), a);
  }
  return v;
}

} // namespace

CommandDispatcher::CommandDispatcher(Collaborators collaborators,
                                     std::shared_ptr<SubscriberRegistry> subscribers,
                                     std::shared_ptr<OutputChannel> output,
                                     std::shared_ptr<Broadcaster> broadcaster,
                                     ServerInfo info,
                                     ProgressFn onProgress)
  : _collaborators(collaborators),
    _subscribers(std::move(subscribers)),
    _output(std::move(output)),
    _broadcaster(std::move(broadcaster)),
    _info(std::move(info)),
    _onProgress(std::move(onProgress))
{}

Response CommandDispatcher::dispatch(const Request& request) noexcept {
  return dispatch(request.method, request.params);
}

Response CommandDispatcher::dispatch(const std::string& method, const Value& params) noexcept {
  const auto started = std::chrono::steady_clock::now();
  HB_METRIC_HIT("dispatch.requests");

  try {
    if (_onProgress) _onProgress(ExecutingEvent{method});

    Command command = parseCommand(method, params);
    Response response = execute(command);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    util::logger().log(util::LogLevel::Debug, "dispatch.done",
                       {{"method", method}, {"ok", response.ok() ? "true" : "false"},
                        {"ms", std::to_string(elapsed)}});
    if (!response.ok()) HB_METRIC_HIT("dispatch.failed");
    return response;
  } catch (const UnknownMethodError& ex) {
    HB_METRIC_HIT("dispatch.unknown_method");
    return Response::failure(ex.what());
  } catch (const BridgeError& ex) {
    HB_METRIC_HIT("dispatch.failed");
    util::logger().log(util::LogLevel::Debug, "dispatch.error", {{"method", method}, {"error", ex.what()}});
    return Response::failure(ex.what());
  } catch (const std::exception& ex) {
    HB_METRIC_HIT("dispatch.failed");
    util::logger().log(util::LogLevel::Warn, "dispatch.exception", {{"method", method}, {"error", ex.what()}});
    return Response::failure(ex.what());
  } catch (...) {
    HB_METRIC_HIT("dispatch.failed");
    util::logger().log(util::LogLevel::Error, "dispatch.exception", {{"method", method}, {"error", "unknown"}});
    return Response::failure("Unknown error while executing " + method);
  }
}

Response CommandDispatcher::execute(const Command& command) {
  return std::visit([this](const auto& c) { return run(c); }, command);
}

IHost& CommandDispatcher::host() const {
  if (!_collaborators.host) throw ExecutionError("host not initialized");
  return *_collaborators.host;
}

IConfigHost& CommandDispatcher::config() const {
  if (!_collaborators.config) throw ExecutionError("config registry not initialized");
  return *_collaborators.config;
}

Document CommandDispatcher::statusDocument() {
  const StatusSnapshot snap = host().queryStatus();
  const auto now = std::chrono::system_clock::now();
  const std::int64_t nowMs = epochMs(now);

  Document d(rapidjson::kObjectType);
  auto& a = d.GetAllocator();

  d.AddMember("timestamp", nowMs, a);
  d.AddMember("datetime", json::string(isoUtc(now), a), a);

  Value terminals(rapidjson::kObjectType);
  terminals.AddMember("count", static_cast<std::uint64_t>(snap.terminals.size()), a);
  if (snap.activeTerminal) terminals.AddMember("active", json::string(*snap.activeTerminal, a), a);
  else terminals.AddMember("active", Value(), a);
  Value list(rapidjson::kArrayType);
  for (const auto& t : snap.terminals) {
    list.PushBack(terminalJson(t, nowMs, a), a);
  }
  terminals.AddMember("list", list, a);
  d.AddMember("terminals", terminals, a);

  if (snap.editor) {
    const auto& e = *snap.editor;
    Value editor(rapidjson::kObjectType);
    editor.AddMember("file", json::string(e.file, a), a);
    editor.AddMember("language", json::string(e.language, a), a);
    editor.AddMember("lines", e.lines, a);
    editor.AddMember("isDirty", e.isDirty, a);
    Value cursor(rapidjson::kObjectType);
    cursor.AddMember("line", e.cursorLine, a);
    cursor.AddMember("column", e.cursorColumn, a);
    editor.AddMember("cursor", cursor, a);
    d.AddMember("editor", editor, a);
  } else {
    d.AddMember("editor", Value(), a);
  }

  Value workspace(rapidjson::kObjectType);
  Value folders(rapidjson::kArrayType);
  for (const auto& f : snap.folders) {
    Value fv(rapidjson::kObjectType);
    fv.AddMember("name", json::string(f.name, a), a);
    fv.AddMember("path", json::string(f.path, a), a);
    folders.PushBack(fv, a);
  }
  workspace.AddMember("folders", folders, a);
  workspace.AddMember("openFiles", snap.openFiles, a);
  d.AddMember("workspace", workspace, a);

  Value server(rapidjson::kObjectType);
  server.AddMember("name", json::string(_info.name, a), a);
  server.AddMember("version", json::string(_info.version, a), a);
  server.AddMember("port", static_cast<unsigned>(_info.port), a);
  server.AddMember("uptime", static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now - _info.startTime).count()), a);
  server.AddMember("features", json::stringArray(_info.features, a), a);
  server.AddMember("subscribers", static_cast<std::uint64_t>(_subscribers->size()), a);
  server.AddMember("outputLines", static_cast<std::uint64_t>(_output->buffer().size()), a);
  d.AddMember("server", server, a);

  Value metrics(rapidjson::kObjectType);
  for (const auto& kv : util::MetricRegistry::instance().snapshotCounters()) {
    Value key = json::string(kv.first, a);
    metrics.AddMember(key, kv.second, a);
  }
  d.AddMember("metrics", metrics, a);

  return d;
}

Response CommandDispatcher::run(const cmd::Status&) {
  return Response::success(statusDocument());
}

Response CommandDispatcher::run(const cmd::Eval& c) {
  IHost& h = host();
  const EvalSource src = prepareEvalSource(c.code);

  EvalContext ctx;
  auto out = _output;
  ctx.log   = [out](const std::string& m) { out->appendLine("[eval] " + m); };
  ctx.warn  = [out](const std::string& m) { out->appendLine("[eval:warn] " + m); };
  ctx.error = [out](const std::string& m) { out->appendLine("[eval:error] " + m); };
  ctx.broadcast = [b = _broadcaster](const BroadcastEvent& e) {
    if (b) b->broadcast(e);
  };
  ctx.status = [this] { return statusDocument(); };

  try {
    return Response::success(h.evalContext(src.body, ctx));
  } catch (const BridgeError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ExecutionError(ex.what());
  }
}

Response CommandDispatcher::run(const cmd::Webview& c) {
  if (!_collaborators.webview) {
    throw ExecutionError("webview host not initialized");
  }
  if (!c.viewName) {
    throw ValidationError("viewName parameter required");
  }

  ViewRequest view;
  view.viewName = *c.viewName;
  view.title = c.title.value_or(*c.viewName);
  view.customPath = c.customPath;

  try {
    _collaborators.webview->openView(view);
  } catch (const BridgeError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ExecutionError(ex.what());
  }

  Document d(rapidjson::kObjectType);
  auto& a = d.GetAllocator();
  d.AddMember("success", true, a);
  d.AddMember("webview", json::string(view.viewName, a), a);
  return Response::success(std::move(d));
}

static Response fromResult(Result<Document> r) {
  if (!r) return Response::failure(r.error().describe());
  return Response::success(std::move(r.value()));
}

Response CommandDispatcher::run(const cmd::RegisterConfig& c) {
  return fromResult(config().registerConfig(c.name, c.filePath));
}

Response CommandDispatcher::run(const cmd::UnregisterConfig& c) {
  return fromResult(config().unregisterConfig(c.name));
}

Response CommandDispatcher::run(const cmd::ListConfigs&) {
  return fromResult(config().listConfigs());
}

Document CommandDispatcher::subscriberResult(const std::string& message) const {
  Document d = json::successMessage(message);
  auto& a = d.GetAllocator();
  d.AddMember("subscribers", json::stringArray(_subscribers->list(), a), a);
  return d;
}

Response CommandDispatcher::run(const cmd::Subscribe& c) {
  _subscribers->add(c.url);
  _output->appendLine("✓ Subscribed: " + c.url);
  return Response::success(subscriberResult("Subscribed to " + c.url));
}

Response CommandDispatcher::run(const cmd::Unsubscribe& c) {
  _subscribers->remove(c.url);
  _output->appendLine("✓ Unsubscribed: " + c.url);
  return Response::success(subscriberResult("Unsubscribed from " + c.url));
}

Response CommandDispatcher::run(const cmd::ListSubscribers&) {
  return Response::success(subscriberResult(std::to_string(_subscribers->size()) + " subscriber(s)"));
}

Response CommandDispatcher::run(const cmd::GetOutput& c) {
  const auto tail = _output->buffer().tail(c.lines);

  Document d(rapidjson::kObjectType);
  auto& a = d.GetAllocator();
  d.AddMember("output", json::stringArray(tail.lines, a), a);
  d.AddMember("total", static_cast<std::uint64_t>(tail.total), a);
  return Response::success(std::move(d));
}

Response CommandDispatcher::run(const cmd::RestartExtension&) {
  IHost* h = &host();
  Response r = Response::success(json::successMessage("Host will restart"));
  r.setAfterSend([h] { h->restart(); });
  return r;
}

} // namespace hb
