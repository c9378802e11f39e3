// File: src/main.cpp
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "hb/Broadcaster.hpp"
#include "hb/Errors.hpp"
#include "hb/Json.hpp"
#include "hb/host/ConfigRegistry.hpp"
#include "hb/host/ScriptHost.hpp"
#include "hb/server/BridgeServer.hpp"

#include "hb/util/Config.hpp"
#include "hb/util/Logger.hpp"
#include "hb/util/Metrics.hpp"
#include "hb/runtime/ShutdownCoordinator.hpp"

static hb::runtime::ShutdownCoordinator gShutdown;

// ---------------------------
// Helpers
// ---------------------------
static void configureLogger(const hb::util::Config& cfg) {
  auto& log = hb::util::logger();
  log.setLevel(hb::util::parseLevel(cfg.logLevel));
  log.setFormatJson(cfg.logFormat == "json");
  if (!cfg.logFile.empty()) log.setFile(cfg.logFile);
}

static hb::EvalContext makeDefaultContext(hb::server::ServerHandle& server) {
  hb::EvalContext ctx;
  ctx.log   = [&server](const std::string& m) { server.output().appendLine("[config] " + m); };
  ctx.warn  = [&server](const std::string& m) { server.output().appendLine("[config:warn] " + m); };
  ctx.error = [&server](const std::string& m) { server.output().appendLine("[config:error] " + m); };
  ctx.broadcast = [&server](const hb::BroadcastEvent& ev) { server.broadcast(ev); };
  ctx.status = [&server] {
    rapidjson::Document none(rapidjson::kObjectType);
    hb::Response r = server.dispatch("status", none);
    if (!r.ok()) throw hb::ExecutionError(r.error());
    return hb::json::copy(r.result());
  };
  return ctx;
}

// ---------------------------
// main
//   argv[1] = port (optional, overrides the file)
//   argv[2] = configFilePath (optional)
// ---------------------------
int main(int argc, char* argv[]) {
  using namespace hb::util;

  // 1) Config
  Config cfg;
  if (argc > 2) {
    if (!cfg.loadFromFile(argv[2])) {
      std::cerr << "[config] warning: failed to load file: " << argv[2] << "\n";
    }
  }
  if (argc > 1) {
    if (!cfg.apply("port", argv[1])) {
      std::cerr << "Invalid port '" << argv[1] << "', using " << cfg.port << "\n";
    }
  }

  // 2) Logger + metrics
  configureLogger(cfg);
  logger().log(LogLevel::Info, "boot", {{"port", std::to_string(cfg.port)},
                                        {"workspace", cfg.workspaceRoot}});
  if (cfg.metricsIntervalSeconds > 0) {
    MetricRegistry::instance().startReporter(cfg.metricsIntervalSeconds);
  }

  // 3) Host collaborators
  std::unique_ptr<hb::host::ScriptHost> host;
  try {
    host = std::make_unique<hb::host::ScriptHost>(cfg.workspaceRoot);
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "host.start_failed", {{"error", ex.what()}});
    return EXIT_FAILURE;
  }

  hb::host::ConfigRegistry registry(
    cfg.registryPath(),
    [&host](const std::string&, const std::string& filePath) { host->runFile(filePath); });

  hb::Collaborators collaborators;
  collaborators.host = host.get();
  collaborators.config = &registry;
  // No webview renderer in the daemon: `webview` reports "not initialized".

  // 4) Server
  boost::asio::io_context ioc;
  std::unique_ptr<hb::server::ServerHandle> server;
  try {
    server = std::make_unique<hb::server::ServerHandle>(
      ioc, hb::server::ServerOptions::fromConfig(cfg), collaborators);
  } catch (const hb::BindError& ex) {
    logger().log(LogLevel::Error, "bind_failed", {{"port", std::to_string(ex.port())}, {"error", ex.what()}});
    if (ex.addressInUse()) {
      std::cerr << "✖ Port " << ex.port() << " already in use\n"
                << "  Free it with: " << ex.hint() << "\n";
    } else {
      std::cerr << "✖ " << ex.what() << "\n";
    }
    return EXIT_FAILURE;
  }

  // 5) Host-side glue: config scripts log and broadcast through the server,
  //    terminal changes are pushed to subscribers, restart reloads configs.
  host->setDefaultContext(makeDefaultContext(*server));
  host->setTerminalListener([&server](const std::string& change, const hb::TerminalInfo& t) {
    rapidjson::Document data(rapidjson::kObjectType);
    auto& a = data.GetAllocator();
    data.AddMember("change", hb::json::string(change, a), a);
    data.AddMember("name", hb::json::string(t.name, a), a);
    if (t.processId) data.AddMember("processId", *t.processId, a);
    else data.AddMember("processId", rapidjson::Value(), a);
    data.AddMember("isActive", t.isActive, a);
    server->broadcast(hb::BroadcastEvent("terminal-changed", std::move(data)));
  });
  host->setRestartHook([&registry, &server] {
    const auto n = registry.loadAll();
    server->output().appendLine("✓ Host restarted, " + std::to_string(n) + " config(s) reloaded");
  });

  const auto loaded = registry.loadAll();
  logger().log(LogLevel::Info, "configs.loaded", {{"count", std::to_string(loaded)}});

  // 6) Shutdown sequencing
  gShutdown.registerStep("server-stop",   10, [&server]{ server->stop(); });
  gShutdown.registerStep("pool-drain",    40, [&server]{ server->drain(); });
  gShutdown.registerStep("metrics-stop",  50, []{ MetricRegistry::instance().stopReporter(); });
  gShutdown.registerStep("asio-stop",     60, [&ioc]{ ioc.stop(); });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal", {{"signal", std::to_string(sig)}});
    gShutdown.stop();
  });

  // 7) Run
  try {
    ioc.run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, std::string("io_context exception: ") + ex.what(), {});
  }

  // Ensure shutdown steps run even on natural exit
  gShutdown.stop();
  server.reset();

  logger().log(LogLevel::Info, "stopped", {});
  return EXIT_SUCCESS;
}
