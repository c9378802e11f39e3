#include "hb/server/BridgeServer.hpp"
#include "hb/server/ClientSession.hpp"

#include "hb/Errors.hpp"
#include "hb/Json.hpp"
#include "hb/JsonValidator.hpp"
#include "hb/util/Config.hpp"
#include "hb/util/Logger.hpp"
#include "hb/util/Metrics.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <exception>

namespace hb {
namespace server {

using tcp = boost::asio::ip::tcp;

ServerOptions ServerOptions::fromConfig(const util::Config& cfg) {
  ServerOptions o;
  o.address = cfg.bindAddress;
  o.port = cfg.port;
  o.maxRequestBytes = cfg.maxRequestBytes;
  o.hostWorkers = cfg.hostWorkers;
  o.webhookTimeout = std::chrono::milliseconds(cfg.webhookTimeoutMs);
  return o;
}

ServerHandle::ServerHandle(boost::asio::io_context& ioc,
                           ServerOptions options,
                           Collaborators collaborators,
                           ProgressFn onProgress)
  : ioc_(ioc),
    acceptor_(ioc),
    options_(std::move(options)),
    subscribers_(std::make_shared<SubscriberRegistry>()),
    output_(std::make_shared<OutputChannel>(std::make_shared<OutputBuffer>(options_.outputCapacity))),
    pool_(static_cast<unsigned>(options_.hostWorkers == 0 ? 1 : options_.hostWorkers))
{
  boost::system::error_code ec;
  const auto address = boost::asio::ip::make_address(options_.address, ec);
  if (ec) throw BindError(options_.address, options_.port, false, ec.message());

  tcp::endpoint ep{address, options_.port};

  auto fail = [this](const boost::system::error_code& e) {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    HB_METRIC_HIT("server.bind_failed");
    throw BindError(options_.address, options_.port,
                    e == boost::asio::error::address_in_use, e.message());
  };

  acceptor_.open(ep.protocol(), ec);
  if (ec) fail(ec);

  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) fail(ec);

  acceptor_.bind(ep, ec);
  if (ec) fail(ec);

  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) fail(ec);

  port_ = acceptor_.local_endpoint(ec).port();
  if (ec) fail(ec);

  ServerInfo info;
  info.port = port_;
  info.startTime = std::chrono::system_clock::now();

  broadcaster_ = std::make_shared<Broadcaster>(ioc_, subscribers_, output_, options_.webhookTimeout);
  dispatcher_ = std::make_unique<CommandDispatcher>(collaborators, subscribers_, output_,
                                                    broadcaster_, std::move(info), onProgress);

  running_ = true;
  trace("=== Bridge Started ===");
  trace("Listening on port " + std::to_string(port_));
  util::logger().log(util::LogLevel::Info, "server.listening",
                     {{"address", options_.address}, {"port", std::to_string(port_)}});

  doAccept();

  trace("Server is ready");
  if (onProgress) onProgress(ReadyEvent{port_});
}

ServerHandle::~ServerHandle() {
  stop();
  pool_.shutdown();
}

Response ServerHandle::dispatch(const std::string& method, const rapidjson::Value& params) {
  return dispatcher_->dispatch(method, params);
}

std::size_t ServerHandle::broadcast(const BroadcastEvent& event) {
  return broadcaster_->broadcast(event);
}

void ServerHandle::stop() {
  if (!running_.exchange(false)) return;

  boost::system::error_code ec;
  acceptor_.cancel(ec);
  acceptor_.close(ec);
  if (ec) {
    util::logger().log(util::LogLevel::Warn, "server.close_error", {{"error", ec.message()}});
  }

  auto open = std::move(sessions_);
  sessions_.clear();
  for (auto& s : open) {
    s->detach();
    s->close();
  }

  trace("✓ Server closed");
  util::logger().log(util::LogLevel::Info, "server.stopped", {{"port", std::to_string(port_)}});
}

std::future<void> ServerHandle::close() {
  auto done = std::make_shared<std::promise<void>>();
  auto fut = done->get_future();
  boost::asio::post(ioc_, [this, done] {
    stop();
    done->set_value();
  });
  return fut;
}

void ServerHandle::drain() {
  pool_.drain();
}

void ServerHandle::doAccept() {
  acceptor_.async_accept(
    [this](boost::system::error_code ec, tcp::socket socket) {
      onAccept(ec, std::move(socket));
    });
}

void ServerHandle::onAccept(const boost::system::error_code& ec, tcp::socket socket) {
  if (ec == boost::asio::error::operation_aborted || !running_) return;

  if (ec) {
    HB_METRIC_HIT("connections.accept_error");
    util::logger().log(util::LogLevel::Warn, "server.accept_error", {{"error", ec.message()}});
  } else {
    HB_METRIC_HIT("connections.accepted");
    auto session = std::make_shared<ClientSession>(std::move(socket), this, options_.maxRequestBytes);
    sessions_.insert(session);
    session->start();
  }

  doAccept();
}

void ServerHandle::submit(std::shared_ptr<ClientSession> session, std::shared_ptr<rapidjson::Document> doc) {
  pool_.post([this, session, doc] {
    auto response = std::make_shared<Response>(handleDocument(*doc));
    boost::asio::post(ioc_, [session, response] {
      session->respond(std::move(*response));
    });
  });
}

void ServerHandle::rejectMalformed(std::shared_ptr<ClientSession> session, const std::string& error) {
  trace("← ERROR: " + error);
  session->respond(Response::failure(error));
}

void ServerHandle::runAfterSend(std::function<void()> fn) {
  pool_.post([fn = std::move(fn)] {
    try {
      fn();
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "server.after_send_failed", {{"error", ex.what()}});
    }
  });
}

void ServerHandle::forget(ClientSession* session) {
  for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
    if (it->get() == session) {
      sessions_.erase(it);
      return;
    }
  }
}

void ServerHandle::trace(const std::string& line) {
  output_->appendLine(line);
}

Response ServerHandle::handleDocument(const rapidjson::Document& doc) {
  HB_METRIC_HIT("requests.received");
  trace("→ INPUT: " + json::toString(doc));

  Response response = [&] {
    try {
      Request req = JsonValidator::validateRequest(doc);
      return dispatcher_->dispatch(req);
    } catch (const BridgeError& ex) {
      HB_METRIC_HIT("requests.invalid");
      return Response::failure(ex.what());
    }
  }();

  if (response.ok()) {
    trace("← OUTPUT: " + response.serialize());
  } else {
    trace("← ERROR: " + response.error());
  }
  return response;
}

} // namespace server
} // namespace hb
