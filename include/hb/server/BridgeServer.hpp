#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <rapidjson/document.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <unordered_set>

#include "hb/Broadcaster.hpp"
#include "hb/Collaborators.hpp"
#include "hb/CommandDispatcher.hpp"
#include "hb/Config.hpp"
#include "hb/OutputBuffer.hpp"
#include "hb/OutputChannel.hpp"
#include "hb/ProgressEvent.hpp"
#include "hb/Response.hpp"
#include "hb/SubscriberRegistry.hpp"
#include "hb/rt/ThreadPool.hpp"

namespace hb {
namespace util { class Config; }

namespace server {

class ClientSession;

struct ServerOptions {
  std::string               address = "127.0.0.1";
  unsigned short            port = Config::DefaultPort; // 0 picks an ephemeral port
  std::size_t               maxRequestBytes = Config::MaxRequestBytes;
  std::size_t               hostWorkers = Config::HostWorkers;
  std::size_t               outputCapacity = Config::OutputHistoryMax;
  std::chrono::milliseconds webhookTimeout{5000};

  static ServerOptions fromConfig(const util::Config& cfg);
};

// The running bridge. Construction binds and starts accepting (throws
// BindError); destruction stops. Owns the subscriber set, the output history,
// the dispatcher and the worker pool that runs dispatch off the io thread.
//
// The io_context must be driven by exactly one thread. stop() belongs on that
// thread; other threads use close(). Destroy the handle only after close()
// has resolved or the io_context has stopped running.
class ServerHandle {
public:
  ServerHandle(boost::asio::io_context& ioc,
               ServerOptions options,
               Collaborators collaborators,
               ProgressFn onProgress = {});
  ~ServerHandle();

  ServerHandle(const ServerHandle&)            = delete;
  ServerHandle& operator=(const ServerHandle&) = delete;

  unsigned short port() const noexcept { return port_; }
  std::chrono::system_clock::time_point startTime() const noexcept { return dispatcher_->info().startTime; }
  bool running() const noexcept { return running_.load(); }

  SubscriberRegistry& subscribers() noexcept { return *subscribers_; }
  OutputChannel& output() noexcept { return *output_; }
  OutputBuffer& outputBuffer() noexcept { return output_->buffer(); }

  // In-process dispatch, same semantics as a socket request. Any thread.
  Response dispatch(const std::string& method, const rapidjson::Value& params);

  // Fan-out to the current subscribers. Any thread.
  std::size_t broadcast(const BroadcastEvent& event);

  // Closes the listener and every open connection. Idempotent. io thread only.
  void stop();

  // Posts stop() to the io thread. The future is ready once the port is released.
  std::future<void> close();

  // Blocks until queued dispatch work has finished.
  void drain();

private:
  friend class ClientSession;

  void doAccept();
  void onAccept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);

  // Session callbacks (io thread).
  void submit(std::shared_ptr<ClientSession> session, std::shared_ptr<rapidjson::Document> doc);
  void rejectMalformed(std::shared_ptr<ClientSession> session, const std::string& error);
  void runAfterSend(std::function<void()> fn);
  void forget(ClientSession* session);
  void trace(const std::string& line);

  // Worker thread.
  Response handleDocument(const rapidjson::Document& doc);

private:
  boost::asio::io_context&        ioc_;
  boost::asio::ip::tcp::acceptor  acceptor_;
  ServerOptions                   options_;
  unsigned short                  port_{0};
  std::atomic<bool>               running_{false};

  std::shared_ptr<SubscriberRegistry> subscribers_;
  std::shared_ptr<OutputChannel>      output_;
  std::shared_ptr<Broadcaster>        broadcaster_;
  std::unique_ptr<CommandDispatcher>  dispatcher_;

  std::unordered_set<std::shared_ptr<ClientSession>> sessions_;

  // Last member: its workers are joined before anything they touch is destroyed.
  rt::ThreadPool pool_;
};

} // namespace server
} // namespace hb
