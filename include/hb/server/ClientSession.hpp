#pragma once

#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

#include "hb/Response.hpp"
#include "hb/server/RequestReader.hpp"

namespace hb {
namespace server {

class ServerHandle;

// One request/response exchange over one accepted socket:
// Idle -> Connected -> Processing -> Responding -> Closed.
// Malformed input goes from Connected straight to Responding.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
  using tcp = boost::asio::ip::tcp;

  enum class State { Idle, Connected, Processing, Responding, Closed };

  ClientSession(tcp::socket socket, ServerHandle* server, std::size_t maxRequestBytes);

  void start();

  // Called on the io thread with the dispatch result. Ignored once closed.
  void respond(Response response);

  // Abandon the exchange without writing. Safe to call repeatedly.
  void close();

  // Server is going away; drop the back-pointer.
  void detach() noexcept { server_ = nullptr; }

  State state() const noexcept { return state_; }
  const std::string& peer() const noexcept { return peer_; }

private:
  void doRead();
  void onRead(const boost::system::error_code& ec, std::size_t n);
  void onWrite(const boost::system::error_code& ec, std::size_t bytes);
  void fail(const std::string& where, const boost::system::error_code& ec);

private:
  tcp::socket   socket_;
  ServerHandle* server_{nullptr}; // not owned
  RequestReader reader_;
  State         state_{State::Idle};
  std::string   peer_;

  std::array<char, 8 * 1024> buf_{};
  std::string                out_;
  std::function<void()>      afterSend_;
};

} // namespace server
} // namespace hb
