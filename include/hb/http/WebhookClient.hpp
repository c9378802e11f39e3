#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hb { namespace http {

/// host/port/target split of a plain "http://" URL.
struct WebhookTarget {
  std::string host;
  std::string port = "80";
  std::string target = "/";

  // Accepts http://host[:port][/path][?query]; IPv6 hosts in brackets.
  // Returns nullopt for any other scheme or a malformed authority.
  static std::optional<WebhookTarget> parse(const std::string& url);

  // Host header value: "host:port", IPv6 literals back in brackets.
  std::string authority() const;
};

// One fire-and-forget HTTP POST. Owns itself through shared_from_this for
// the lifetime of the async chain; the caller keeps no handle.
class WebhookClient : public std::enable_shared_from_this<WebhookClient> {
public:
  using IoContext = boost::asio::io_context;
  using Tcp       = boost::asio::ip::tcp;
  using ErrorCode = boost::beast::error_code;

  // status is the HTTP status (0 when no response arrived); where names the
  // failed step ("resolve", "connect", "write", "read", "status") or is empty on success.
  using OnDone = std::function<void(const ErrorCode& ec, unsigned status, std::string_view where)>;

  WebhookClient(IoContext& ioc,
                WebhookTarget target,
                std::string body,
                std::chrono::milliseconds timeout,
                OnDone onDone);

  static std::shared_ptr<WebhookClient>
  create(IoContext& ioc,
         WebhookTarget target,
         std::string body,
         std::chrono::milliseconds timeout,
         OnDone onDone)
  {
    return std::make_shared<WebhookClient>(ioc, std::move(target), std::move(body),
                                           timeout, std::move(onDone));
  }

  void post();

private:
  void onResolve(ErrorCode ec, Tcp::resolver::results_type results);
  void onConnect(ErrorCode ec, Tcp::resolver::results_type::endpoint_type ep);
  void onWrite(ErrorCode ec, std::size_t bytes);
  void onRead(ErrorCode ec, std::size_t bytes);

  void finish(ErrorCode ec, unsigned status, std::string_view where);

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  Tcp::resolver resolver_;
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;

  WebhookTarget target_;
  std::chrono::milliseconds timeout_;
  boost::beast::http::request<boost::beast::http::string_body>  req_;
  boost::beast::http::response<boost::beast::http::string_body> res_;

  OnDone onDone_;
  bool done_{false};
};

}} // namespace hb::http
