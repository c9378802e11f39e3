#include "hb/http/WebhookClient.hpp"
#include "hb/util/Logger.hpp"

#include <boost/beast/version.hpp>

#include <algorithm>
#include <cctype>

namespace hb { namespace http {

namespace bhttp = boost::beast::http;

std::optional<WebhookTarget> WebhookTarget::parse(const std::string& url) {
  static const std::string scheme = "http://";
  if (url.size() <= scheme.size()) return std::nullopt;

  std::string head = url.substr(0, scheme.size());
  std::transform(head.begin(), head.end(), head.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (head != scheme) return std::nullopt;

  const std::string rest = url.substr(scheme.size());
  const auto slash = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, slash);
  std::string target = slash == std::string::npos ? std::string("/") : rest.substr(slash);
  if (!target.empty() && target[0] != '/') target.insert(target.begin(), '/');
  if (auto hash = target.find('#'); hash != std::string::npos) target.erase(hash);

  // Userinfo is not supported.
  if (authority.empty() || authority.find('@') != std::string::npos) return std::nullopt;

  WebhookTarget t;
  t.target = target.empty() ? "/" : target;

  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos || close == 1) return std::nullopt;
    t.host = authority.substr(1, close - 1);
    const std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail[0] != ':' || tail.size() == 1) return std::nullopt;
      t.port = tail.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      t.host = authority.substr(0, colon);
      t.port = authority.substr(colon + 1);
      if (t.port.empty()) return std::nullopt;
    } else {
      t.host = authority;
    }
  }

  if (t.host.empty()) return std::nullopt;
  if (t.port.size() > 5 ||
      !std::all_of(t.port.begin(), t.port.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }
  const unsigned long port = std::stoul(t.port);
  if (port == 0 || port > 65535) return std::nullopt;
  return t;
}

std::string WebhookTarget::authority() const {
  if (host.find(':') != std::string::npos) return "[" + host + "]:" + port;
  return host + ":" + port;
}

WebhookClient::WebhookClient(IoContext& ioc,
                             WebhookTarget target,
                             std::string body,
                             std::chrono::milliseconds timeout,
                             OnDone onDone)
  : strand_(boost::asio::make_strand(ioc))
  , resolver_(strand_)
  , stream_(strand_)
  , target_(std::move(target))
  , timeout_(timeout)
  , onDone_(std::move(onDone))
{
  req_.method(bhttp::verb::post);
  req_.target(target_.target);
  req_.version(11);
  req_.set(bhttp::field::host, target_.authority());
  req_.set(bhttp::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " hostbridge-webhook");
  req_.set(bhttp::field::content_type, "application/json");
  req_.keep_alive(false);
  req_.body() = std::move(body);
  req_.prepare_payload();
}

void WebhookClient::post() {
  resolver_.async_resolve(target_.host, target_.port,
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec, Tcp::resolver::results_type results) {
        self->onResolve(ec, std::move(results));
      }
    )
  );
}

void WebhookClient::onResolve(ErrorCode ec, Tcp::resolver::results_type results) {
  if (ec) return finish(ec, 0, "resolve");

  stream_.expires_after(timeout_);
  stream_.async_connect(
    results,
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec2, Tcp::resolver::results_type::endpoint_type ep) {
        self->onConnect(ec2, ep);
      }
    )
  );
}

void WebhookClient::onConnect(ErrorCode ec, Tcp::resolver::results_type::endpoint_type) {
  if (ec) return finish(ec, 0, "connect");

  stream_.expires_after(timeout_);
  bhttp::async_write(stream_, req_,
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec2, std::size_t bytes) {
        self->onWrite(ec2, bytes);
      }
    )
  );
}

void WebhookClient::onWrite(ErrorCode ec, std::size_t) {
  if (ec) return finish(ec, 0, "write");

  bhttp::async_read(stream_, buffer_, res_,
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec2, std::size_t bytes) {
        self->onRead(ec2, bytes);
      }
    )
  );
}

void WebhookClient::onRead(ErrorCode ec, std::size_t) {
  if (ec) return finish(ec, 0, "read");

  const unsigned status = res_.result_int();
  if (status < 200 || status >= 300) {
    return finish(ErrorCode{}, status, "status");
  }
  finish(ErrorCode{}, status, {});
}

void WebhookClient::finish(ErrorCode ec, unsigned status, std::string_view where) {
  if (done_) return;
  done_ = true;

  ErrorCode ignored;
  stream_.socket().shutdown(Tcp::socket::shutdown_both, ignored);
  stream_.close();

  if (onDone_) {
    onDone_(ec, status, where);
  } else if (!where.empty()) {
    util::logger().log(util::LogLevel::Warn, "webhook.failed",
                       {{"host", target_.host}, {"where", std::string(where)}, {"error", ec.message()}});
  }
}

}} // namespace hb::http
