#include "hb/server/ClientSession.hpp"
#include "hb/server/BridgeServer.hpp"

#include "hb/Errors.hpp"
#include "hb/util/Logger.hpp"
#include "hb/util/Metrics.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

namespace hb {
namespace server {

ClientSession::ClientSession(tcp::socket socket, ServerHandle* server, std::size_t maxRequestBytes)
  : socket_(std::move(socket))
  , server_(server)
  , reader_(maxRequestBytes)
{
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if (!ec) peer_ = ep.address().to_string() + ":" + std::to_string(ep.port());
}

void ClientSession::start() {
  state_ = State::Connected;
  util::logger().log(util::LogLevel::Debug, "session.open", {{"peer", peer_}});
  doRead();
}

void ClientSession::doRead() {
  auto self = shared_from_this();
  socket_.async_read_some(
    boost::asio::buffer(buf_),
    [self](boost::system::error_code ec, std::size_t n) {
      self->onRead(ec, n);
    });
}

void ClientSession::onRead(const boost::system::error_code& ec, std::size_t n) {
  if (state_ != State::Connected) return;

  RequestReader::State rs;
  if (ec == boost::asio::error::eof) {
    rs = reader_.finish();
  } else if (ec) {
    fail("read", ec);
    return;
  } else {
    rs = reader_.feed(buf_.data(), n);
  }

  switch (rs) {
    case RequestReader::State::Incomplete:
      doRead();
      return;

    case RequestReader::State::Complete: {
      state_ = State::Processing;
      auto doc = std::make_shared<rapidjson::Document>(std::move(reader_.document()));
      if (server_) {
        server_->submit(shared_from_this(), std::move(doc));
      } else {
        close();
      }
      return;
    }

    case RequestReader::State::Malformed:
    case RequestReader::State::TooLarge:
      HB_METRIC_HIT("requests.protocol_error");
      if (server_) {
        server_->rejectMalformed(shared_from_this(), reader_.error());
      } else {
        respond(Response::failure(reader_.error()));
      }
      return;
  }
}

void ClientSession::respond(Response response) {
  if (state_ == State::Closed || state_ == State::Responding) return;
  state_ = State::Responding;

  out_ = response.serialize();
  afterSend_ = response.afterSend();

  auto self = shared_from_this();
  boost::asio::async_write(
    socket_,
    boost::asio::buffer(out_),
    [self](boost::system::error_code ec, std::size_t bytes) {
      self->onWrite(ec, bytes);
    });
}

void ClientSession::onWrite(const boost::system::error_code& ec, std::size_t bytes) {
  if (ec) {
    fail("write", ec);
    return;
  }
  HB_METRIC_INC("bytes.out", static_cast<double>(bytes));

  auto deferred = std::move(afterSend_);
  auto* server = server_;
  close();
  if (deferred && server) {
    server->runAfterSend(std::move(deferred));
  }
}

void ClientSession::fail(const std::string& where, const boost::system::error_code& ec) {
  if (state_ == State::Closed) return;
  // Aborts come from our own close(); nothing to report.
  if (ec != boost::asio::error::operation_aborted) {
    HB_METRIC_HIT("connections.transport_error");
    const TransportError err(where, ec.message());
    if (server_) {
      server_->trace(std::string("✖ SOCKET ERROR: ") + err.what());
    } else {
      util::logger().log(util::LogLevel::Warn, "session.transport_error",
                         {{"peer", peer_}, {"error", err.what()}});
    }
  }
  close();
}

void ClientSession::close() {
  if (state_ == State::Closed) return;
  state_ = State::Closed;

  boost::system::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);

  if (server_) {
    auto* server = server_;
    server_ = nullptr;
    server->forget(this);
  }
}

} // namespace server
} // namespace hb
