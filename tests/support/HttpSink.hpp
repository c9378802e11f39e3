#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hbtest {

// Minimal blocking HTTP endpoint on 127.0.0.1:<ephemeral> that records each
// request and answers with a fixed status.
class HttpSink {
public:
    struct Received {
        std::string target;
        std::string host;
        std::string contentType;
        std::string body;
    };

    explicit HttpSink(unsigned status = 200)
        : status_(status)
        , acceptor_(ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0})
    {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]{ serve(); });
    }

    ~HttpSink() {
        stopping_ = true;
        // Wake the blocking accept.
        boost::system::error_code ec;
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::socket s(ioc);
        s.connect({boost::asio::ip::make_address("127.0.0.1"), port_}, ec);
        if (thread_.joinable()) thread_.join();
    }

    unsigned short port() const { return port_; }

    std::string url(const std::string& path = "/hook") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    bool waitFor(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(mx_);
        return cv_.wait_for(lk, timeout, [&]{ return received_.size() >= n; });
    }

    std::vector<Received> received() const {
        std::lock_guard<std::mutex> lk(mx_);
        return received_;
    }

private:
    void serve() {
        namespace http = boost::beast::http;
        while (!stopping_) {
            boost::asio::ip::tcp::socket socket(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) break;

            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req, ec);
            if (ec) continue;

            {
                std::lock_guard<std::mutex> lk(mx_);
                received_.push_back({std::string(req.target()),
                                     std::string(req[http::field::host]),
                                     std::string(req[http::field::content_type]),
                                     req.body()});
            }
            cv_.notify_all();

            http::response<http::string_body> res{static_cast<http::status>(status_), 11};
            res.set(http::field::content_type, "text/plain");
            res.body() = "ok";
            res.keep_alive(false);
            res.prepare_payload();
            http::write(socket, res, ec);
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        }
    }

    unsigned status_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_{0};
    std::atomic<bool> stopping_{false};
    std::thread thread_;

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::vector<Received> received_;
};

} // namespace hbtest
