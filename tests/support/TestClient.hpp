#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace hbtest {

// Writes the chunks (pausing between them), optionally half-closes, then
// reads until the server closes the connection.
inline std::string exchange(unsigned short port,
                            const std::vector<std::string>& chunks,
                            bool halfClose = false,
                            std::chrono::milliseconds gap = std::chrono::milliseconds(30)) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::socket socket(ioc);
    socket.connect({boost::asio::ip::make_address("127.0.0.1"), port});

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (i) std::this_thread::sleep_for(gap);
        boost::asio::write(socket, boost::asio::buffer(chunks[i]));
    }
    if (halfClose) socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send);

    std::string reply;
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::dynamic_buffer(reply), ec);
    return reply;
}

inline std::string exchange(unsigned short port, const std::string& request) {
    return exchange(port, std::vector<std::string>{request});
}

} // namespace hbtest
