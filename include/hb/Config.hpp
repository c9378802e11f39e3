#pragma once

#include <cstddef>

namespace hb {
struct Config {
    static constexpr std::size_t OutputHistoryMax = 1000;
    static constexpr unsigned short DefaultPort = 9485;
    static constexpr std::size_t DefaultOutputLines = 100;
    static constexpr std::size_t MaxRequestBytes = 1024 * 1024;
    static constexpr std::size_t HostWorkers = 1;
};
}
