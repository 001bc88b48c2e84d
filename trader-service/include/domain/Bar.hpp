#pragma once

#include <chrono>

namespace trader::domain {

/**
 * @brief OHLCV-бар
 */
struct Bar {
    std::chrono::system_clock::time_point time;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

} // namespace trader::domain
