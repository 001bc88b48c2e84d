#pragma once

#include "Contract.hpp"
#include <chrono>

namespace trader::domain {

/**
 * @brief Котировка инструмента
 */
struct Ticker {
    Contract contract;
    double bid = 0.0;
    double ask = 0.0;
    double last = 0.0;
    std::chrono::system_clock::time_point time;

    Ticker() = default;

    Ticker(const Contract& c, double b, double a, double l)
        : contract(c), bid(b), ask(a), last(l), time(std::chrono::system_clock::now())
    {}
};

} // namespace trader::domain
