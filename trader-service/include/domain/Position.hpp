#pragma once

#include "Contract.hpp"
#include <string>

namespace trader::domain {

/**
 * @brief Позиция счёта по инструменту (поток positions)
 */
struct Position {
    std::string account;
    Contract contract;
    double quantity = 0.0;
    double averageCost = 0.0;

    Position() = default;

    Position(const std::string& acc, const Contract& c, double qty, double avgCost)
        : account(acc), contract(c), quantity(qty), averageCost(avgCost)
    {}

    bool isActive() const { return quantity != 0.0; }
};

} // namespace trader::domain
