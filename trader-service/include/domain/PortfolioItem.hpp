#pragma once

#include "Contract.hpp"
#include <string>

namespace trader::domain {

/**
 * @brief Элемент портфеля с рыночной оценкой (поток portfolio)
 */
struct PortfolioItem {
    std::string account;
    Contract contract;
    double position = 0.0;
    double marketPrice = 0.0;
    double marketValue = 0.0;
    double averageCost = 0.0;
    double unrealizedPnl = 0.0;
    double realizedPnl = 0.0;

    PortfolioItem() = default;

    PortfolioItem(const std::string& acc, const Contract& c, double pos,
                  double price, double avgCost)
        : account(acc), contract(c), position(pos), marketPrice(price)
        , marketValue(price * pos), averageCost(avgCost)
        , unrealizedPnl((price - avgCost) * pos)
    {}

    bool isActive() const { return position != 0.0; }
};

} // namespace trader::domain
