#pragma once

#include "Position.hpp"
#include "PortfolioItem.hpp"
#include <ThreadSafeMap.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trader::domain {

/**
 * @brief Позиции и элементы портфеля по (счёт, инструмент)
 *
 * Не больше одной активной записи на пару (account, conId).
 * Запись с нулевым количеством перестаёт быть активной и удаляется.
 *
 * Thread-safe: да
 */
class Portfolio {
public:
    Portfolio() = default;

    void updatePosition(const Position& position) {
        const auto key = makeKey(position.account, position.contract.conId);
        if (!position.isActive()) {
            if (positions_.erase(key)) {
                std::cout << "[Portfolio] Position closed: " << position.account
                          << " " << position.contract.symbol << std::endl;
            }
            return;
        }
        positions_.insert(key, std::make_shared<Position>(position));
    }

    void updatePositions(const std::vector<Position>& positions) {
        for (const auto& position : positions) {
            updatePosition(position);
        }
    }

    void updatePortfolioItem(const PortfolioItem& item) {
        const auto key = makeKey(item.account, item.contract.conId);
        if (!item.isActive()) {
            if (items_.erase(key)) {
                std::cout << "[Portfolio] Holding closed: " << item.account
                          << " " << item.contract.symbol << std::endl;
            }
            return;
        }
        items_.insert(key, std::make_shared<PortfolioItem>(item));
    }

    std::optional<Position> getPosition(const std::string& account, int64_t conId) const {
        auto position = positions_.find(makeKey(account, conId));
        if (!position) {
            return std::nullopt;
        }
        return *position;
    }

    std::optional<PortfolioItem> getPortfolioItem(const std::string& account, int64_t conId) const {
        auto item = items_.find(makeKey(account, conId));
        if (!item) {
            return std::nullopt;
        }
        return *item;
    }

    std::vector<Position> positions() const {
        std::vector<Position> result;
        for (const auto& position : positions_.values()) {
            result.push_back(*position);
        }
        return result;
    }

    std::vector<PortfolioItem> portfolioItems() const {
        std::vector<PortfolioItem> result;
        for (const auto& item : items_.values()) {
            result.push_back(*item);
        }
        return result;
    }

    size_t positionCount() const { return positions_.size(); }
    size_t portfolioItemCount() const { return items_.size(); }

    double totalMarketValue() const {
        double total = 0.0;
        for (const auto& item : items_.values()) {
            total += item->marketValue;
        }
        return total;
    }

private:
    ThreadSafeMap<std::string, Position> positions_;
    ThreadSafeMap<std::string, PortfolioItem> items_;

    static std::string makeKey(const std::string& account, int64_t conId) {
        return account + "|" + std::to_string(conId);
    }
};

} // namespace trader::domain
