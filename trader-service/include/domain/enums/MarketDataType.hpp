#pragma once

#include <string>

namespace trader::domain {

/**
 * @brief Режим рыночных данных шлюза (коды совпадают с протоколом брокера)
 */
enum class MarketDataType {
    LIVE = 1,
    FROZEN = 2,
    DELAYED = 3,
    DELAYED_FROZEN = 4
};

inline std::string toString(MarketDataType type) {
    switch (type) {
        case MarketDataType::LIVE: return "LIVE";
        case MarketDataType::FROZEN: return "FROZEN";
        case MarketDataType::DELAYED: return "DELAYED";
        case MarketDataType::DELAYED_FROZEN: return "DELAYED_FROZEN";
        default: return "UNKNOWN";
    }
}

inline MarketDataType marketDataTypeFromCode(int code) {
    switch (code) {
        case 1: return MarketDataType::LIVE;
        case 2: return MarketDataType::FROZEN;
        case 4: return MarketDataType::DELAYED_FROZEN;
        default: return MarketDataType::DELAYED;
    }
}

} // namespace trader::domain
