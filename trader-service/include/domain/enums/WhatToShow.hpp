#pragma once

#include <string>

namespace trader::domain {

/**
 * @brief Тип цены для исторических баров
 */
enum class WhatToShow {
    TRADES,
    MIDPOINT,
    BID,
    ASK
};

inline std::string toString(WhatToShow what) {
    switch (what) {
        case WhatToShow::TRADES: return "TRADES";
        case WhatToShow::MIDPOINT: return "MIDPOINT";
        case WhatToShow::BID: return "BID";
        case WhatToShow::ASK: return "ASK";
        default: return "UNKNOWN";
    }
}

} // namespace trader::domain
