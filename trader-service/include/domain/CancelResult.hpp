#pragma once

#include "Trade.hpp"
#include <optional>
#include <string>

namespace trader::domain {

enum class CancelStatus {
    ACCEPTED,
    NOT_FOUND,
    OWNERSHIP_MISMATCH
};

inline std::string toString(CancelStatus status) {
    switch (status) {
        case CancelStatus::ACCEPTED: return "ACCEPTED";
        case CancelStatus::NOT_FOUND: return "NOT_FOUND";
        case CancelStatus::OWNERSHIP_MISMATCH: return "OWNERSHIP_MISMATCH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Результат запроса на отмену ордера
 */
class CancelResult {
public:
    CancelStatus status = CancelStatus::NOT_FOUND;
    std::optional<Trade> trade;
    std::string message;

    bool accepted() const { return status == CancelStatus::ACCEPTED; }
};

} // namespace trader::domain
