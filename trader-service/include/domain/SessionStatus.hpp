#pragma once

#include <nlohmann/json.hpp>

namespace trader::domain {

/**
 * @brief Минимальный health-снимок сессии
 */
struct SessionStatus {
    bool gatewayConnected = false;
    bool storeConnected = false;
};

inline void to_json(nlohmann::json& j, const SessionStatus& status) {
    j = nlohmann::json{
        {"gateway_connected", status.gatewayConnected},
        {"store_connected", status.storeConnected}
    };
}

} // namespace trader::domain
