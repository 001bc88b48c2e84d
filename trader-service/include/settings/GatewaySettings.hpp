#pragma once

#include "settings/IGatewaySettings.hpp"
#include <cstdlib>
#include <string>

namespace trader::settings {

/**
 * @brief Настройки подключения к брокерскому шлюзу
 *
 * Читает из ENV:
 * - TRADER_GATEWAY_HOST (default: "127.0.0.1")
 * - TRADER_GATEWAY_PORT (default: 7496)
 * - TRADER_CLIENT_ID (default: 5)
 * - TRADER_MARKET_DATA_TYPE (default: 3: delayed)
 * - TRADER_SIMULATION (default: true)
 */
class GatewaySettings : public IGatewaySettings {
public:
    GatewaySettings() {
        if (const char* host = std::getenv("TRADER_GATEWAY_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("TRADER_GATEWAY_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* clientId = std::getenv("TRADER_CLIENT_ID")) {
            clientId_ = std::stoi(clientId);
        }
        if (const char* type = std::getenv("TRADER_MARKET_DATA_TYPE")) {
            marketDataType_ = std::stoi(type);
        }
        if (const char* simulation = std::getenv("TRADER_SIMULATION")) {
            simulation_ = std::string(simulation) != "false" && std::string(simulation) != "0";
        }
    }

    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }
    int getClientId() const override { return clientId_; }

    domain::MarketDataType getMarketDataType() const override {
        return domain::marketDataTypeFromCode(marketDataType_);
    }

    bool isSimulation() const { return simulation_; }

private:
    std::string host_ = "127.0.0.1";
    int port_ = 7496;
    int clientId_ = 5;
    int marketDataType_ = 3;
    bool simulation_ = true;
};

} // namespace trader::settings
