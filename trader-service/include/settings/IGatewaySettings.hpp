#pragma once

#include "domain/enums/MarketDataType.hpp"
#include <string>

namespace trader::settings {

class IGatewaySettings {
public:
    virtual ~IGatewaySettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual int getClientId() const = 0;
    virtual domain::MarketDataType getMarketDataType() const = 0;
};

} // namespace trader::settings
