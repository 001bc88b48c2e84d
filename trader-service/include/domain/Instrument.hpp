#pragma once

#include "Contract.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace trader::domain {

/**
 * @brief Торговый инструмент с полными реквизитами
 *
 * Получается разрешением Contract через справочник шлюза.
 * Сравнивается только по stableKey(), а не по адресу объекта.
 */
class Instrument {
public:
    int64_t conId = 0;
    std::string symbol;
    std::string secType = "STK";
    std::string exchange = "SMART";
    std::string primaryExchange;
    std::string currency = "USD";
    std::string longName;
    std::string timeZoneId;     ///< Часовой пояс биржи, например America/New_York
    double minTick = 0.01;

    Instrument() = default;

    Instrument(int64_t id, const std::string& sym, const std::string& exch,
               const std::string& type, const std::string& cur)
        : conId(id), symbol(sym), secType(type), exchange(exch), currency(cur)
    {}

    int64_t stableKey() const { return conId; }

    /**
     * @brief Ссылка на контракт для запросов к шлюзу
     */
    Contract contract() const {
        Contract c(conId, symbol, secType, exchange, currency);
        c.primaryExchange = primaryExchange;
        return c;
    }

    bool operator==(const Instrument& other) const {
        return stableKey() == other.stableKey();
    }

    bool operator!=(const Instrument& other) const {
        return !(*this == other);
    }
};

inline void to_json(nlohmann::json& j, const Instrument& instrument) {
    j = nlohmann::json{
        {"con_id", instrument.conId},
        {"symbol", instrument.symbol},
        {"sec_type", instrument.secType},
        {"exchange", instrument.exchange},
        {"primary_exchange", instrument.primaryExchange},
        {"currency", instrument.currency},
        {"long_name", instrument.longName},
        {"time_zone_id", instrument.timeZoneId},
        {"min_tick", instrument.minTick}
    };
}

inline void from_json(const nlohmann::json& j, Instrument& instrument) {
    instrument.conId = j.at("con_id").get<int64_t>();
    instrument.symbol = j.value("symbol", "");
    instrument.secType = j.value("sec_type", "STK");
    instrument.exchange = j.value("exchange", "SMART");
    instrument.primaryExchange = j.value("primary_exchange", "");
    instrument.currency = j.value("currency", "USD");
    instrument.longName = j.value("long_name", "");
    instrument.timeZoneId = j.value("time_zone_id", "");
    instrument.minTick = j.value("min_tick", 0.01);
}

} // namespace trader::domain
