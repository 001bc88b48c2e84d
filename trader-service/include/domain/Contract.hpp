#pragma once

#include <cstdint>
#include <string>

namespace trader::domain {

/**
 * @brief Ссылка на контракт в том виде, в каком её присылает шлюз
 *
 * conId: стабильный ключ инструмента у брокера. Два объекта Contract
 * с одинаковым conId описывают один и тот же инструмент.
 */
struct Contract {
    int64_t conId = 0;
    std::string symbol;
    std::string secType = "STK";
    std::string exchange = "SMART";
    std::string primaryExchange;
    std::string currency = "USD";

    Contract() = default;

    Contract(int64_t id, const std::string& sym,
             const std::string& type = "STK",
             const std::string& exch = "SMART",
             const std::string& cur = "USD")
        : conId(id), symbol(sym), secType(type), exchange(exch), currency(cur)
    {}

    bool sameInstrument(const Contract& other) const {
        return conId == other.conId;
    }
};

} // namespace trader::domain
