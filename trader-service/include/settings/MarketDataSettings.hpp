#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace trader::settings {

/**
 * @brief Параметры подписок на рыночные данные
 *
 * Читает из ENV:
 * - TRADER_HISTORY_DAYS (default: 30)
 * - TRADER_BAR_SIZE (default: "1 min")
 * - TRADER_DEFAULT_TIMEZONE (default: "America/New_York")
 * - TRADER_SNAPSHOT_TIMEOUT_MS (default: 5000)
 */
class MarketDataSettings {
public:
    MarketDataSettings() {
        if (const char* val = std::getenv("TRADER_HISTORY_DAYS")) {
            historyDays_ = std::stoi(val);
        }
        if (const char* val = std::getenv("TRADER_BAR_SIZE")) {
            barSize_ = val;
        }
        if (const char* val = std::getenv("TRADER_DEFAULT_TIMEZONE")) {
            defaultTimeZone_ = val;
        }
        if (const char* val = std::getenv("TRADER_SNAPSHOT_TIMEOUT_MS")) {
            snapshotTimeout_ = std::chrono::milliseconds(std::stoi(val));
        }
    }

    int getHistoryDays() const { return historyDays_; }
    std::string getBarSize() const { return barSize_; }
    std::string getDefaultTimeZone() const { return defaultTimeZone_; }
    std::chrono::milliseconds getSnapshotTimeout() const { return snapshotTimeout_; }

private:
    int historyDays_ = 30;
    std::string barSize_ = "1 min";
    std::string defaultTimeZone_ = "America/New_York";
    std::chrono::milliseconds snapshotTimeout_ = std::chrono::milliseconds(5000);
};

} // namespace trader::settings
