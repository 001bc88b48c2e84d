#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace trader::settings {

/**
 * @brief Настройки повторных попыток подключения
 *
 * Читает из ENV:
 * - TRADER_CONNECT_MAX_TRIES (default: 10)
 * - TRADER_CONNECT_MAX_TIME_SECONDS (default: 120)
 * - TRADER_CONNECT_BASE_DELAY_MS (default: 1000)
 * - TRADER_CONNECT_MAX_DELAY_MS (default: 60000)
 * - TRADER_CONNECT_JITTER (default: true)
 */
class BackoffSettings {
public:
    BackoffSettings() {
        if (const char* val = std::getenv("TRADER_CONNECT_MAX_TRIES")) {
            maxTries_ = std::stoi(val);
        }
        if (const char* val = std::getenv("TRADER_CONNECT_MAX_TIME_SECONDS")) {
            maxTime_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("TRADER_CONNECT_BASE_DELAY_MS")) {
            baseDelay_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("TRADER_CONNECT_MAX_DELAY_MS")) {
            maxDelay_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("TRADER_CONNECT_JITTER")) {
            jitter_ = std::string(val) != "false" && std::string(val) != "0";
        }
    }

    BackoffSettings(int maxTries,
                    std::chrono::milliseconds maxTime,
                    std::chrono::milliseconds baseDelay,
                    std::chrono::milliseconds maxDelay,
                    bool jitter)
        : maxTries_(maxTries)
        , maxTime_(maxTime)
        , baseDelay_(baseDelay)
        , maxDelay_(maxDelay)
        , jitter_(jitter)
    {}

    int getMaxTries() const { return maxTries_; }
    std::chrono::milliseconds getMaxTime() const { return maxTime_; }
    std::chrono::milliseconds getBaseDelay() const { return baseDelay_; }
    std::chrono::milliseconds getMaxDelay() const { return maxDelay_; }
    bool useJitter() const { return jitter_; }

private:
    int maxTries_ = 10;
    std::chrono::milliseconds maxTime_ = std::chrono::seconds(120);
    std::chrono::milliseconds baseDelay_ = std::chrono::milliseconds(1000);
    std::chrono::milliseconds maxDelay_ = std::chrono::milliseconds(60000);
    bool jitter_ = true;
};

} // namespace trader::settings
