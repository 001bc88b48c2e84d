#pragma once

#include "settings/BackoffSettings.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace trader::application {

/**
 * @brief Экспоненциальная задержка между попытками подключения
 *
 * delay(n) = base * 2^(n-1), не больше maxDelay.
 * С jitter: равномерно из [0, delay(n)] (full jitter).
 */
class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const settings::BackoffSettings& settings)
        : settings_(settings)
        , rng_(std::random_device{}())
    {}

    /**
     * @param attempt Номер неудачной попытки, начиная с 1
     */
    std::chrono::milliseconds delayFor(int attempt) {
        const int exponent = std::min(std::max(attempt - 1, 0), 30);
        const int64_t base = settings_.getBaseDelay().count();
        const int64_t cap = settings_.getMaxDelay().count();

        int64_t delay = base;
        for (int i = 0; i < exponent && delay < cap; ++i) {
            delay *= 2;
        }
        delay = std::min(delay, cap);

        if (settings_.useJitter() && delay > 0) {
            std::uniform_int_distribution<int64_t> dist(0, delay);
            delay = dist(rng_);
        }
        return std::chrono::milliseconds(delay);
    }

    /**
     * @brief Можно ли сделать ещё одну попытку
     * @param attempts Сколько попыток уже было
     * @param elapsed Сколько времени прошло с первой попытки
     */
    bool canRetry(int attempts, std::chrono::milliseconds elapsed) const {
        return attempts < settings_.getMaxTries() && elapsed < settings_.getMaxTime();
    }

    /**
     * @brief Задержка, урезанная до оставшегося бюджета времени
     */
    std::chrono::milliseconds clampToBudget(std::chrono::milliseconds delay,
                                            std::chrono::milliseconds elapsed) const {
        auto remaining = settings_.getMaxTime() - elapsed;
        if (remaining.count() < 0) {
            return std::chrono::milliseconds(0);
        }
        return std::min(delay, remaining);
    }

private:
    settings::BackoffSettings settings_;
    std::mt19937_64 rng_;
};

} // namespace trader::application
