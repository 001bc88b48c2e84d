#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace trader::domain {

/**
 * @brief Диапазон дат для исторических данных
 *
 * Границы хранятся как моменты времени (UTC). timeZone: часовой пояс
 * биржи, в котором шлюз трактует конец диапазона.
 */
class DateRange {
public:
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
    std::string timeZone;

    DateRange() = default;

    DateRange(std::chrono::system_clock::time_point s,
              std::chrono::system_clock::time_point e,
              const std::string& tz)
        : start(s), end(e), timeZone(tz)
    {}

    /**
     * @brief Последние days дней, заканчивая now
     */
    static DateRange trailingDays(int days, const std::string& tz,
                                  std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) {
        return DateRange(now - std::chrono::hours(24 * days), now, tz);
    }

    std::chrono::hours length() const {
        return std::chrono::duration_cast<std::chrono::hours>(end - start);
    }

    std::string toString() const {
        return format(start) + " - " + format(end) + " [" + timeZone + "]";
    }

    static std::string format(std::chrono::system_clock::time_point tp) {
        auto time_t_val = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
};

} // namespace trader::domain
