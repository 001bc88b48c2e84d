#pragma once

#include "ports/output/IBarStore.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace trader::adapters::secondary {

/**
 * @brief In-memory хранилище баров: (conId, barSize) → бары в порядке прихода
 */
class InMemoryBarStore : public ports::output::IBarStore {
public:
    void append(const domain::Instrument& instrument,
                const std::string& barSize,
                const domain::Bar& bar) override {
        std::lock_guard<std::mutex> lock(mutex_);
        bars_[{instrument.stableKey(), barSize}].push_back(bar);
    }

    bool isAvailable() const override { return available_.load(); }

    void setAvailable(bool available) { available_ = available; }

    std::vector<domain::Bar> bars(int64_t stableKey, const std::string& barSize) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bars_.find({stableKey, barSize});
        return it != bars_.end() ? it->second : std::vector<domain::Bar>{};
    }

    size_t totalBars() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& entry : bars_) {
            total += entry.second.size();
        }
        return total;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<int64_t, std::string>, std::vector<domain::Bar>> bars_;
    std::atomic<bool> available_{true};
};

} // namespace trader::adapters::secondary
