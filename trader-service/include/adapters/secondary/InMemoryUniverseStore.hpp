#pragma once

#include "ports/output/IUniverseStore.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>

namespace trader::adapters::secondary {

/**
 * @brief In-memory реализация хранилища вселенных
 */
class InMemoryUniverseStore : public ports::output::IUniverseStore {
public:
    InMemoryUniverseStore() = default;

    explicit InMemoryUniverseStore(const std::vector<domain::Universe>& seed) {
        for (const auto& universe : seed) {
            universes_.insert(universe.name(), std::make_shared<domain::Universe>(universe));
        }
    }

    std::vector<domain::Universe> getAll() override {
        std::vector<domain::Universe> result;
        for (const auto& universe : universes_.values()) {
            result.push_back(*universe);
        }
        std::sort(result.begin(), result.end(), [](const domain::Universe& a, const domain::Universe& b) {
            return a.name() < b.name();
        });
        return result;
    }

    std::optional<domain::Universe> get(const std::string& name) override {
        auto universe = universes_.find(name);
        return universe ? std::optional(*universe) : std::nullopt;
    }

    void update(const domain::Universe& universe) override {
        universes_.insert(universe.name(), std::make_shared<domain::Universe>(universe));
        ++updateCount_;
        std::cout << "[InMemoryUniverseStore] Saved universe '" << universe.name() << "' ("
                  << universe.size() << " instruments)" << std::endl;
    }

    int updateCount() const { return updateCount_; }

private:
    ThreadSafeMap<std::string, domain::Universe> universes_;
    std::atomic<int> updateCount_{0};
};

} // namespace trader::adapters::secondary
