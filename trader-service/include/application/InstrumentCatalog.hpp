#pragma once

#include "domain/Instrument.hpp"
#include "domain/Universe.hpp"
#include "ports/output/IUniverseStore.hpp"
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trader::application {

/**
 * @brief Каталог вселенных инструментов
 *
 * Держит загруженные вселенные в памяти (поиск по stableKey за O(1))
 * и пишет каждое изменение в хранилище (write-through).
 * Операция «прочитать-изменить-сохранить» выполняется под одним мьютексом.
 */
class InstrumentCatalog {
public:
    explicit InstrumentCatalog(std::shared_ptr<ports::output::IUniverseStore> store)
        : store_(std::move(store))
    {}

    /**
     * @brief Загрузить все вселенные из хранилища
     */
    void load() {
        auto universes = store_->getAll();

        std::lock_guard<std::mutex> lock(mutex_);
        universes_.clear();
        for (auto& universe : universes) {
            universes_[universe.name()] = std::move(universe);
        }
        std::cout << "[InstrumentCatalog] Loaded " << universes_.size() << " universes" << std::endl;
    }

    std::vector<domain::Universe> getAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Universe> result;
        for (const auto& entry : universes_) {
            result.push_back(entry.second);
        }
        return result;
    }

    /**
     * @brief Получить вселенную по имени (пустую, если её нет)
     */
    domain::Universe get(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(name);
    }

    /**
     * @brief Заменить вселенную целиком
     */
    void update(const domain::Universe& universe) {
        std::lock_guard<std::mutex> lock(mutex_);
        store_->update(universe);
        universes_[universe.name()] = universe;
    }

    void clear(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto universe = lookup(name);
        universe.clear();
        store_->update(universe);
        universes_[name] = universe;
        std::cout << "[InstrumentCatalog] Cleared universe '" << name << "'" << std::endl;
    }

    bool contains(const std::string& name, int64_t stableKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(name).contains(stableKey);
    }

    std::optional<domain::Instrument> find(const std::string& name, int64_t stableKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(name).find(stableKey);
    }

    /**
     * @brief Добавить инструмент, если его ещё нет, и сохранить вселенную
     * @return true если вселенная изменилась
     * @throws Ошибку хранилища; кэш в этом случае не меняется
     */
    bool addIfMissing(const std::string& name, const domain::Instrument& instrument) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto universe = lookup(name);
        if (!universe.add(instrument)) {
            return false;
        }
        store_->update(universe);
        universes_[name] = universe;
        return true;
    }

private:
    std::shared_ptr<ports::output::IUniverseStore> store_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, domain::Universe> universes_;

    domain::Universe lookup(const std::string& name) const {
        auto it = universes_.find(name);
        if (it != universes_.end()) {
            return it->second;
        }
        auto stored = store_->get(name);
        auto universe = stored ? *stored : domain::Universe(name);
        universes_[name] = universe;
        return universe;
    }
};

} // namespace trader::application
