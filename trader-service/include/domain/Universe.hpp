#pragma once

#include "Instrument.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trader::domain {

/**
 * @brief Имя зарезервированной вселенной текущих позиций
 */
inline const std::string PORTFOLIO_UNIVERSE = "portfolio";

/**
 * @brief Именованный упорядоченный набор инструментов
 *
 * Уникальность по stableKey() гарантируется индексом:
 * повторный add() того же инструмента ничего не меняет.
 */
class Universe {
public:
    Universe() = default;

    explicit Universe(const std::string& name, const std::vector<Instrument>& instruments = {})
        : name_(name)
    {
        for (const auto& instrument : instruments) {
            add(instrument);
        }
    }

    const std::string& name() const { return name_; }
    const std::vector<Instrument>& instruments() const { return instruments_; }

    size_t size() const { return instruments_.size(); }
    bool empty() const { return instruments_.empty(); }

    bool contains(int64_t stableKey) const {
        return index_.find(stableKey) != index_.end();
    }

    std::optional<Instrument> find(int64_t stableKey) const {
        auto it = index_.find(stableKey);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return instruments_[it->second];
    }

    /**
     * @return true если инструмент добавлен, false если уже был
     */
    bool add(const Instrument& instrument) {
        if (contains(instrument.stableKey())) {
            return false;
        }
        index_[instrument.stableKey()] = instruments_.size();
        instruments_.push_back(instrument);
        return true;
    }

    bool remove(int64_t stableKey) {
        auto it = index_.find(stableKey);
        if (it == index_.end()) {
            return false;
        }
        instruments_.erase(instruments_.begin() + static_cast<std::ptrdiff_t>(it->second));
        rebuildIndex();
        return true;
    }

    void clear() {
        instruments_.clear();
        index_.clear();
    }

private:
    std::string name_;
    std::vector<Instrument> instruments_;
    std::unordered_map<int64_t, size_t> index_;

    void rebuildIndex() {
        index_.clear();
        for (size_t i = 0; i < instruments_.size(); ++i) {
            index_[instruments_[i].stableKey()] = i;
        }
    }
};

inline void to_json(nlohmann::json& j, const Universe& universe) {
    j = nlohmann::json{
        {"name", universe.name()},
        {"instruments", universe.instruments()}
    };
}

inline void from_json(const nlohmann::json& j, Universe& universe) {
    universe = Universe(
        j.at("name").get<std::string>(),
        j.value("instruments", std::vector<Instrument>{}));
}

} // namespace trader::domain
