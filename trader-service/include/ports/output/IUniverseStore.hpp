#pragma once

#include "domain/Universe.hpp"
#include <optional>
#include <string>
#include <vector>

namespace trader::ports::output {

/**
 * @brief Хранилище вселенных инструментов (Output Port)
 *
 * Простой key-value по имени вселенной: загрузить / заменить целиком.
 */
class IUniverseStore {
public:
    virtual ~IUniverseStore() = default;

    virtual std::vector<domain::Universe> getAll() = 0;
    virtual std::optional<domain::Universe> get(const std::string& name) = 0;
    virtual void update(const domain::Universe& universe) = 0;
};

} // namespace trader::ports::output
