#pragma once

#include "domain/Bar.hpp"
#include "domain/Instrument.hpp"
#include <string>

namespace trader::ports::output {

/**
 * @brief Хранилище тиков/баров (Output Port)
 *
 * Формат хранения: забота реализации.
 */
class IBarStore {
public:
    virtual ~IBarStore() = default;

    virtual void append(const domain::Instrument& instrument,
                        const std::string& barSize,
                        const domain::Bar& bar) = 0;

    virtual bool isAvailable() const = 0;
};

} // namespace trader::ports::output
