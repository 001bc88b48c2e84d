#pragma once

#include <stdexcept>
#include <string>

/**
 * @file StreamException.hpp
 * @brief Исключение потока событий
 */

 /**
  * @brief Поток завершился без значения, либо истёк таймаут ожидания
  */
class StreamException : public std::runtime_error {
public:
    explicit StreamException(const std::string& message)
        : std::runtime_error(message) {}
};
