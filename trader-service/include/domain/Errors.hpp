#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace trader::domain {

/**
 * @brief Шлюз отказал в соединении (временная ошибка, повторяется с backoff)
 */
class ConnectionRefusedError : public std::runtime_error {
public:
    explicit ConnectionRefusedError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Фатальная ошибка соединения (в т.ч. исчерпан лимит попыток)
 */
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Подключение прервано намеренным shutdown(), это не отказ шлюза
 */
class ConnectionAbortedError : public ConnectionError {
public:
    explicit ConnectionAbortedError(const std::string& message)
        : ConnectionError(message) {}
};

inline bool isConnectionAborted(std::exception_ptr error) {
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const ConnectionAbortedError&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

/**
 * @brief Операция требует установленного соединения со шлюзом
 */
class NotConnectedError : public std::runtime_error {
public:
    explicit NotConnectedError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace trader::domain
