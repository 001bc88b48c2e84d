#pragma once

#include "application/ExponentialBackoff.hpp"
#include "application/SubscriptionReconciler.hpp"
#include "domain/enums/ConnectionState.hpp"
#include "ports/output/IGatewayLink.hpp"
#include "settings/BackoffSettings.hpp"
#include "settings/IGatewaySettings.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

namespace trader::application {

/**
 * @brief Управление соединением со шлюзом
 *
 * - connect(): подключение с экспоненциальным backoff на ConnectionRefusedError,
 *   ограниченным числом попыток и общим временем. Любая другая ошибка фатальна.
 * - событие connected: reestablish() у reconciler, затем сессия готова.
 * - событие disconnected: подписки сбрасываются, connect() запускается заново.
 *   Если он не удался, ошибка уходит в обработчик onFatal.
 *
 * Все переходы состояния выполняются в потоке io_context.
 * Создавать через std::make_shared.
 */
class ConnectionSupervisor : public std::enable_shared_from_this<ConnectionSupervisor> {
public:
    /// nullptr: подключились, иначе ошибка подключения
    using CompletionHandler = std::function<void(std::exception_ptr)>;
    using FatalHandler = std::function<void(std::exception_ptr)>;
    using ReadyHandler = std::function<void()>;

    ConnectionSupervisor(
        boost::asio::io_context& ioContext,
        std::shared_ptr<ports::output::IGatewayLink> link,
        std::shared_ptr<SubscriptionReconciler> reconciler,
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings,
        std::shared_ptr<settings::BackoffSettings> backoffSettings);

    /**
     * @brief Подключиться к шлюзу
     *
     * Если состояние не DISCONNECTED, handler сразу получает ConnectionError.
     * Исчерпание попыток/времени: ConnectionError.
     */
    void connect(CompletionHandler handler);

    /**
     * @brief Принудительно разорвать соединение; переподключение ведёт событие disconnected
     */
    void reconnect();

    /**
     * @brief Намеренное отключение без переподключения
     */
    void shutdown();

    void onFatal(FatalHandler handler);
    void onReady(ReadyHandler handler);

    domain::ConnectionState state() const;
    bool isReady() const { return ready_.load(); }

    /**
     * @brief Сколько раз вызывался link->connect() за всё время
     */
    int connectAttempts() const { return totalAttempts_.load(); }

private:
    boost::asio::io_context& ioContext_;
    std::shared_ptr<ports::output::IGatewayLink> link_;
    std::shared_ptr<SubscriptionReconciler> reconciler_;
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;
    std::shared_ptr<settings::BackoffSettings> backoffSettings_;

    ExponentialBackoff backoff_;
    boost::asio::steady_timer timer_;

    mutable std::mutex mutex_;
    domain::ConnectionState state_ = domain::ConnectionState::DISCONNECTED;
    FatalHandler fatalHandler_;
    ReadyHandler readyHandler_;
    bool handlersRegistered_ = false;

    std::atomic<bool> ready_{false};
    std::atomic<bool> shuttingDown_{false};
    std::atomic<int> totalAttempts_{0};

    void registerLifecycleHandlers();
    void attempt(int attempt, std::chrono::steady_clock::time_point started, CompletionHandler handler);
    void setState(domain::ConnectionState state);

    void handleConnected();
    void handleDisconnected();
    void raiseFatal(std::exception_ptr error);
};

} // namespace trader::application
