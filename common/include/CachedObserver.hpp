#pragma once

#include "Observable.hpp"
#include "StreamException.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @file CachedObserver.hpp
 * @brief Подписчик с кэшем последнего значения
 * @details
 * Превращает push-поток в pull-интерфейс: подписывается один раз,
 * запоминает последнее значение, а любое количество вызывающих может
 * дождаться его без повторной подписки: asyncWaitValue() в цикле
 * io_context или блокирующим waitValue() вне его.
 *
 * Используется для одноразовых запросов поверх долгоживущих потоков
 * (снимок цены, результат ордера) и как обработчик потоков сессии.
 *
 * @example
 * ```cpp
 * auto observer = std::make_shared<CachedObserver<Ticker>>();
 * observer->take(1);
 * observer->subscribe(*link->ticker(contract, true));
 * observer->asyncWaitValue(io, std::chrono::seconds(5),
 *     [](std::exception_ptr error, std::optional<Ticker> tick) { ... });
 * ```
 *
 * Thread-safe: да
 */
template <typename T>
class CachedObserver : public IObserver<T>,
                       public std::enable_shared_from_this<CachedObserver<T>> {
public:
    using NextHandler = std::function<void(const T&)>;
    using ErrorHandler = std::function<void(std::exception_ptr)>;
    /// Либо ошибка, либо значение
    using ValueHandler = std::function<void(std::exception_ptr, std::optional<T>)>;

    CachedObserver() = default;

    /**
     * @param onNext Обработчик каждого значения
     * @param onError Обработчик ошибки потока
     * @param captureHandlerExceptions Исключение из onNext превращается
     *        в ошибку наблюдателя, а не уходит в источник
     */
    explicit CachedObserver(
        NextHandler onNext,
        ErrorHandler onError = nullptr,
        bool captureHandlerExceptions = false)
        : onNext_(std::move(onNext))
        , onError_(std::move(onError))
        , captureHandlerExceptions_(captureHandlerExceptions)
    {}

    CachedObserver(const CachedObserver&) = delete;
    CachedObserver& operator=(const CachedObserver&) = delete;

    /**
     * @brief Ограничить количество наблюдаемых значений
     *
     * После maxValues-го значения наблюдатель сам отписывается,
     * последующие события игнорируются. 0: без ограничения.
     */
    CachedObserver& take(size_t maxValues) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxValues_ = maxValues;
        return *this;
    }

    /**
     * @brief Подписаться на поток и начать кэшировать значения
     */
    void subscribe(IObservable<T>& stream) {
        auto subscription = stream.subscribe(this->shared_from_this());

        bool disposeNow = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscription_ = subscription;
            // синхронный источник мог уже исчерпать лимит внутри subscribe()
            disposeNow = limitReached_ || streamFailed_;
        }
        if (disposeNow) {
            subscription.dispose();
        }
    }

    void onNext(const T& value) override {
        NextHandler handler;
        Subscription finished;
        bool limitHit = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (streamFailed_ || limitReached_) {
                return;
            }
            value_ = value;
            ++received_;
            if (maxValues_ > 0 && received_ >= maxValues_) {
                limitReached_ = true;
                limitHit = true;
                finished = subscription_;
            }
            handler = onNext_;
        }

        if (handler) {
            try {
                handler(value);
            } catch (const std::exception&) {
                if (!captureHandlerExceptions_) {
                    notifyWaiters();
                    throw;
                }
                recordError(std::current_exception());
            }
        }

        notifyWaiters();

        if (limitHit) {
            finished.dispose();
        }
    }

    void onError(std::exception_ptr error) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (streamFailed_) {
                return;
            }
            streamFailed_ = true;
        }
        recordError(error);
    }

    void onCompleted() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_ = true;
        }
        notifyWaiters();
    }

    /**
     * @brief Дождаться значения, не блокируя цикл событий
     *
     * handler всегда вызывается через boost::asio::post в ioContext, ровно один раз:
     * со значением, с ошибкой потока, со StreamException по завершению
     * без значений или по истечении timeout.
     */
    void asyncWaitValue(boost::asio::io_context& ioContext,
                        std::chrono::milliseconds timeout,
                        ValueHandler handler) {
        auto wait = std::make_shared<PendingWait>(ioContext, std::move(handler));
        std::exception_ptr error;
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isResolved()) {
                wait->timer = std::make_unique<boost::asio::steady_timer>(ioContext, timeout);
                wait->timer->async_wait([wait, timeout](const boost::system::error_code& ec) {
                    if (ec || wait->done.exchange(true)) {
                        return;
                    }
                    wait->handler(std::make_exception_ptr(StreamException(
                        "timed out after " + std::to_string(timeout.count()) + "ms waiting for a value")),
                        std::nullopt);
                });
                waiters_.push_back(wait);
                return;
            }
            outcome(error, value);
        }
        complete(wait, error, value);
    }

    /**
     * @brief Дождаться значения (блокирующий вызов, не из потока цикла событий)
     *
     * Возвращает сразу, если значение уже есть.
     * @throws Исходную ошибку потока, если она пришла (даже после значения)
     * @throws StreamException если поток завершился без значений
     */
    T waitValue() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return isResolved(); });
        return resolved();
    }

    /**
     * @brief Дождаться значения не дольше timeout
     * @throws StreamException по таймауту
     */
    T waitValue(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return isResolved(); })) {
            throw StreamException("timed out after " + std::to_string(timeout.count()) +
                                  "ms waiting for a value");
        }
        return resolved();
    }

    std::optional<T> value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    bool hasValue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

    bool hasError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_ != nullptr;
    }

    bool isCompleted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    size_t receivedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    /**
     * @brief Отписаться от потока (кэш сохраняется)
     */
    void dispose() {
        Subscription subscription;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscription = subscription_;
        }
        subscription.dispose();
    }

    bool isSubscribed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscription_.isActive();
    }

private:
    struct PendingWait {
        PendingWait(boost::asio::io_context& io, ValueHandler h)
            : ioContext(io), handler(std::move(h)) {}

        boost::asio::io_context& ioContext;
        ValueHandler handler;
        std::unique_ptr<boost::asio::steady_timer> timer;
        std::atomic<bool> done{false};
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    NextHandler onNext_;
    ErrorHandler onError_;
    bool captureHandlerExceptions_ = false;

    Subscription subscription_;
    std::optional<T> value_;
    std::exception_ptr error_;
    bool streamFailed_ = false;
    bool completed_ = false;
    bool limitReached_ = false;
    size_t maxValues_ = 0;
    size_t received_ = 0;
    std::vector<std::shared_ptr<PendingWait>> waiters_;

    /**
     * Ошибка обработчика (в режиме захвата) не закрывает поток:
     * следующие значения продолжают приходить.
     */
    void recordError(std::exception_ptr error) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            error_ = error;
            handler = onError_;
        }
        notifyWaiters();

        if (handler) {
            try {
                handler(error);
            } catch (const std::exception& e) {
                std::cerr << "[CachedObserver] Error handler failed: " << e.what() << std::endl;
            }
        }
    }

    void notifyWaiters() {
        std::vector<std::shared_ptr<PendingWait>> waiters;
        std::exception_ptr error;
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (isResolved()) {
                waiters.swap(waiters_);
                outcome(error, value);
            }
        }
        cv_.notify_all();

        for (auto& wait : waiters) {
            complete(wait, error, value);
        }
    }

    static void complete(std::shared_ptr<PendingWait> wait,
                         std::exception_ptr error, std::optional<T> value) {
        boost::asio::io_context& ioContext = wait->ioContext;
        boost::asio::post(ioContext, [wait, error, value]() {
            if (wait->timer) {
                wait->timer->cancel();
            }
            if (wait->done.exchange(true)) {
                return;
            }
            wait->handler(error, value);
        });
    }

    /// Под mutex_, только когда isResolved()
    void outcome(std::exception_ptr& error, std::optional<T>& value) const {
        if (error_) {
            error = error_;
        } else if (value_) {
            value = value_;
        } else {
            error = std::make_exception_ptr(StreamException("stream completed without a value"));
        }
    }

    bool isResolved() const {
        return error_ != nullptr || value_.has_value() || completed_;
    }

    T resolved() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
        if (value_) {
            return *value_;
        }
        throw StreamException("stream completed without a value");
    }
};
