#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <mutex>

/**
 * @file Observable.hpp
 * @brief Базовые интерфейсы push-потоков событий
 * @details
 * IObservable<T>: источник событий (позиции, ордера, тики, бары).
 * IObserver<T>: получатель.
 * Subscription: хэндл подписки, который можно закрыть явно.
 */

/**
 * @brief Получатель событий потока
 */
template <typename T>
class IObserver {
public:
    virtual ~IObserver() = default;

    virtual void onNext(const T& value) = 0;

    /**
     * @brief Поток завершился ошибкой. Больше событий не будет.
     */
    virtual void onError(std::exception_ptr error) = 0;

    virtual void onCompleted() {}
};

/**
 * @brief Хэндл подписки
 *
 * Копии разделяют состояние: dispose() на любой копии отписывает всех.
 * Деструктор НЕ отписывает (как boost::signals2::connection).
 */
class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> disposer)
        : state_(std::make_shared<State>())
    {
        state_->disposer = std::move(disposer);
    }

    /**
     * @brief Отписаться. Повторный вызов ничего не делает.
     */
    void dispose() {
        if (!state_) return;

        std::function<void()> disposer;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->disposed) return;
            state_->disposed = true;
            disposer = std::move(state_->disposer);
        }
        if (disposer) {
            disposer();
        }
    }

    bool isActive() const {
        if (!state_) return false;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return !state_->disposed;
    }

private:
    struct State {
        std::mutex mutex;
        std::function<void()> disposer;
        bool disposed = false;
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief Источник событий
 */
template <typename T>
class IObservable {
public:
    virtual ~IObservable() = default;

    virtual Subscription subscribe(std::shared_ptr<IObserver<T>> observer) = 0;
};
