#pragma once

#include "Observable.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @file Subject.hpp
 * @brief Multicast-поток: рассылает каждое событие всем подписчикам
 * @details
 * Список подписчиков копируется под мьютексом, вызовы идут без блокировки,
 * поэтому подписчик может отписаться прямо из onNext().
 *
 * Если onNext() подписчика бросает исключение, ошибка уходит этому же
 * подписчику через onError(), остальные продолжают получать события.
 *
 * Создавать только через std::make_shared: отписка держит weak_ptr на Subject.
 *
 * Thread-safe: да
 */
template <typename T>
class Subject : public IObservable<T>,
                public std::enable_shared_from_this<Subject<T>> {
public:
    Subject() = default;

    Subject(const Subject&) = delete;
    Subject& operator=(const Subject&) = delete;

    Subscription subscribe(std::shared_ptr<IObserver<T>> observer) override {
        if (!observer) {
            return Subscription();
        }

        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = nextId_++;
            observers_[id] = observer;
        }

        std::weak_ptr<Subject<T>> weak = this->weak_from_this();
        return Subscription([weak, id]() {
            if (auto self = weak.lock()) {
                self->remove(id);
            }
        });
    }

    /**
     * @brief Разослать событие всем подписчикам
     */
    void publish(const T& value) {
        for (const auto& observer : snapshot()) {
            try {
                observer->onNext(value);
            } catch (const std::exception&) {
                observer->onError(std::current_exception());
            }
        }
    }

    /**
     * @brief Завершить поток ошибкой (подписчики удаляются)
     */
    void fail(std::exception_ptr error) {
        for (const auto& observer : drain()) {
            observer->onError(error);
        }
    }

    /**
     * @brief Завершить поток (подписчики удаляются)
     */
    void complete() {
        for (const auto& observer : drain()) {
            observer->onCompleted();
        }
    }

    size_t observerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return observers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<IObserver<T>>> observers_;
    uint64_t nextId_ = 1;

    void remove(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        observers_.erase(id);
    }

    std::vector<std::shared_ptr<IObserver<T>>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<IObserver<T>>> result;
        result.reserve(observers_.size());
        for (const auto& entry : observers_) {
            result.push_back(entry.second);
        }
        return result;
    }

    std::vector<std::shared_ptr<IObserver<T>>> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<IObserver<T>>> result;
        result.reserve(observers_.size());
        for (auto& entry : observers_) {
            result.push_back(std::move(entry.second));
        }
        observers_.clear();
        return result;
    }
};
