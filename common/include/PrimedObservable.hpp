#pragma once

#include "Observable.hpp"
#include "Subject.hpp"
#include <exception>
#include <memory>
#include <vector>

/**
 * @file PrimedObservable.hpp
 * @brief Поток, который каждому новому подписчику сначала отдаёт заготовленные значения
 * @details
 * Используется для «история, затем живые данные» и для одноразовых снимков:
 * - live == nullptr: отдать значения и завершить поток
 * - иначе: отдать значения и подписать на live
 */
template <typename T>
class PrimedObservable : public IObservable<T> {
public:
    explicit PrimedObservable(std::vector<T> primed, std::shared_ptr<Subject<T>> live = nullptr)
        : primed_(std::move(primed))
        , live_(std::move(live))
    {}

    Subscription subscribe(std::shared_ptr<IObserver<T>> observer) override {
        if (!observer) {
            return Subscription();
        }

        for (const auto& value : primed_) {
            try {
                observer->onNext(value);
            } catch (const std::exception&) {
                observer->onError(std::current_exception());
                return Subscription();
            }
        }

        if (!live_) {
            observer->onCompleted();
            return Subscription();
        }
        return live_->subscribe(observer);
    }

private:
    std::vector<T> primed_;
    std::shared_ptr<Subject<T>> live_;
};
