#pragma once

#include "domain/Bar.hpp"
#include "domain/DateRange.hpp"
#include "domain/Instrument.hpp"
#include "domain/enums/WhatToShow.hpp"
#include "ports/output/IBarStore.hpp"
#include <Observable.hpp>
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace trader::application {

/**
 * @brief Живая подписка на бары одного инструмента
 *
 * Сначала история за dateRange, затем новые бары. Каждый бар уходит в IBarStore.
 * Ошибка записи одного бара логируется и не закрывает подписку.
 */
class MarketDataSubscription : public IObserver<domain::Bar>,
                               public std::enable_shared_from_this<MarketDataSubscription> {
public:
    MarketDataSubscription(
        const domain::Instrument& instrument,
        const domain::DateRange& dateRange,
        const std::string& barSize,
        domain::WhatToShow whatToShow,
        std::shared_ptr<ports::output::IBarStore> barStore)
        : instrument_(instrument)
        , dateRange_(dateRange)
        , barSize_(barSize)
        , whatToShow_(whatToShow)
        , barStore_(std::move(barStore))
    {}

    void attach(IObservable<domain::Bar>& stream) {
        auto subscription = stream.subscribe(shared_from_this());
        std::lock_guard<std::mutex> lock(mutex_);
        subscription_ = subscription;
    }

    void dispose() {
        Subscription subscription;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscription = subscription_;
        }
        subscription.dispose();
    }

    void onNext(const domain::Bar& bar) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++barCount_;
            lastBar_ = bar;
        }
        try {
            barStore_->append(instrument_, barSize_, bar);
        } catch (const std::exception& e) {
            std::cerr << "[MarketDataSubscription] Failed to store bar for conId="
                      << instrument_.conId << ": " << e.what() << std::endl;
        }
    }

    void onError(std::exception_ptr error) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failed_ = true;
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            std::cerr << "[MarketDataSubscription] Bar stream failed for conId="
                      << instrument_.conId << ": " << e.what() << std::endl;
        }
    }

    void onCompleted() override {
        std::cout << "[MarketDataSubscription] Bar stream completed for conId="
                  << instrument_.conId << std::endl;
    }

    const domain::Instrument& instrument() const { return instrument_; }
    const domain::DateRange& dateRange() const { return dateRange_; }
    const std::string& barSize() const { return barSize_; }
    domain::WhatToShow whatToShow() const { return whatToShow_; }

    size_t barCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return barCount_;
    }

    std::optional<domain::Bar> lastBar() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastBar_;
    }

    bool isActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscription_.isActive() && !failed_;
    }

private:
    domain::Instrument instrument_;
    domain::DateRange dateRange_;
    std::string barSize_;
    domain::WhatToShow whatToShow_;
    std::shared_ptr<ports::output::IBarStore> barStore_;

    mutable std::mutex mutex_;
    Subscription subscription_;
    size_t barCount_ = 0;
    std::optional<domain::Bar> lastBar_;
    bool failed_ = false;
};

} // namespace trader::application
