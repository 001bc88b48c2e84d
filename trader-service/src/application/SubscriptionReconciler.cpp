#include "application/SubscriptionReconciler.hpp"
#include "domain/DateRange.hpp"
#include "domain/Errors.hpp"
#include "domain/Universe.hpp"
#include <boost/asio/post.hpp>
#include <iostream>
#include <stdexcept>

namespace trader::application {

SubscriptionReconciler::SubscriptionReconciler(
    boost::asio::io_context& ioContext,
    std::shared_ptr<ports::output::IGatewayLink> link,
    std::shared_ptr<domain::Book> book,
    std::shared_ptr<domain::Portfolio> portfolio,
    std::shared_ptr<InstrumentCatalog> catalog,
    std::shared_ptr<ports::output::IBarStore> barStore,
    std::shared_ptr<settings::MarketDataSettings> marketDataSettings,
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings)
    : ioContext_(ioContext)
    , link_(std::move(link))
    , book_(std::move(book))
    , portfolio_(std::move(portfolio))
    , catalog_(std::move(catalog))
    , barStore_(std::move(barStore))
    , marketDataSettings_(std::move(marketDataSettings))
    , gatewaySettings_(std::move(gatewaySettings))
{}

void SubscriptionReconciler::reestablish() {
    if (!link_->isConnected()) {
        throw domain::NotConnectedError("cannot re-establish subscriptions: gateway link is not connected");
    }

    disposeStreamObservers();

    std::cout << "[SubscriptionReconciler] Re-establishing subscriptions" << std::endl;

    auto book = book_;
    auto orderEvents = std::make_shared<CachedObserver<domain::OrderEvent>>(
        [book](const domain::OrderEvent& event) { book->apply(event); },
        [](std::exception_ptr error) { logHandlerError("order events", error); },
        true);
    orderEvents->subscribe(*link_->orderEvents());

    auto portfolio = portfolio_;
    auto positions = std::make_shared<CachedObserver<std::vector<domain::Position>>>(
        [portfolio](const std::vector<domain::Position>& batch) { portfolio->updatePositions(batch); },
        [](std::exception_ptr error) { logHandlerError("positions", error); },
        true);
    positions->subscribe(*link_->positions());

    std::weak_ptr<SubscriptionReconciler> weak = weak_from_this();
    auto portfolioItems = std::make_shared<CachedObserver<domain::PortfolioItem>>(
        [weak](const domain::PortfolioItem& item) {
            if (auto self = weak.lock()) {
                self->postPortfolioItem(item);
            }
        },
        [](std::exception_ptr error) { logHandlerError("portfolio items", error); },
        true);
    portfolioItems->subscribe(*link_->portfolioItems());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        orderEventsObserver_ = orderEvents;
        positionsObserver_ = positions;
        portfolioItemsObserver_ = portfolioItems;
    }

    // синхронный снимок не проходит через поток, подаём его тем же путём
    auto snapshot = link_->portfolio();
    for (const auto& item : snapshot) {
        postPortfolioItem(item);
    }

    link_->setMarketDataType(gatewaySettings_->getMarketDataType());

    auto openOrders = link_->openOrders();
    for (const auto& trade : openOrders) {
        book_->add(trade);
    }

    std::cout << "[SubscriptionReconciler] Subscriptions ready: " << snapshot.size()
              << " portfolio items, " << openOrders.size() << " open orders" << std::endl;
}

void SubscriptionReconciler::postPortfolioItem(const domain::PortfolioItem& item) {
    std::weak_ptr<SubscriptionReconciler> weak = weak_from_this();
    boost::asio::post(ioContext_, [weak, item]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        self->portfolio_->updatePortfolioItem(item);
        self->reconcilePortfolioItem(item);
    });
}

void SubscriptionReconciler::reconcilePortfolioItem(const domain::PortfolioItem& item) {
    const int64_t conId = item.contract.conId;
    try {
        auto instrument = catalog_->find(domain::PORTFOLIO_UNIVERSE, conId);
        if (!instrument) {
            // контракт позиции может быть неполным, ключ даёт только разрешённый инструмент
            auto resolved = resolve(item.contract);
            instrument = catalog_->find(domain::PORTFOLIO_UNIVERSE, resolved.stableKey());
            if (!instrument) {
                if (catalog_->addIfMissing(domain::PORTFOLIO_UNIVERSE, resolved)) {
                    std::cout << "[SubscriptionReconciler] Added " << resolved.symbol
                              << " (conId=" << resolved.conId << ") to portfolio universe" << std::endl;
                }
                instrument = resolved;
            }
        }

        if (!hasMarketDataSubscription(instrument->stableKey())) {
            openMarketData(*instrument);
        }
    } catch (const std::exception& e) {
        std::cerr << "[SubscriptionReconciler] Failed to reconcile portfolio item conId="
                  << conId << ": " << e.what() << std::endl;
    }
}

domain::Instrument SubscriptionReconciler::resolve(const domain::Contract& contract) {
    auto details = link_->contractDetails(contract);
    if (details.empty()) {
        throw std::runtime_error("no contract details for " + contract.symbol);
    }
    return details.front();
}

void SubscriptionReconciler::openMarketData(const domain::Instrument& instrument) {
    const std::string timeZone = instrument.timeZoneId.empty()
        ? marketDataSettings_->getDefaultTimeZone()
        : instrument.timeZoneId;
    auto dateRange = domain::DateRange::trailingDays(marketDataSettings_->getHistoryDays(), timeZone);

    auto subscription = std::make_shared<MarketDataSubscription>(
        instrument, dateRange, marketDataSettings_->getBarSize(),
        domain::WhatToShow::TRADES, barStore_);

    auto stream = link_->history(instrument.contract(), dateRange,
                                 marketDataSettings_->getBarSize(), domain::WhatToShow::TRADES);
    subscription->attach(*stream);

    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inserted = marketData_.emplace(instrument.stableKey(), subscription).second;
    }
    if (!inserted) {
        subscription->dispose();
        std::cerr << "[SubscriptionReconciler] Duplicate market data subscription for conId="
                  << instrument.conId << " disposed" << std::endl;
        return;
    }

    std::cout << "[SubscriptionReconciler] Subscribed to " << subscription->barSize() << " bars for "
              << instrument.symbol << " (conId=" << instrument.conId << "), "
              << dateRange.toString() << std::endl;
}

void SubscriptionReconciler::dropStreams() {
    disposeStreamObservers();

    std::map<int64_t, std::shared_ptr<MarketDataSubscription>> marketData;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        marketData.swap(marketData_);
    }
    for (auto& entry : marketData) {
        entry.second->dispose();
    }

    std::cout << "[SubscriptionReconciler] Dropped stream subscriptions and "
              << marketData.size() << " market data subscriptions" << std::endl;
}

size_t SubscriptionReconciler::marketDataSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return marketData_.size();
}

bool SubscriptionReconciler::hasMarketDataSubscription(int64_t stableKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return marketData_.find(stableKey) != marketData_.end();
}

std::vector<std::shared_ptr<MarketDataSubscription>> SubscriptionReconciler::marketDataSubscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<MarketDataSubscription>> result;
    for (const auto& entry : marketData_) {
        result.push_back(entry.second);
    }
    return result;
}

void SubscriptionReconciler::disposeStreamObservers() {
    std::shared_ptr<CachedObserver<domain::OrderEvent>> orderEvents;
    std::shared_ptr<CachedObserver<std::vector<domain::Position>>> positions;
    std::shared_ptr<CachedObserver<domain::PortfolioItem>> portfolioItems;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        orderEvents.swap(orderEventsObserver_);
        positions.swap(positionsObserver_);
        portfolioItems.swap(portfolioItemsObserver_);
    }
    if (orderEvents) orderEvents->dispose();
    if (positions) positions->dispose();
    if (portfolioItems) portfolioItems->dispose();
}

void SubscriptionReconciler::logHandlerError(const char* stream, std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::cerr << "[SubscriptionReconciler] Handler failed on " << stream << " stream: "
                  << e.what() << std::endl;
    }
}

} // namespace trader::application
