#pragma once

#include "domain/Errors.hpp"
#include "ports/output/IGatewayLink.hpp"
#include <PrimedObservable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <Subject.hpp>
#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace trader::tests {

/**
 * @brief Mock реализация IGatewayLink для тестов
 *
 * Пишет журнал вызовов (calls()) для проверки порядка,
 * обработчики жизненного цикла вызывает синхронно, как реальный шлюз.
 */
class MockGatewayLink : public ports::output::IGatewayLink {
public:
    struct HistoryRequest {
        domain::Contract contract;
        domain::DateRange dateRange;
        std::string barSize;
        domain::WhatToShow whatToShow;
    };

    MockGatewayLink()
        : positions_(std::make_shared<Subject<std::vector<domain::Position>>>())
        , portfolioItems_(std::make_shared<Subject<domain::PortfolioItem>>())
        , orderEvents_(std::make_shared<Subject<domain::OrderEvent>>())
    {}

    // ========================================================================
    // Настройка ответов
    // ========================================================================

    void setRefusals(int n) { refusals_ = n; }
    void setConnectError(std::exception_ptr error) { connectError_ = error; }

    void setPortfolio(const std::vector<domain::PortfolioItem>& items) { portfolio_ = items; }
    void setOpenOrders(const std::vector<domain::Trade>& trades) { openOrders_ = trades; }

    void failContractDetails(int64_t conId) { failingDetails_.insert(conId); }
    void setTimeZone(int64_t conId, const std::string& tz) { timeZones_[conId] = tz; }

    /// contractDetails() по контракту без conId разрешает symbol в этот conId
    void resolveSymbol(const std::string& symbol, int64_t conId) { symbols_[symbol] = conId; }

    void setTicker(double bid, double ask, double last) {
        bid_ = bid;
        ask_ = ask;
        last_ = last;
        noTicker_ = false;
    }
    void setNoTicker() { noTicker_ = true; }

    /// ticker() публикует снимок отдельной задачей в ioContext, как шлюз со своим циклом
    void deliverTickerVia(boost::asio::io_context& ioContext) { tickerContext_ = &ioContext; }

    // ========================================================================
    // Управление событиями
    // ========================================================================

    void publishPortfolioItem(const domain::PortfolioItem& item) { portfolioItems_->publish(item); }
    void publishPositions(const std::vector<domain::Position>& batch) { positions_->publish(batch); }
    void publishOrderEvent(const domain::OrderEvent& event) { orderEvents_->publish(event); }

    void publishBar(int64_t conId, const domain::Bar& bar) { barsFor(conId)->publish(bar); }

    // ========================================================================
    // Проверки
    // ========================================================================

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    void clearCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

    int count(const std::string& call) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(calls_.begin(), calls_.end(), call));
    }

    /// -1 если вызова не было
    int indexOf(const std::string& call) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(calls_.begin(), calls_.end(), call);
        return it == calls_.end() ? -1 : static_cast<int>(it - calls_.begin());
    }

    size_t connectedHandlerCount() const { return connectedHandlers_.size(); }
    size_t disconnectedHandlerCount() const { return disconnectedHandlers_.size(); }

    size_t orderEventObservers() const { return orderEvents_->observerCount(); }
    size_t positionObservers() const { return positions_->observerCount(); }
    size_t portfolioItemObservers() const { return portfolioItems_->observerCount(); }
    size_t barObservers(int64_t conId) { return barsFor(conId)->observerCount(); }

    const std::vector<HistoryRequest>& historyRequests() const { return historyRequests_; }
    const std::vector<domain::Order>& placedOrders() const { return placedOrders_; }
    domain::MarketDataType marketDataType() const { return marketDataType_; }

    // ========================================================================
    // IGatewayLink
    // ========================================================================

    void connect(const std::string&, int, int clientId) override {
        record("connect");
        if (refusals_ > 0) {
            --refusals_;
            throw domain::ConnectionRefusedError("connection refused");
        }
        if (connectError_) {
            std::rethrow_exception(connectError_);
        }
        connected_ = true;
        clientId_ = clientId;
        for (const auto& handler : connectedHandlers_) {
            handler();
        }
    }

    void disconnect() override {
        record("disconnect");
        if (!connected_) {
            return;
        }
        connected_ = false;
        clientId_ = 0;
        for (const auto& handler : disconnectedHandlers_) {
            handler();
        }
    }

    bool isConnected() const override { return connected_; }
    int clientId() const override { return clientId_; }

    void onConnected(ports::output::LifecycleHandler handler) override {
        connectedHandlers_.push_back(std::move(handler));
    }

    void onDisconnected(ports::output::LifecycleHandler handler) override {
        disconnectedHandlers_.push_back(std::move(handler));
    }

    std::shared_ptr<IObservable<std::vector<domain::Position>>> positions() override {
        record("subscribe:positions");
        return positions_;
    }

    std::shared_ptr<IObservable<domain::PortfolioItem>> portfolioItems() override {
        record("subscribe:portfolioItems");
        return portfolioItems_;
    }

    std::shared_ptr<IObservable<domain::OrderEvent>> orderEvents() override {
        record("subscribe:orderEvents");
        return orderEvents_;
    }

    std::shared_ptr<IObservable<domain::Ticker>> ticker(const domain::Contract& contract, bool) override {
        record("ticker");
        std::vector<domain::Ticker> ticks;
        if (!noTicker_) {
            ticks.emplace_back(contract, bid_, ask_, last_);
        }
        if (!tickerContext_) {
            return std::make_shared<PrimedObservable<domain::Ticker>>(ticks);
        }
        auto subject = std::make_shared<Subject<domain::Ticker>>();
        boost::asio::post(*tickerContext_, [subject, ticks]() {
            for (const auto& tick : ticks) {
                subject->publish(tick);
            }
            subject->complete();
        });
        return subject;
    }

    std::shared_ptr<IObservable<domain::Bar>> history(
        const domain::Contract& contract,
        const domain::DateRange& dateRange,
        const std::string& barSize,
        domain::WhatToShow whatToShow) override
    {
        record("history:" + std::to_string(contract.conId));
        historyRequests_.push_back({contract, dateRange, barSize, whatToShow});
        return barsFor(contract.conId);
    }

    std::shared_ptr<IObservable<domain::Trade>> placeOrder(
        const domain::Contract& contract, const domain::Order& order) override
    {
        record("placeOrder");
        domain::Order placed = order;
        placed.orderId = nextOrderId_++;
        placedOrders_.push_back(placed);
        return std::make_shared<PrimedObservable<domain::Trade>>(
            std::vector<domain::Trade>{domain::Trade(contract, placed, domain::OrderStatus::SUBMITTED)});
    }

    std::vector<domain::PortfolioItem> portfolio() override {
        record("portfolio");
        return portfolio_;
    }

    std::vector<domain::Trade> openOrders() override {
        record("openOrders");
        return openOrders_;
    }

    std::vector<domain::Instrument> contractDetails(const domain::Contract& contract) override {
        record("contractDetails:" + std::to_string(contract.conId));
        if (failingDetails_.count(contract.conId)) {
            throw std::runtime_error("no security definition for conId " + std::to_string(contract.conId));
        }
        int64_t conId = contract.conId;
        auto symbol = symbols_.find(contract.symbol);
        if (conId == 0 && symbol != symbols_.end()) {
            conId = symbol->second;
        }
        domain::Instrument instrument(conId, contract.symbol, contract.exchange,
                                      contract.secType, contract.currency);
        auto tz = timeZones_.find(conId);
        instrument.timeZoneId = tz != timeZones_.end() ? tz->second : "US/Eastern";
        return {instrument};
    }

    std::optional<domain::Trade> cancelOrder(const domain::Order& order) override {
        record("cancelOrder");
        domain::Trade trade(domain::Contract(), order, domain::OrderStatus::CANCELLED);
        return trade;
    }

    void setMarketDataType(domain::MarketDataType type) override {
        record("setMarketDataType");
        marketDataType_ = type;
    }

    void globalCancel() override {
        record("globalCancel");
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;

    bool connected_ = false;
    int clientId_ = 0;
    int refusals_ = 0;
    std::exception_ptr connectError_;

    std::vector<ports::output::LifecycleHandler> connectedHandlers_;
    std::vector<ports::output::LifecycleHandler> disconnectedHandlers_;

    std::shared_ptr<Subject<std::vector<domain::Position>>> positions_;
    std::shared_ptr<Subject<domain::PortfolioItem>> portfolioItems_;
    std::shared_ptr<Subject<domain::OrderEvent>> orderEvents_;
    std::map<int64_t, std::shared_ptr<Subject<domain::Bar>>> bars_;

    std::vector<domain::PortfolioItem> portfolio_;
    std::vector<domain::Trade> openOrders_;
    std::set<int64_t> failingDetails_;
    std::map<int64_t, std::string> timeZones_;
    std::map<std::string, int64_t> symbols_;
    std::vector<HistoryRequest> historyRequests_;
    std::vector<domain::Order> placedOrders_;
    domain::MarketDataType marketDataType_ = domain::MarketDataType::LIVE;
    int64_t nextOrderId_ = 100;

    double bid_ = 100.0;
    double ask_ = 100.2;
    double last_ = 100.1;
    bool noTicker_ = false;
    boost::asio::io_context* tickerContext_ = nullptr;

    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    std::shared_ptr<Subject<domain::Bar>> barsFor(int64_t conId) {
        auto& subject = bars_[conId];
        if (!subject) {
            subject = std::make_shared<Subject<domain::Bar>>();
        }
        return subject;
    }
};

} // namespace trader::tests
