#pragma once

#include "domain/Errors.hpp"
#include "ports/output/IGatewayLink.hpp"
#include <PrimedObservable.hpp>
#include <Subject.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace trader::adapters::secondary {

/**
 * @brief Симулятор брокерского шлюза
 *
 * Всё происходит синхронно в вызывающем потоке:
 * - MKT ордер и LMT, пересекающий рынок, исполняются сразу по ask/bid
 * - остальные LMT висят в статусе OPEN до отмены
 * - исполнение обновляет позицию и элемент портфеля и публикует их в потоки
 *
 * Для тестов и отладки: refuseNextConnections(), simulateGatewayRestart(),
 * seedPosition(), publishBar(), setPrice().
 */
class SimulatedGatewayLink : public ports::output::IGatewayLink {
public:
    static constexpr int HISTORY_BARS = 5;

    explicit SimulatedGatewayLink(std::string account = "DU0000001")
        : account_(std::move(account))
        , positions_(std::make_shared<Subject<std::vector<domain::Position>>>())
        , portfolioItems_(std::make_shared<Subject<domain::PortfolioItem>>())
        , orderEvents_(std::make_shared<Subject<domain::OrderEvent>>())
    {
        seedInstrument(265598, "AAPL", "NASDAQ", "Apple Inc", 189.90, 190.10, 190.00);
        seedInstrument(272093, "MSFT", "NASDAQ", "Microsoft Corp", 410.00, 410.40, 410.20);
        seedInstrument(756733, "SPY", "ARCA", "SPDR S&P 500 ETF Trust", 500.00, 500.10, 500.05);
        seedInstrument(76792991, "TSLA", "NASDAQ", "Tesla Inc", 175.20, 175.40, 175.30);

        std::cout << "[SimulatedGatewayLink] Initialized with " << instruments_.size()
                  << " instruments" << std::endl;
    }

    // ========================================================================
    // СОЕДИНЕНИЕ
    // ========================================================================

    void connect(const std::string& host, int port, int clientId) override {
        std::vector<ports::output::LifecycleHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (refusals_ > 0) {
                --refusals_;
                throw domain::ConnectionRefusedError(
                    "connection refused by " + host + ":" + std::to_string(port));
            }
            connected_ = true;
            clientId_ = clientId;
            handlers = connectedHandlers_;
        }

        std::cout << "[SimulatedGatewayLink] Connected to " << host << ":" << port
                  << " as client " << clientId << std::endl;
        for (const auto& handler : handlers) {
            handler();
        }
    }

    void disconnect() override {
        std::vector<ports::output::LifecycleHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connected_) {
                return;
            }
            connected_ = false;
            handlers = disconnectedHandlers_;
        }

        std::cout << "[SimulatedGatewayLink] Disconnected" << std::endl;
        for (const auto& handler : handlers) {
            handler();
        }
    }

    bool isConnected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    int clientId() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return clientId_;
    }

    void onConnected(ports::output::LifecycleHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connectedHandlers_.push_back(std::move(handler));
    }

    void onDisconnected(ports::output::LifecycleHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnectedHandlers_.push_back(std::move(handler));
    }

    // ========================================================================
    // ПОТОКИ
    // ========================================================================

    std::shared_ptr<IObservable<std::vector<domain::Position>>> positions() override {
        return positions_;
    }

    std::shared_ptr<IObservable<domain::PortfolioItem>> portfolioItems() override {
        return portfolioItems_;
    }

    std::shared_ptr<IObservable<domain::OrderEvent>> orderEvents() override {
        return orderEvents_;
    }

    std::shared_ptr<IObservable<domain::Ticker>> ticker(
        const domain::Contract& contract, bool snapshot) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& market = marketFor(contract.conId);
        domain::Ticker tick(contract, market.bid, market.ask, market.last);
        if (snapshot) {
            return std::make_shared<PrimedObservable<domain::Ticker>>(std::vector<domain::Ticker>{tick});
        }
        return std::make_shared<PrimedObservable<domain::Ticker>>(
            std::vector<domain::Ticker>{tick}, market.ticks);
    }

    std::shared_ptr<IObservable<domain::Bar>> history(
        const domain::Contract& contract,
        const domain::DateRange& dateRange,
        const std::string& barSize,
        domain::WhatToShow whatToShow) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& market = marketFor(contract.conId);
        ++historyRequests_;

        std::vector<domain::Bar> bars;
        for (int i = HISTORY_BARS; i > 0; --i) {
            domain::Bar bar;
            bar.time = dateRange.end - std::chrono::minutes(i);
            bar.open = market.last;
            bar.high = market.ask;
            bar.low = market.bid;
            bar.close = market.last;
            bar.volume = 100.0 * i;
            bars.push_back(bar);
        }

        std::cout << "[SimulatedGatewayLink] History " << contract.symbol << " " << barSize << " "
                  << domain::toString(whatToShow) << " " << dateRange.toString() << std::endl;
        return std::make_shared<PrimedObservable<domain::Bar>>(std::move(bars), market.bars);
    }

    std::shared_ptr<IObservable<domain::Trade>> placeOrder(
        const domain::Contract& contract, const domain::Order& order) override
    {
        std::vector<domain::Trade> updates;
        std::vector<domain::OrderEvent> events;
        std::optional<domain::PortfolioItem> item;
        std::vector<domain::Position> positionsBatch;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireConnected();

            domain::Order placed = order;
            placed.orderId = nextOrderId_++;
            placed.permId = nextPermId_++;
            placed.account = account_;
            if (placed.clientId == 0) {
                placed.clientId = clientId_;
            }

            domain::Trade trade(resolveContract(contract), placed, domain::OrderStatus::SUBMITTED);
            updates.push_back(trade);
            events.emplace_back(domain::OrderEventType::NEW, trade);

            const auto& market = marketFor(trade.contract.conId);
            auto fillPrice = executablePrice(placed, market);
            if (fillPrice) {
                domain::Fill fill;
                fill.execId = "sim-" + std::to_string(placed.orderId);
                fill.shares = placed.totalQuantity;
                fill.price = *fillPrice;
                fill.time = std::chrono::system_clock::now();
                trade.fills.push_back(fill);
                trade.status = domain::OrderStatus::FILLED;

                item = applyFill(trade);
                positionsBatch = positionsSnapshot();
            } else {
                trade.status = domain::OrderStatus::OPEN;
            }

            trades_[placed.orderId] = trade;
            updates.push_back(trade);
            events.emplace_back(domain::OrderEventType::STATUS, trade);
        }

        for (const auto& event : events) {
            orderEvents_->publish(event);
        }
        if (item) {
            portfolioItems_->publish(*item);
            positions_->publish(positionsBatch);
        }

        return std::make_shared<PrimedObservable<domain::Trade>>(std::move(updates));
    }

    // ========================================================================
    // СНИМКИ
    // ========================================================================

    std::vector<domain::PortfolioItem> portfolio() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::PortfolioItem> result;
        for (const auto& entry : holdings_) {
            result.push_back(entry.second.item);
        }
        return result;
    }

    std::vector<domain::Trade> openOrders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Trade> result;
        for (const auto& entry : trades_) {
            if (!entry.second.isDone()) {
                result.push_back(entry.second);
            }
        }
        return result;
    }

    std::vector<domain::Instrument> contractDetails(const domain::Contract& contract) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
        ++contractDetailsRequests_;

        auto it = instruments_.find(contract.conId);
        if (it != instruments_.end()) {
            return {it->second};
        }
        for (const auto& entry : instruments_) {
            if (!contract.symbol.empty() && entry.second.symbol == contract.symbol) {
                return {entry.second};
            }
        }
        return {};
    }

    // ========================================================================
    // КОМАНДЫ
    // ========================================================================

    std::optional<domain::Trade> cancelOrder(const domain::Order& order) override {
        std::optional<domain::Trade> cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireConnected();
            cancelled = cancelLocked(order.orderId);
        }
        if (cancelled) {
            orderEvents_->publish(domain::OrderEvent(domain::OrderEventType::CANCEL, *cancelled));
        }
        return cancelled;
    }

    void setMarketDataType(domain::MarketDataType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        marketDataType_ = type;
        std::cout << "[SimulatedGatewayLink] Market data type " << domain::toString(type) << std::endl;
    }

    void globalCancel() override {
        std::vector<domain::Trade> cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireConnected();
            for (const auto& entry : trades_) {
                if (!entry.second.isDone()) {
                    cancelled.push_back(entry.second);
                }
            }
            for (auto& trade : cancelled) {
                trade = *cancelLocked(trade.orderId());
            }
        }
        for (const auto& trade : cancelled) {
            orderEvents_->publish(domain::OrderEvent(domain::OrderEventType::CANCEL, trade));
        }
        std::cout << "[SimulatedGatewayLink] Global cancel: " << cancelled.size() << " orders" << std::endl;
    }

    // ========================================================================
    // УПРАВЛЕНИЕ СИМУЛЯЦИЕЙ
    // ========================================================================

    /**
     * @brief Следующие n вызовов connect() бросят ConnectionRefusedError
     */
    void refuseNextConnections(int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        refusals_ = n;
    }

    /**
     * @brief Шлюз перезапустился: соединение рвётся, сессия должна переподключиться
     */
    void simulateGatewayRestart() {
        std::cout << "[SimulatedGatewayLink] Simulating gateway restart" << std::endl;
        disconnect();
    }

    /**
     * @brief Добавить позицию (с публикацией, если подключены)
     */
    void seedPosition(int64_t conId, double quantity, double averageCost) {
        domain::PortfolioItem item;
        std::vector<domain::Position> batch;
        bool connected;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto& instrument = instruments_.at(conId);
            const auto& market = marketFor(conId);

            Holding holding;
            holding.position = domain::Position(account_, instrument.contract(), quantity, averageCost);
            holding.item = domain::PortfolioItem(account_, instrument.contract(), quantity,
                                                 market.last, averageCost);
            holdings_[conId] = holding;
            item = holding.item;
            batch = positionsSnapshot();
            connected = connected_;
        }
        if (connected) {
            portfolioItems_->publish(item);
            positions_->publish(batch);
        }
    }

    /**
     * @brief Добавить открытый ордер (в т.ч. чужого клиента)
     */
    void addOpenOrder(const domain::Trade& trade) {
        std::lock_guard<std::mutex> lock(mutex_);
        trades_[trade.orderId()] = trade;
        if (trade.orderId() >= nextOrderId_) {
            nextOrderId_ = trade.orderId() + 1;
        }
    }

    void setPrice(int64_t conId, double bid, double ask, double last) {
        std::shared_ptr<Subject<domain::Ticker>> ticks;
        domain::Ticker tick;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& market = marketFor(conId);
            market.bid = bid;
            market.ask = ask;
            market.last = last;
            ticks = market.ticks;
            tick = domain::Ticker(instruments_.at(conId).contract(), bid, ask, last);
        }
        ticks->publish(tick);
    }

    void publishBar(int64_t conId, const domain::Bar& bar) {
        std::shared_ptr<Subject<domain::Bar>> bars;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bars = marketFor(conId).bars;
        }
        bars->publish(bar);
    }

    std::optional<domain::Instrument> instrument(int64_t conId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instruments_.find(conId);
        return it != instruments_.end() ? std::optional(it->second) : std::nullopt;
    }

    domain::MarketDataType marketDataType() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return marketDataType_;
    }

    int contractDetailsRequests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contractDetailsRequests_;
    }

    int historyRequests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return historyRequests_;
    }

private:
    struct Market {
        double bid = 0.0;
        double ask = 0.0;
        double last = 0.0;
        std::shared_ptr<Subject<domain::Ticker>> ticks = std::make_shared<Subject<domain::Ticker>>();
        std::shared_ptr<Subject<domain::Bar>> bars = std::make_shared<Subject<domain::Bar>>();
    };

    struct Holding {
        domain::Position position;
        domain::PortfolioItem item;
    };

    std::string account_;

    mutable std::mutex mutex_;
    bool connected_ = false;
    int clientId_ = 0;
    int refusals_ = 0;
    domain::MarketDataType marketDataType_ = domain::MarketDataType::LIVE;
    int64_t nextOrderId_ = 1;
    int64_t nextPermId_ = 1000001;
    int contractDetailsRequests_ = 0;
    int historyRequests_ = 0;

    std::vector<ports::output::LifecycleHandler> connectedHandlers_;
    std::vector<ports::output::LifecycleHandler> disconnectedHandlers_;

    std::shared_ptr<Subject<std::vector<domain::Position>>> positions_;
    std::shared_ptr<Subject<domain::PortfolioItem>> portfolioItems_;
    std::shared_ptr<Subject<domain::OrderEvent>> orderEvents_;

    std::map<int64_t, domain::Instrument> instruments_;
    std::map<int64_t, Market> markets_;
    std::map<int64_t, Holding> holdings_;
    std::map<int64_t, domain::Trade> trades_;

    void seedInstrument(int64_t conId, const std::string& symbol, const std::string& primaryExchange,
                        const std::string& longName, double bid, double ask, double last) {
        domain::Instrument instrument(conId, symbol, "SMART", "STK", "USD");
        instrument.primaryExchange = primaryExchange;
        instrument.longName = longName;
        instrument.timeZoneId = "US/Eastern";
        instruments_[conId] = instrument;

        auto& market = markets_[conId];
        market.bid = bid;
        market.ask = ask;
        market.last = last;
    }

    void requireConnected() const {
        if (!connected_) {
            throw domain::NotConnectedError("simulated gateway is not connected");
        }
    }

    Market& marketFor(int64_t conId) {
        auto it = markets_.find(conId);
        if (it == markets_.end()) {
            throw std::invalid_argument("unknown contract conId=" + std::to_string(conId));
        }
        return it->second;
    }

    domain::Contract resolveContract(const domain::Contract& contract) const {
        auto it = instruments_.find(contract.conId);
        return it != instruments_.end() ? it->second.contract() : contract;
    }

    static std::optional<double> executablePrice(const domain::Order& order, const Market& market) {
        const bool buy = order.action == domain::OrderAction::BUY;
        const double price = buy ? market.ask : market.bid;
        if (order.type == domain::OrderType::MARKET) {
            return price;
        }
        if (buy && order.limitPrice >= market.ask) {
            return market.ask;
        }
        if (!buy && order.limitPrice <= market.bid) {
            return market.bid;
        }
        return std::nullopt;
    }

    domain::PortfolioItem applyFill(const domain::Trade& trade) {
        const int64_t conId = trade.contract.conId;
        const double signedShares = trade.order.action == domain::OrderAction::BUY
            ? trade.filled() : -trade.filled();

        auto& holding = holdings_[conId];
        const double oldQuantity = holding.position.quantity;
        const double newQuantity = oldQuantity + signedShares;

        double averageCost = holding.position.averageCost;
        if (newQuantity == 0.0) {
            averageCost = 0.0;
        } else if (oldQuantity == 0.0 || (oldQuantity > 0) == (signedShares > 0)) {
            averageCost = (oldQuantity * averageCost + signedShares * trade.averageFillPrice()) / newQuantity;
        }

        const auto& market = marketFor(conId);
        holding.position = domain::Position(account_, trade.contract, newQuantity, averageCost);
        holding.item = domain::PortfolioItem(account_, trade.contract, newQuantity, market.last, averageCost);

        auto item = holding.item;
        if (newQuantity == 0.0) {
            holdings_.erase(conId);
        }
        return item;
    }

    std::vector<domain::Position> positionsSnapshot() const {
        std::vector<domain::Position> result;
        for (const auto& entry : holdings_) {
            result.push_back(entry.second.position);
        }
        return result;
    }

    std::optional<domain::Trade> cancelLocked(int64_t orderId) {
        auto it = trades_.find(orderId);
        if (it == trades_.end() || it->second.isDone()) {
            return std::nullopt;
        }
        it->second.status = domain::OrderStatus::CANCELLED;
        return it->second;
    }
};

} // namespace trader::adapters::secondary
