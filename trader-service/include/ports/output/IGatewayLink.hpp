#pragma once

#include "domain/Bar.hpp"
#include "domain/Contract.hpp"
#include "domain/DateRange.hpp"
#include "domain/Instrument.hpp"
#include "domain/Order.hpp"
#include "domain/OrderEvent.hpp"
#include "domain/PortfolioItem.hpp"
#include "domain/Position.hpp"
#include "domain/Ticker.hpp"
#include "domain/Trade.hpp"
#include "domain/enums/MarketDataType.hpp"
#include "domain/enums/WhatToShow.hpp"
#include <Observable.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trader::ports::output {

using LifecycleHandler = std::function<void()>;

/**
 * @brief Интерфейс соединения с брокерским шлюзом
 *
 * Сессия зависит только от этой поверхности событий и команд,
 * но не от протокола шлюза.
 *
 * События потоков могут приходить в потоке шлюза. Обработчики
 * жизненного цикла тоже вызываются из потока шлюза.
 */
class IGatewayLink {
public:
    virtual ~IGatewayLink() = default;

    // ============================================
    // СОЕДИНЕНИЕ
    // ============================================

    /**
     * @brief Установить соединение
     * @throws domain::ConnectionRefusedError шлюз недоступен (временная ошибка)
     * @throws std::exception любая другая ошибка: фатальная
     */
    virtual void connect(const std::string& host, int port, int clientId) = 0;

    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Id клиента, с которым установлено соединение
     */
    virtual int clientId() const = 0;

    virtual void onConnected(LifecycleHandler handler) = 0;

    virtual void onDisconnected(LifecycleHandler handler) = 0;

    // ============================================
    // ПОТОКИ
    // ============================================

    virtual std::shared_ptr<IObservable<std::vector<domain::Position>>> positions() = 0;

    virtual std::shared_ptr<IObservable<domain::PortfolioItem>> portfolioItems() = 0;

    /**
     * @brief События ордеров: new / status / modify / cancel / open
     */
    virtual std::shared_ptr<IObservable<domain::OrderEvent>> orderEvents() = 0;

    /**
     * @brief Котировки инструмента
     * @param snapshot true: один снимок цены и завершение потока
     */
    virtual std::shared_ptr<IObservable<domain::Ticker>> ticker(
        const domain::Contract& contract, bool snapshot) = 0;

    /**
     * @brief История баров за dateRange, затем живые бары
     */
    virtual std::shared_ptr<IObservable<domain::Bar>> history(
        const domain::Contract& contract,
        const domain::DateRange& dateRange,
        const std::string& barSize,
        domain::WhatToShow whatToShow) = 0;

    /**
     * @brief Разместить ордер
     * @return Поток обновлений Trade по этому ордеру
     */
    virtual std::shared_ptr<IObservable<domain::Trade>> placeOrder(
        const domain::Contract& contract, const domain::Order& order) = 0;

    // ============================================
    // СНИМКИ (синхронные)
    // ============================================

    virtual std::vector<domain::PortfolioItem> portfolio() = 0;

    /**
     * @brief Авторитетный список открытых ордеров всех клиентов
     */
    virtual std::vector<domain::Trade> openOrders() = 0;

    /**
     * @brief Разрешить контракт в полные реквизиты инструмента
     */
    virtual std::vector<domain::Instrument> contractDetails(const domain::Contract& contract) = 0;

    // ============================================
    // КОМАНДЫ
    // ============================================

    virtual std::optional<domain::Trade> cancelOrder(const domain::Order& order) = 0;

    virtual void setMarketDataType(domain::MarketDataType type) = 0;

    /**
     * @brief Отменить все ордера на счёте
     */
    virtual void globalCancel() = 0;
};

} // namespace trader::ports::output
