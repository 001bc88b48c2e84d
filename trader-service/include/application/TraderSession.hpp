#pragma once

#include "application/ConnectionSupervisor.hpp"
#include "application/InstrumentCatalog.hpp"
#include "application/MarketDataSubscription.hpp"
#include "application/SubscriptionReconciler.hpp"
#include "domain/Book.hpp"
#include "domain/Portfolio.hpp"
#include "ports/input/ITraderSession.hpp"
#include "ports/output/IBarStore.hpp"
#include "ports/output/IGatewayLink.hpp"
#include "ports/output/IUniverseStore.hpp"
#include "settings/BackoffSettings.hpp"
#include "settings/IGatewaySettings.hpp"
#include "settings/MarketDataSettings.hpp"
#include <boost/asio/io_context.hpp>
#include <functional>
#include <memory>
#include <vector>

namespace trader::application {

/**
 * @brief Торговая сессия: соединение, книга ордеров, портфель, вселенные
 *
 * Владеет Book, Portfolio, InstrumentCatalog, SubscriptionReconciler
 * и ConnectionSupervisor. Всё состояние принадлежит экземпляру.
 */
class TraderSession : public ports::input::ITraderSession,
                      public std::enable_shared_from_this<TraderSession> {
public:
    using FatalHandler = ConnectionSupervisor::FatalHandler;

    TraderSession(
        boost::asio::io_context& ioContext,
        std::shared_ptr<ports::output::IGatewayLink> link,
        std::shared_ptr<ports::output::IUniverseStore> universeStore,
        std::shared_ptr<ports::output::IBarStore> barStore,
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings,
        std::shared_ptr<settings::BackoffSettings> backoffSettings,
        std::shared_ptr<settings::MarketDataSettings> marketDataSettings);

    /**
     * @brief Загрузить вселенные, очистить "portfolio", начать подключение
     * @param onFatal Получает ConnectionError при исчерпании попыток
     *        (и при первом подключении, и при переподключении)
     */
    void start(FatalHandler onFatal);

    void shutdown();

    /**
     * @brief Вызывается каждый раз, когда сессия готова (после reestablish)
     */
    void onReady(ConnectionSupervisor::ReadyHandler handler) { supervisor_->onReady(std::move(handler)); }

    bool isReady() const { return supervisor_->isReady(); }

    // ITraderSession

    std::shared_ptr<CachedObserver<domain::Trade>> placeOrder(
        const domain::Contract& contract, const domain::Order& order) override;

    void placeOrderForAmount(
        const domain::Contract& contract,
        domain::OrderAction action,
        double amount,
        OrderHandler handler,
        bool debug = false) override;

    domain::CancelResult cancelOrder(int64_t orderId) override;

    bool isConnected() const override;

    domain::SessionStatus status() const override;

    void redButton() override;

    void reconnect() override;

    std::vector<domain::Universe> getUniverses() const override;

    // Доступ на чтение

    const domain::Book& book() const { return *book_; }
    const domain::Portfolio& portfolio() const { return *portfolio_; }
    const InstrumentCatalog& catalog() const { return *catalog_; }

    std::vector<std::shared_ptr<MarketDataSubscription>> marketDataSubscriptions() const {
        return reconciler_->marketDataSubscriptions();
    }

    const ConnectionSupervisor& supervisor() const { return *supervisor_; }

private:
    boost::asio::io_context& ioContext_;
    std::shared_ptr<ports::output::IGatewayLink> link_;
    std::shared_ptr<ports::output::IBarStore> barStore_;
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;
    std::shared_ptr<settings::MarketDataSettings> marketDataSettings_;

    std::shared_ptr<domain::Book> book_;
    std::shared_ptr<domain::Portfolio> portfolio_;
    std::shared_ptr<InstrumentCatalog> catalog_;
    std::shared_ptr<SubscriptionReconciler> reconciler_;
    std::shared_ptr<ConnectionSupervisor> supervisor_;
};

} // namespace trader::application
