#pragma once

#include "application/InstrumentCatalog.hpp"
#include "application/MarketDataSubscription.hpp"
#include "domain/Book.hpp"
#include "domain/OrderEvent.hpp"
#include "domain/Portfolio.hpp"
#include "domain/PortfolioItem.hpp"
#include "domain/Position.hpp"
#include "ports/output/IBarStore.hpp"
#include "ports/output/IGatewayLink.hpp"
#include "settings/IGatewaySettings.hpp"
#include "settings/MarketDataSettings.hpp"
#include <CachedObserver.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace trader::application {

/**
 * @brief Восстановление подписок после (пере)подключения
 *
 * По свежему соединению строит согласованный набор живых подписок
 * и книгу ордеров, затем поддерживает вселенную "portfolio" и подписки
 * на бары по мере прихода позиций портфеля.
 *
 * Порядок reestablish():
 * 1. события ордеров → Book
 * 2. позиции → Portfolio
 * 3. элементы портфеля (поток + синхронный снимок) → Portfolio → reconcile
 * 4. тип рыночных данных
 * 5. снимок открытых ордеров → Book (всегда после шага 1)
 *
 * Повторный вызов сначала закрывает прежние подписки потоков.
 * Создавать через std::make_shared.
 */
class SubscriptionReconciler : public std::enable_shared_from_this<SubscriptionReconciler> {
public:
    SubscriptionReconciler(
        boost::asio::io_context& ioContext,
        std::shared_ptr<ports::output::IGatewayLink> link,
        std::shared_ptr<domain::Book> book,
        std::shared_ptr<domain::Portfolio> portfolio,
        std::shared_ptr<InstrumentCatalog> catalog,
        std::shared_ptr<ports::output::IBarStore> barStore,
        std::shared_ptr<settings::MarketDataSettings> marketDataSettings,
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings);

    /**
     * @brief Восстановить подписки на свежем соединении
     * @throws domain::NotConnectedError если соединения нет
     */
    void reestablish();

    /**
     * @brief Согласовать вселенную "portfolio" и подписку на бары для одного элемента
     *
     * Ошибка по элементу логируется с conId и прерывает только этот элемент.
     */
    void reconcilePortfolioItem(const domain::PortfolioItem& item);

    /**
     * @brief Закрыть подписки потоков и рыночных данных (соединение потеряно)
     */
    void dropStreams();

    size_t marketDataSubscriptionCount() const;

    bool hasMarketDataSubscription(int64_t stableKey) const;

    std::vector<std::shared_ptr<MarketDataSubscription>> marketDataSubscriptions() const;

private:
    boost::asio::io_context& ioContext_;
    std::shared_ptr<ports::output::IGatewayLink> link_;
    std::shared_ptr<domain::Book> book_;
    std::shared_ptr<domain::Portfolio> portfolio_;
    std::shared_ptr<InstrumentCatalog> catalog_;
    std::shared_ptr<ports::output::IBarStore> barStore_;
    std::shared_ptr<settings::MarketDataSettings> marketDataSettings_;
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;

    mutable std::mutex mutex_;
    std::shared_ptr<CachedObserver<domain::OrderEvent>> orderEventsObserver_;
    std::shared_ptr<CachedObserver<std::vector<domain::Position>>> positionsObserver_;
    std::shared_ptr<CachedObserver<domain::PortfolioItem>> portfolioItemsObserver_;
    std::map<int64_t, std::shared_ptr<MarketDataSubscription>> marketData_;

    void disposeStreamObservers();
    void postPortfolioItem(const domain::PortfolioItem& item);
    domain::Instrument resolve(const domain::Contract& contract);
    void openMarketData(const domain::Instrument& instrument);

    static void logHandlerError(const char* stream, std::exception_ptr error);
};

} // namespace trader::application
