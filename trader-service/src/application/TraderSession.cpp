#include "application/TraderSession.hpp"
#include "application/OrderSizing.hpp"
#include "domain/Errors.hpp"
#include "domain/Universe.hpp"
#include <boost/asio/post.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace trader::application {

namespace {

void logAmountOrderFailure(const std::string& symbol, std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::cerr << "[TraderSession] Order for amount on " << symbol << " failed: " << e.what() << std::endl;
    }
}

} // namespace

TraderSession::TraderSession(
    boost::asio::io_context& ioContext,
    std::shared_ptr<ports::output::IGatewayLink> link,
    std::shared_ptr<ports::output::IUniverseStore> universeStore,
    std::shared_ptr<ports::output::IBarStore> barStore,
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings,
    std::shared_ptr<settings::BackoffSettings> backoffSettings,
    std::shared_ptr<settings::MarketDataSettings> marketDataSettings)
    : ioContext_(ioContext)
    , link_(std::move(link))
    , barStore_(std::move(barStore))
    , gatewaySettings_(std::move(gatewaySettings))
    , marketDataSettings_(std::move(marketDataSettings))
    , book_(std::make_shared<domain::Book>())
    , portfolio_(std::make_shared<domain::Portfolio>())
    , catalog_(std::make_shared<InstrumentCatalog>(std::move(universeStore)))
{
    reconciler_ = std::make_shared<SubscriptionReconciler>(
        ioContext, link_, book_, portfolio_, catalog_, barStore_,
        marketDataSettings_, gatewaySettings_);
    supervisor_ = std::make_shared<ConnectionSupervisor>(
        ioContext, link_, reconciler_, gatewaySettings_, std::move(backoffSettings));

    std::cout << "[TraderSession] Created (clientId=" << gatewaySettings_->getClientId() << ")" << std::endl;
}

void TraderSession::start(FatalHandler onFatal) {
    catalog_->load();
    catalog_->clear(domain::PORTFOLIO_UNIVERSE);

    supervisor_->onFatal(onFatal);
    supervisor_->connect([onFatal](std::exception_ptr error) {
        if (!error || !onFatal) {
            return;
        }
        if (domain::isConnectionAborted(error)) {
            std::cout << "[TraderSession] Connect stopped by shutdown" << std::endl;
            return;
        }
        onFatal(error);
    });
}

void TraderSession::shutdown() {
    supervisor_->shutdown();
}

std::shared_ptr<CachedObserver<domain::Trade>> TraderSession::placeOrder(
    const domain::Contract& contract, const domain::Order& order)
{
    domain::Order stamped = order;
    stamped.clientId = gatewaySettings_->getClientId();

    std::cout << "[TraderSession] Placing " << domain::toString(stamped.action) << " "
              << domain::toString(stamped.type) << " " << stamped.totalQuantity << " "
              << contract.symbol;
    if (stamped.type == domain::OrderType::LIMIT) {
        std::cout << " @ " << stamped.limitPrice;
    }
    std::cout << std::endl;

    auto observer = std::make_shared<CachedObserver<domain::Trade>>(
        nullptr,
        [symbol = contract.symbol](std::exception_ptr error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                std::cerr << "[TraderSession] Order for " << symbol << " failed: " << e.what() << std::endl;
            }
        });
    observer->subscribe(*link_->placeOrder(contract, stamped));
    return observer;
}

void TraderSession::placeOrderForAmount(
    const domain::Contract& contract,
    domain::OrderAction action,
    double amount,
    OrderHandler handler,
    bool debug)
{
    auto snapshot = std::make_shared<CachedObserver<domain::Ticker>>();
    snapshot->take(1);
    try {
        snapshot->subscribe(*link_->ticker(contract, true));
    } catch (const std::exception&) {
        auto error = std::current_exception();
        logAmountOrderFailure(contract.symbol, error);
        boost::asio::post(ioContext_, [handler, error]() { handler(error, nullptr); });
        return;
    }

    std::weak_ptr<TraderSession> weak = weak_from_this();
    snapshot->asyncWaitValue(
        ioContext_, marketDataSettings_->getSnapshotTimeout(),
        [weak, contract, action, amount, debug, handler](
            std::exception_ptr error, std::optional<domain::Ticker> ticker) {
            auto self = weak.lock();
            if (!self) {
                return;
            }

            std::shared_ptr<CachedObserver<domain::Trade>> observer;
            if (!error) {
                try {
                    const double price = OrderSizing::referencePrice(*ticker);
                    const double quantity = OrderSizing::quantityFor(amount, price);
                    const double limitPrice = OrderSizing::limitPrice(price, action, debug);

                    if (debug) {
                        std::cout << "[TraderSession] Debug mode: limit " << limitPrice
                                  << " instead of " << price << std::endl;
                    }
                    observer = self->placeOrder(contract, domain::Order::limit(action, quantity, limitPrice));
                } catch (const std::exception&) {
                    error = std::current_exception();
                }
            }

            if (error) {
                logAmountOrderFailure(contract.symbol, error);
                handler(error, nullptr);
                return;
            }
            handler(nullptr, observer);
        });
}

domain::CancelResult TraderSession::cancelOrder(int64_t orderId) {
    domain::CancelResult result;

    auto order = book_->getOrder(orderId);
    if (!order) {
        result.status = domain::CancelStatus::NOT_FOUND;
        result.message = "order " + std::to_string(orderId) + " not found";
        std::cerr << "[TraderSession] Cancel rejected: " << result.message << std::endl;
        return result;
    }

    const int sessionClientId = gatewaySettings_->getClientId();
    if (order->clientId != sessionClientId) {
        result.status = domain::CancelStatus::OWNERSHIP_MISMATCH;
        result.message = "order " + std::to_string(orderId) + " belongs to client " +
                         std::to_string(order->clientId) + ", session client is " +
                         std::to_string(sessionClientId);
        std::cerr << "[TraderSession] Cancel rejected: " << result.message << std::endl;
        return result;
    }

    result.status = domain::CancelStatus::ACCEPTED;
    result.trade = link_->cancelOrder(*order);
    result.message = "cancel requested";
    std::cout << "[TraderSession] Cancel requested for order " << orderId << std::endl;
    return result;
}

bool TraderSession::isConnected() const {
    return link_->isConnected();
}

domain::SessionStatus TraderSession::status() const {
    domain::SessionStatus status;
    status.gatewayConnected = link_->isConnected();
    status.storeConnected = barStore_->isAvailable();
    return status;
}

void TraderSession::redButton() {
    std::cerr << "[TraderSession] RED BUTTON: cancelling all orders" << std::endl;
    link_->globalCancel();
}

void TraderSession::reconnect() {
    supervisor_->reconnect();
}

std::vector<domain::Universe> TraderSession::getUniverses() const {
    return catalog_->getAll();
}

} // namespace trader::application
