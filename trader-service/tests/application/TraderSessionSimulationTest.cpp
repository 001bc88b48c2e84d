/**
 * @file TraderSessionSimulationTest.cpp
 * @brief TraderSession over SimulatedGatewayLink: start, restart, orders
 */

#include <gtest/gtest.h>
#include "application/TraderSession.hpp"
#include "adapters/secondary/InMemoryBarStore.hpp"
#include "adapters/secondary/InMemoryUniverseStore.hpp"
#include "adapters/secondary/SimulatedGatewayLink.hpp"
#include "../mocks/MockGatewaySettings.hpp"

using namespace trader;
using namespace trader::application;
using namespace trader::tests;
using namespace std::chrono_literals;

class TraderSessionSimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        link_ = std::make_shared<adapters::secondary::SimulatedGatewayLink>();
        link_->seedPosition(265598, 10, 182.50);
        link_->seedPosition(272093, 5, 398.75);

        barStore_ = std::make_shared<adapters::secondary::InMemoryBarStore>();
        session_ = std::make_shared<TraderSession>(
            io_, link_, std::make_shared<adapters::secondary::InMemoryUniverseStore>(), barStore_,
            std::make_shared<MockGatewaySettings>(7),
            std::make_shared<settings::BackoffSettings>(5, 2000ms, 1ms, 5ms, false),
            std::make_shared<settings::MarketDataSettings>());
    }

    void drain() {
        io_.restart();
        io_.run();
    }

    boost::asio::io_context io_;
    std::shared_ptr<adapters::secondary::SimulatedGatewayLink> link_;
    std::shared_ptr<adapters::secondary::InMemoryBarStore> barStore_;
    std::shared_ptr<TraderSession> session_;
    std::exception_ptr fatal_;
};

TEST_F(TraderSessionSimulationTest, Start_SubscribesToHoldings) {
    session_->start([this](std::exception_ptr e) { fatal_ = e; });
    drain();

    ASSERT_EQ(fatal_, nullptr);
    EXPECT_TRUE(session_->isReady());
    EXPECT_EQ(session_->catalog().get(domain::PORTFOLIO_UNIVERSE).size(), 2u);
    EXPECT_EQ(session_->marketDataSubscriptions().size(), 2u);
    EXPECT_EQ(link_->marketDataType(), domain::MarketDataType::DELAYED);
    EXPECT_EQ(barStore_->totalBars(), 2u * adapters::secondary::SimulatedGatewayLink::HISTORY_BARS);
}

TEST_F(TraderSessionSimulationTest, GatewayRestart_ReopensOneSubscriptionPerHolding) {
    link_->refuseNextConnections(2);
    session_->start([this](std::exception_ptr e) { fatal_ = e; });
    drain();
    ASSERT_TRUE(session_->isReady());

    link_->refuseNextConnections(1);
    link_->simulateGatewayRestart();
    drain();

    ASSERT_EQ(fatal_, nullptr);
    EXPECT_TRUE(session_->isReady());
    EXPECT_EQ(session_->marketDataSubscriptions().size(), 2u);
    EXPECT_EQ(link_->historyRequests(), 4);
    EXPECT_EQ(link_->contractDetailsRequests(), 2);
    EXPECT_EQ(session_->supervisor().connectAttempts(), 5);
}

TEST_F(TraderSessionSimulationTest, NewHoldingFromFill_IsReconciled) {
    session_->start([this](std::exception_ptr e) { fatal_ = e; });
    drain();

    std::shared_ptr<CachedObserver<domain::Trade>> observer;
    session_->placeOrderForAmount(
        domain::Contract(756733, "SPY", "STK", "SMART", "USD"), domain::OrderAction::BUY, 1000.0,
        [&observer](std::exception_ptr error, std::shared_ptr<CachedObserver<domain::Trade>> placed) {
            EXPECT_EQ(error, nullptr);
            observer = placed;
        });
    drain();
    ASSERT_NE(observer, nullptr);
    // BUY LMT по bid не пересекает ask и остаётся открытым
    EXPECT_EQ(observer->waitValue(1s).status, domain::OrderStatus::OPEN);

    session_->placeOrder(domain::Contract(756733, "SPY", "STK", "SMART", "USD"),
                         domain::Order::market(domain::OrderAction::BUY, 2));
    drain();

    EXPECT_TRUE(session_->catalog().contains(domain::PORTFOLIO_UNIVERSE, 756733));
    EXPECT_EQ(session_->marketDataSubscriptions().size(), 3u);
    EXPECT_EQ(session_->book().size(), 2u);
    EXPECT_EQ(session_->book().openTrades().size(), 1u);
}

TEST_F(TraderSessionSimulationTest, CancelOwnRestingOrder) {
    session_->start([this](std::exception_ptr e) { fatal_ = e; });
    drain();

    auto observer = session_->placeOrder(
        domain::Contract(265598, "AAPL", "STK", "SMART", "USD"),
        domain::Order::limit(domain::OrderAction::BUY, 1, 100.0));
    auto orderId = observer->waitValue(1s).orderId();

    auto result = session_->cancelOrder(orderId);

    EXPECT_TRUE(result.accepted());
    EXPECT_EQ(session_->book().getTrade(orderId)->status, domain::OrderStatus::CANCELLED);
}
