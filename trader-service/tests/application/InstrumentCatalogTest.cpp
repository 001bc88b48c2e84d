/**
 * @file InstrumentCatalogTest.cpp
 * @brief Unit tests for InstrumentCatalog (write-through over IUniverseStore)
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/InstrumentCatalog.hpp"
#include "../mocks/MockUniverseStore.hpp"

using namespace trader;
using namespace trader::application;
using namespace trader::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Truly;

class InstrumentCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<::testing::StrictMock<MockUniverseStore>>();
        catalog_ = std::make_shared<InstrumentCatalog>(store_);
    }

    static domain::Instrument instrument(int64_t conId, const std::string& symbol) {
        return domain::Instrument(conId, symbol, "SMART", "STK", "USD");
    }

    std::shared_ptr<::testing::StrictMock<MockUniverseStore>> store_;
    std::shared_ptr<InstrumentCatalog> catalog_;
};

TEST_F(InstrumentCatalogTest, Load_CachesAllUniverses) {
    EXPECT_CALL(*store_, getAll()).WillOnce(Return(std::vector<domain::Universe>{
        domain::Universe("tech", {instrument(265598, "AAPL")}),
        domain::Universe("etf", {instrument(756733, "SPY")}),
    }));

    catalog_->load();

    EXPECT_EQ(catalog_->getAll().size(), 2u);
    EXPECT_TRUE(catalog_->contains("tech", 265598));
    ASSERT_TRUE(catalog_->find("etf", 756733).has_value());
    EXPECT_EQ(catalog_->find("etf", 756733)->symbol, "SPY");
}

TEST_F(InstrumentCatalogTest, Get_UnknownUniverseQueriesStoreOnce) {
    EXPECT_CALL(*store_, get("portfolio")).WillOnce(Return(std::nullopt));

    auto first = catalog_->get("portfolio");
    auto second = catalog_->get("portfolio");

    EXPECT_TRUE(first.empty());
    EXPECT_EQ(second.name(), "portfolio");
}

TEST_F(InstrumentCatalogTest, AddIfMissing_PersistsOnlyNewInstruments) {
    EXPECT_CALL(*store_, get("portfolio")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*store_, update(Truly([](const domain::Universe& u) {
        return u.name() == "portfolio" && u.size() == 1;
    }))).Times(1);

    EXPECT_TRUE(catalog_->addIfMissing("portfolio", instrument(265598, "AAPL")));
    EXPECT_FALSE(catalog_->addIfMissing("portfolio", instrument(265598, "AAPL")));

    EXPECT_EQ(catalog_->get("portfolio").size(), 1u);
}

TEST_F(InstrumentCatalogTest, AddIfMissing_StoreFailureLeavesCacheUnchanged) {
    EXPECT_CALL(*store_, get("portfolio")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*store_, update(_)).WillOnce(Throw(std::runtime_error("db down")));

    EXPECT_THROW(catalog_->addIfMissing("portfolio", instrument(265598, "AAPL")), std::runtime_error);

    EXPECT_FALSE(catalog_->contains("portfolio", 265598));
}

TEST_F(InstrumentCatalogTest, Clear_PersistsEmptyUniverse) {
    EXPECT_CALL(*store_, getAll()).WillOnce(Return(std::vector<domain::Universe>{
        domain::Universe("portfolio", {instrument(1, "A"), instrument(2, "B")}),
    }));
    EXPECT_CALL(*store_, update(Truly([](const domain::Universe& u) {
        return u.name() == "portfolio" && u.empty();
    }))).Times(1);

    catalog_->load();
    catalog_->clear("portfolio");

    EXPECT_TRUE(catalog_->get("portfolio").empty());
}

TEST_F(InstrumentCatalogTest, Update_ReplacesUniverse) {
    domain::Universe tech("tech", {instrument(265598, "AAPL")});
    EXPECT_CALL(*store_, update(_)).Times(1);

    catalog_->update(tech);

    EXPECT_TRUE(catalog_->contains("tech", 265598));
}
