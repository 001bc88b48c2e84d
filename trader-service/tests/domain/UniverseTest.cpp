#include <gtest/gtest.h>
#include "domain/DateRange.hpp"
#include "domain/Universe.hpp"
#include <nlohmann/json.hpp>

using namespace trader::domain;

namespace {

Instrument instrument(int64_t conId, const std::string& symbol) {
    Instrument result(conId, symbol, "SMART", "STK", "USD");
    result.primaryExchange = "NASDAQ";
    result.timeZoneId = "US/Eastern";
    return result;
}

} // namespace

TEST(UniverseTest, Add_DuplicateStableKeyIsNoOp) {
    Universe universe("portfolio");

    EXPECT_TRUE(universe.add(instrument(265598, "AAPL")));
    EXPECT_FALSE(universe.add(instrument(265598, "AAPL")));
    EXPECT_TRUE(universe.add(instrument(272093, "MSFT")));

    EXPECT_EQ(universe.size(), 2u);
}

TEST(UniverseTest, Constructor_DropsDuplicates) {
    Universe universe("tech", {instrument(1, "A"), instrument(1, "A"), instrument(2, "B")});

    EXPECT_EQ(universe.size(), 2u);
}

TEST(UniverseTest, Remove_KeepsIndexConsistent) {
    Universe universe("tech", {instrument(1, "A"), instrument(2, "B"), instrument(3, "C")});

    EXPECT_TRUE(universe.remove(1));
    EXPECT_FALSE(universe.remove(1));

    EXPECT_FALSE(universe.contains(1));
    ASSERT_TRUE(universe.find(3).has_value());
    EXPECT_EQ(universe.find(3)->symbol, "C");
    EXPECT_EQ(universe.instruments().front().symbol, "B");
}

TEST(UniverseTest, Clear_EmptiesUniverse) {
    Universe universe("portfolio", {instrument(1, "A")});
    universe.clear();

    EXPECT_TRUE(universe.empty());
    EXPECT_FALSE(universe.contains(1));
    EXPECT_EQ(universe.name(), "portfolio");
}

TEST(UniverseTest, Json_UsesSnakeCaseKeys) {
    Universe universe("tech", {instrument(265598, "AAPL")});

    nlohmann::json json = universe;

    EXPECT_EQ(json["name"], "tech");
    ASSERT_EQ(json["instruments"].size(), 1u);
    EXPECT_EQ(json["instruments"][0]["con_id"], 265598);
    EXPECT_EQ(json["instruments"][0]["primary_exchange"], "NASDAQ");
    EXPECT_EQ(json["instruments"][0]["time_zone_id"], "US/Eastern");

    auto restored = json.get<Universe>();
    EXPECT_TRUE(restored.contains(265598));
}

TEST(InstrumentTest, FromJson_AppliesDefaults) {
    auto parsed = nlohmann::json::parse(R"({"con_id": 756733, "symbol": "SPY"})").get<Instrument>();

    EXPECT_EQ(parsed.stableKey(), 756733);
    EXPECT_EQ(parsed.secType, "STK");
    EXPECT_EQ(parsed.exchange, "SMART");
    EXPECT_EQ(parsed.currency, "USD");
    EXPECT_DOUBLE_EQ(parsed.minTick, 0.01);
}

TEST(InstrumentTest, Contract_CarriesPrimaryExchange) {
    auto contract = instrument(265598, "AAPL").contract();

    EXPECT_EQ(contract.conId, 265598);
    EXPECT_EQ(contract.primaryExchange, "NASDAQ");
}

TEST(DateRangeTest, TrailingDays_EndsAtNow) {
    auto now = std::chrono::system_clock::now();
    auto range = DateRange::trailingDays(30, "America/New_York", now);

    EXPECT_EQ(range.end, now);
    EXPECT_EQ(range.length(), std::chrono::hours(720));
    EXPECT_EQ(range.timeZone, "America/New_York");
}
