#include "../src/command.hpp"
#include "../src/instrumentmanager.hpp"
#include "../src/matchingengine.hpp"
#include <gtest/gtest.h>

using namespace oceanbook;

class IntegrationTest : public ::testing::Test {
protected:
    InstrumentManager instruments;
    std::unique_ptr<MatchingEngine> engine;

    void SetUp() override
    {
        // Manually add instrument for deterministic testing
        instruments.addInstrument({"BTCUSDT", "Bitcoin / Tether", Decimal::parse("0.01"), Decimal::parse("0.001")});
        engine = std::make_unique<MatchingEngine>(instruments);
    }

    std::vector<Trade> run(const std::string& line) { return engine->submit(parseCommand(line).order); }
};

TEST_F(IntegrationTest, FullTradingSession)
{
    // 1. Initial State: Empty
    EXPECT_TRUE(engine->bestBid("BTCUSDT") == std::nullopt);
    EXPECT_TRUE(engine->bestAsk("BTCUSDT") == std::nullopt);

    // 2. Add Liquidity (Sell Orders)
    auto trades1 = run(R"({"action": "submit", "id": 1, "member": 7, "symbol": "BTCUSDT", "side": "sell",
                           "price": "150.00", "qty": "1.000", "created_at": 1000})");
    EXPECT_TRUE(trades1.empty());

    run(R"({"action": "submit", "id": 2, "member": 7, "symbol": "BTCUSDT", "side": "sell",
            "price": "150.05", "qty": "0.5", "created_at": 1001})");

    auto asks = engine->depth("BTCUSDT", Side::Sell, 5);
    ASSERT_EQ(2, asks.size());
    EXPECT_EQ(Decimal::parse("150"), asks[0].price);
    EXPECT_EQ(Decimal(1), asks[0].totalQty);
    EXPECT_EQ(Decimal::parse("150.05"), asks[1].price);

    // 3. Add Liquidity (Buy Orders)
    run(R"({"action": "submit", "id": 3, "member": 8, "symbol": "BTCUSDT", "side": "buy",
            "price": "149.90", "qty": "2", "created_at": 2000})");

    // Sell stop below the bid, waiting for the price to fall
    run(R"({"action": "submit", "id": 5, "member": 9, "symbol": "BTCUSDT", "side": "sell",
            "stop_price": "149.95", "qty": "0.25", "created_at": 2500})");

    // 4. Crossing Order: buy 1.2 @ 150.00 fills sell 1 completely, 0.2 rests at 150.00
    auto trades2 = run(R"({"action": "submit", "id": 4, "member": 8, "symbol": "BTCUSDT", "side": "buy",
                           "price": "150.00", "qty": "1.2", "created_at": 3000})");

    ASSERT_EQ(1, trades2.size());
    EXPECT_EQ(Decimal(1), trades2[0].qty);
    EXPECT_EQ(Decimal(150), trades2[0].price);
    EXPECT_EQ(Decimal(150), trades2[0].total);
    EXPECT_EQ(1u, trades2[0].makerOrderId);
    EXPECT_EQ(4u, trades2[0].takerOrderId);
    EXPECT_EQ(7u, trades2[0].makerId);
    EXPECT_EQ(8u, trades2[0].takerId);

    EXPECT_EQ(Decimal::parse("150.05"), engine->bestAsk("BTCUSDT")->price.value());
    EXPECT_EQ(4u, engine->bestBid("BTCUSDT")->id);

    // 5. Market sell takes the 0.2 at 150, then 0.1 at 149.90 which triggers the stop
    auto trades3 = run(R"({"action": "submit", "id": 6, "member": 10, "symbol": "BTCUSDT", "side": "sell",
                           "qty": "0.3", "created_at": 4000})");

    ASSERT_EQ(3, trades3.size());
    EXPECT_EQ(4u, trades3[0].makerOrderId);
    EXPECT_EQ(Decimal::parse("0.2"), trades3[0].qty);
    EXPECT_EQ(3u, trades3[1].makerOrderId);
    EXPECT_EQ(Decimal::parse("149.9"), trades3[1].price);
    EXPECT_EQ(5u, trades3[2].takerOrderId);
    EXPECT_EQ(Decimal::parse("0.25"), trades3[2].qty);
    EXPECT_EQ(Decimal::parse("37.475"), trades3[2].total);

    // 6. Cancel what is left of the bid
    EXPECT_TRUE(engine->cancel("BTCUSDT", 3));
    EXPECT_FALSE(engine->cancel("BTCUSDT", 3));
    EXPECT_FALSE(engine->bestBid("BTCUSDT").has_value());
}
