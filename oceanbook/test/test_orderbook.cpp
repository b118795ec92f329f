#include "../src/orderbook.hpp"
#include "orderfactory.hpp"
#include <gtest/gtest.h>

using namespace oceanbook;
using namespace oceanbook::test;

class OrderBookTest : public ::testing::Test {
protected:
    OrderBook book{kSymbol};
};

TEST_F(OrderBookTest, AddLimitOrder)
{
    auto trades = book.submitOrder(limitOrder(1, Side::Buy, "100", "10", 1000));

    EXPECT_TRUE(trades.empty());
    EXPECT_EQ(1, book.bidCount());
    EXPECT_EQ(1u, book.bestBid()->id);
    EXPECT_FALSE(book.bestAsk().has_value());
    EXPECT_EQ(1, book.orderCount());
    EXPECT_TRUE(book.contains(1));
}

TEST_F(OrderBookTest, CancelOrder)
{
    book.submitOrder(limitOrder(1, Side::Buy, "100", "10", 1000));
    EXPECT_EQ(1, book.orderCount());

    bool cancelled = book.cancelOrder(1);
    EXPECT_TRUE(cancelled);
    EXPECT_EQ(0, book.orderCount());
    EXPECT_FALSE(book.bestBid().has_value());

    // Cancel non-existent, and cancel twice
    EXPECT_FALSE(book.cancelOrder(999));
    EXPECT_FALSE(book.cancelOrder(1));
}

TEST_F(OrderBookTest, CancelFilledOrderIsNotFound)
{
    book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 1000));
    book.submitOrder(limitOrder(2, Side::Buy, "100", "10", 2000));

    EXPECT_FALSE(book.cancelOrder(1));
    EXPECT_FALSE(book.cancelOrder(2));
}

TEST_F(OrderBookTest, CancelFollowsOrdersBetweenCollections)
{
    book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 1000));
    book.submitOrder(stopOrder(2, Side::Buy, "100", "99", "5", 1001));

    // Partially fills order 1 and moves order 2 from the stop side to the bids
    book.submitOrder(limitOrder(3, Side::Buy, "100", "4", 2000));
    ASSERT_EQ(0, book.stopOrderCount());

    // Each cancel finds the order where the index says it lives; a mismatch would halt the book
    EXPECT_TRUE(book.cancelOrder(1));
    EXPECT_TRUE(book.cancelOrder(2));
    EXPECT_FALSE(book.cancelOrder(2));
    EXPECT_FALSE(book.halted());
    EXPECT_EQ(0, book.orderCount());
}

TEST_F(OrderBookTest, FindOrder)
{
    book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 1000));
    book.submitOrder(limitOrder(2, Side::Buy, "100", "4", 2000));

    const Order& resting = book.findOrder(1);
    EXPECT_EQ(dec("4"), resting.filledQty);
    EXPECT_EQ(dec("6"), resting.pendingQty());

    EXPECT_THROW((void)book.findOrder(2), std::out_of_range);
    EXPECT_THROW((void)book.findOrder(999), std::out_of_range);
}

TEST_F(OrderBookTest, BestBidAskSpread)
{
    book.submitOrder(limitOrder(1, Side::Buy, "100", "10", 1000));
    book.submitOrder(limitOrder(2, Side::Sell, "101.5", "10", 1000));

    EXPECT_EQ(dec("100"), book.bestBid()->price.value());
    EXPECT_EQ(dec("101.5"), book.bestAsk()->price.value());
    EXPECT_EQ(dec("1.5"), book.spread().value());
}

TEST_F(OrderBookTest, DepthQuery)
{
    // Add 3 buy orders at different prices
    book.submitOrder(limitOrder(1, Side::Buy, "100", "10", 1000));
    book.submitOrder(limitOrder(2, Side::Buy, "99", "20", 1000));
    book.submitOrder(limitOrder(3, Side::Buy, "98", "30", 1000));

    // Add 1 more at top price
    book.submitOrder(limitOrder(4, Side::Buy, "100", "5.5", 1001));

    auto depth = book.bidDepth(2);
    ASSERT_EQ(2, depth.size());

    // Level 1: 100 (qty 15.5, count 2)
    EXPECT_EQ(dec("100"), depth[0].price);
    EXPECT_EQ(dec("15.5"), depth[0].totalQty);
    EXPECT_EQ(2, depth[0].orderCount);

    // Level 2: 99 (qty 20, count 1)
    EXPECT_EQ(dec("99"), depth[1].price);
    EXPECT_EQ(dec("20"), depth[1].totalQty);
    EXPECT_EQ(1, depth[1].orderCount);

    EXPECT_TRUE(book.askDepth(5).empty());
}

TEST_F(OrderBookTest, DepthReportsPendingQuantity)
{
    book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 1000));
    book.submitOrder(limitOrder(2, Side::Buy, "100", "3", 2000));

    auto depth = book.askDepth(1);
    ASSERT_EQ(1, depth.size());
    EXPECT_EQ(dec("7"), depth[0].totalQty);
}

TEST_F(OrderBookTest, DuplicateIdIsRejected)
{
    book.submitOrder(limitOrder(1, Side::Buy, "100", "10", 1000));

    EXPECT_THROW(book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 2000)), std::invalid_argument);

    // Book untouched
    EXPECT_EQ(1, book.orderCount());
    EXPECT_EQ(dec("10"), book.bestBid()->pendingQty());
    EXPECT_FALSE(book.halted());
}

TEST_F(OrderBookTest, WrongSymbolIsRejected)
{
    Order order = limitOrder(1, Side::Buy, "100", "10", 1000);
    order.symbol = "ETHUSDT";

    EXPECT_THROW(book.submitOrder(order), std::invalid_argument);
    EXPECT_EQ(0, book.orderCount());
}

TEST_F(OrderBookTest, ContractViolationHaltsBook)
{
    book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 1000));

    // A negative quantity slips past intake and breaks the fill invariant
    Order corrupt = limitOrder(2, Side::Buy, "100", "-5", 2000);
    EXPECT_THROW(book.submitOrder(corrupt), ContractViolation);
    EXPECT_TRUE(book.halted());

    EXPECT_THROW(book.submitOrder(limitOrder(3, Side::Buy, "100", "1", 3000)), BookHalted);
    EXPECT_THROW(book.cancelOrder(1), BookHalted);
}

TEST_F(OrderBookTest, TradeCallback)
{
    std::vector<Trade> seen;
    book.setTradeCallback([&seen](const Trade& trade) { seen.push_back(trade); });

    book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 1000));
    book.submitOrder(limitOrder(2, Side::Sell, "101", "10", 1000));
    auto trades = book.submitOrder(limitOrder(3, Side::Buy, "101", "15", 2000));

    ASSERT_EQ(2, seen.size());
    EXPECT_EQ(trades[0].makerOrderId, seen[0].makerOrderId);
    EXPECT_EQ(trades[1].makerOrderId, seen[1].makerOrderId);
}

TEST_F(OrderBookTest, SimpleMatch)
{
    // Sell 10 @ 100
    book.submitOrder(limitOrder(1, Side::Sell, "100", "10", 1000));

    // Buy 10 @ 100
    auto trades = book.submitOrder(limitOrder(2, Side::Buy, "100", "10", 2000));

    ASSERT_EQ(1, trades.size());
    EXPECT_EQ(dec("10"), trades[0].qty);
    EXPECT_EQ(dec("100"), trades[0].price);
    EXPECT_EQ(dec("1000"), trades[0].total);
    EXPECT_EQ(dec("100"), book.lastTradePrice().value());

    EXPECT_EQ(0, book.orderCount()); // Both fully filled
}
