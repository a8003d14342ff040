/**
 * @file LotLedgerTest.cpp
 * @brief Unit tests for FIFO lot accounting
 */

#include <gtest/gtest.h>
#include "domain/LotLedger.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "../mocks/TestEvents.hpp"

using namespace ledger::domain;
using namespace ledger::tests;

class LotLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 100 @ 295.50, 50 @ 302.00, 75 @ 310.25
        ledger_.apply(buy("ABC", "2024-01-01", 100, "295.50", 1));
        ledger_.apply(buy("ABC", "2024-02-01", 50, "302.00", 2));
        ledger_.apply(buy("ABC", "2024-03-01", 75, "310.25", 3));
    }

    LotLedger ledger_;
};

// ============================================================================
// ПОКУПКИ И СРЕДНЯЯ
// ============================================================================

TEST_F(LotLedgerTest, Holding_ThreeBuys_WeightedAverageCost) {
    auto h = ledger_.holding("ABC");

    EXPECT_EQ(h.totalQuantity, 225);
    EXPECT_EQ(h.totalCost.toDecimalString(), "67918.75");
    EXPECT_EQ(h.openLots, 3);
    EXPECT_EQ(h.averageCost.toDecimalString(), "301.86");
}

TEST_F(LotLedgerTest, Lots_IdFromSymbolAndSequence) {
    auto lots = ledger_.lots("ABC");

    ASSERT_EQ(lots.size(), 3u);
    EXPECT_EQ(lots[0].lotId, "ABC-1");
    EXPECT_EQ(lots[2].lotId, "ABC-3");
    EXPECT_EQ(lots[1].unitCost.toDecimalString(), "302.00");
}

TEST(LotLedgerEmptyTest, Holding_UnknownSymbol_Zero) {
    LotLedger ledger;
    auto h = ledger.holding("NONE");

    EXPECT_TRUE(h.isEmpty());
    EXPECT_TRUE(h.totalCost.isZero());
    EXPECT_TRUE(ledger.holdings().empty());
}

// ============================================================================
// FIFO-СПИСАНИЕ
// ============================================================================

TEST_F(LotLedgerTest, Sell_ConsumesOldestLotFirst) {
    ledger_.apply(sell("ABC", "2024-04-01", 30, "320.00", 4));

    auto lots = ledger_.lots("ABC");
    EXPECT_EQ(lots[0].remainingQuantity, 70);
    EXPECT_EQ(lots[1].remainingQuantity, 50);
    EXPECT_EQ(lots[2].remainingQuantity, 75);

    auto h = ledger_.holding("ABC");
    EXPECT_EQ(h.totalQuantity, 195);
    EXPECT_EQ(h.totalCost.toDecimalString(), "59053.75");
    EXPECT_EQ(h.averageCost.toDecimalString(), "302.84");

    auto disposals = ledger_.disposals("ABC");
    ASSERT_EQ(disposals.size(), 1u);
    EXPECT_EQ(disposals[0].lotId, "ABC-1");
    EXPECT_EQ(disposals[0].quantity, 30);
    EXPECT_EQ(disposals[0].costBasis.toDecimalString(), "8865.00");
    EXPECT_EQ(disposals[0].proceeds->toDecimalString(), "9600.00");
    EXPECT_EQ(disposals[0].gain->toDecimalString(), "735.00");
    EXPECT_EQ(h.realizedPnl.toDecimalString(), "735.00");
}

TEST_F(LotLedgerTest, Sell_SpanningLots_OneDisposalPerLot) {
    ledger_.apply(sell("ABC", "2024-04-01", 120, "300.00", 4));

    auto disposals = ledger_.disposals("ABC");
    ASSERT_EQ(disposals.size(), 2u);
    EXPECT_EQ(disposals[0].lotId, "ABC-1");
    EXPECT_EQ(disposals[0].quantity, 100);
    EXPECT_EQ(disposals[1].lotId, "ABC-2");
    EXPECT_EQ(disposals[1].quantity, 20);
    EXPECT_EQ(disposals[1].lotOpenedDate, Date(2024, 2, 1));

    auto lots = ledger_.lots("ABC");
    EXPECT_EQ(lots[0].remainingQuantity, 0);
    EXPECT_EQ(lots[0].openedQuantity, 100);
    EXPECT_EQ(lots[1].remainingQuantity, 30);
    EXPECT_EQ(ledger_.holding("ABC").openLots, 2);
}

TEST_F(LotLedgerTest, Sell_WithFees_ProratedAndSumExactly) {
    // 10.00 комиссии на 120 бумаг: 100/120 и остаток
    auto event = sell("ABC", "2024-04-01", 120, "300.00", 4);
    event.fees = Money::fromString("10.00");
    ledger_.apply(event);

    auto disposals = ledger_.disposals("ABC");
    ASSERT_EQ(disposals.size(), 2u);
    EXPECT_EQ(disposals[0].fees->minorUnits(), 833);
    EXPECT_EQ(disposals[1].fees->minorUnits(), 167);
    EXPECT_EQ(disposals[0].fees->minorUnits() + disposals[1].fees->minorUnits(), 1000);
    EXPECT_EQ(disposals[0].proceeds->minorUnits(), 30000 * 100 - 833);
}

TEST_F(LotLedgerTest, SellAll_HoldingDisappears) {
    ledger_.apply(sell("ABC", "2024-04-01", 225, "300.00", 4));

    EXPECT_EQ(ledger_.remainingQuantity("ABC"), 0);
    EXPECT_TRUE(ledger_.holdings().empty());
    EXPECT_EQ(ledger_.lots("ABC").size(), 3u);
}

TEST_F(LotLedgerTest, MergerOut_NoProceedsNoGain) {
    ledger_.apply(action(EventKind::MERGER_OUT, "ABC", "2024-04-01", 100, 4));

    auto disposals = ledger_.disposals("ABC");
    ASSERT_EQ(disposals.size(), 1u);
    EXPECT_FALSE(disposals[0].proceeds.has_value());
    EXPECT_FALSE(disposals[0].gain.has_value());
    EXPECT_EQ(disposals[0].costBasis.toDecimalString(), "29550.00");
    EXPECT_TRUE(ledger_.holding("ABC").realizedPnl.isZero());
}

// ============================================================================
// КОРПОРАТИВНЫЕ ДЕЙСТВИЯ
// ============================================================================

TEST_F(LotLedgerTest, Bonus_QuantityUpCostUnchanged) {
    Money costBefore = ledger_.holding("ABC").totalCost;

    ledger_.apply(action(EventKind::BONUS, "ABC", "2024-04-01", 25, 4));

    auto h = ledger_.holding("ABC");
    EXPECT_EQ(h.totalQuantity, 250);
    EXPECT_EQ(h.totalCost, costBefore);
    EXPECT_EQ(h.averageCost.toDecimalString(), "271.68");
}

TEST(LotLedgerRearrangementTest, Rearrangement_OpensLotAtPurchaseDate) {
    LotLedger ledger;
    ledger.apply(buy("XYZ", "2024-05-01", 10, "100.00", 1));

    auto moved = action(EventKind::REARRANGEMENT, "XYZ", "2024-06-01", 5, 2);
    moved.memo.purchaseDate = Date(2024, 1, 1);
    ledger.apply(moved);
    ledger.apply(sell("XYZ", "2024-07-01", 5, "120.00", 3));

    auto disposals = ledger.disposals("XYZ");
    ASSERT_EQ(disposals.size(), 1u);
    EXPECT_EQ(disposals[0].lotId, "XYZ-2");
    EXPECT_EQ(disposals[0].lotOpenedDate, Date(2024, 1, 1));
    EXPECT_TRUE(disposals[0].costBasis.isZero());
    EXPECT_EQ(ledger.holding("XYZ").totalQuantity, 10);
}

// ============================================================================
// НАРУШЕНИЯ
// ============================================================================

TEST_F(LotLedgerTest, Sell_MoreThanHeld_ThrowsAndLeavesStateUntouched) {
    try {
        ledger_.apply(sell("ABC", "2024-04-01", 226, "300.00", 4));
        FAIL() << "expected InsufficientSharesError";
    } catch (const InsufficientSharesError& e) {
        EXPECT_EQ(e.requested(), 226);
        EXPECT_EQ(e.available(), 225);
        EXPECT_EQ(e.symbol(), "ABC");
        EXPECT_EQ(e.sequence(), 4);
    }

    EXPECT_EQ(ledger_.remainingQuantity("ABC"), 225);
    EXPECT_TRUE(ledger_.disposals("ABC").empty());
    EXPECT_EQ(ledger_.lots("ABC")[0].remainingQuantity, 100);
}

TEST_F(LotLedgerTest, Apply_EarlierThanApplied_ThrowsUnsorted) {
    EXPECT_THROW(ledger_.apply(buy("ABC", "2024-02-15", 10, "300.00", 9)), UnsortedEventsError);
    EXPECT_THROW(ledger_.apply(buy("ABC", "2024-03-01", 10, "300.00", 2)), UnsortedEventsError);
    EXPECT_EQ(ledger_.remainingQuantity("ABC"), 225);
}

TEST(LotLedgerBatchTest, ApplyEvents_Unsorted_RejectedBeforeAnyChange) {
    LotLedger ledger;
    std::vector<LedgerEvent> events = {
        buy("ABC", "2024-01-01", 10, "100.00", 1),
        buy("ABC", "2024-03-01", 10, "100.00", 3),
        sell("ABC", "2024-02-01", 5, "110.00", 2)
    };

    EXPECT_THROW(ledger.applyEvents(events), UnsortedEventsError);
    EXPECT_TRUE(ledger.lots("ABC").empty());
}

TEST(LotLedgerBatchTest, ApplyEvents_SymbolsIndependentlyOrdered) {
    LotLedger ledger;
    std::vector<LedgerEvent> events = {
        buy("ABC", "2024-03-01", 10, "100.00", 3),
        buy("XYZ", "2024-01-01", 10, "50.00", 1)
    };

    ledger.applyEvents(events);

    auto holdings = ledger.holdings();
    ASSERT_EQ(holdings.size(), 2u);
    EXPECT_EQ(holdings[0].symbol, "ABC");
    EXPECT_EQ(holdings[1].symbol, "XYZ");
}

TEST(LotLedgerPriceTest, CashEventWithoutPrice_ThrowsMissingPrice) {
    LotLedger ledger;

    EXPECT_THROW(ledger.apply(buy("ABC", "2024-01-01", 10, "", 1)), MissingPriceError);

    ledger.apply(buy("ABC", "2024-01-01", 10, "100.00", 2));
    EXPECT_THROW(ledger.apply(sell("ABC", "2024-02-01", 5, "", 3)), MissingPriceError);
    EXPECT_EQ(ledger.remainingQuantity("ABC"), 10);
}

TEST(LotLedgerPriceTest, NonPositiveQuantity_ThrowsReplayError) {
    LotLedger ledger;

    EXPECT_THROW(ledger.apply(buy("ABC", "2024-01-01", 0, "100.00", 1)), ReplayError);
}

// ============================================================================
// СОХРАНЕНИЕ КОЛИЧЕСТВА
// ============================================================================

TEST(LotLedgerConservationTest, RemainingEqualsNetQuantityAfterEveryEvent) {
    std::vector<LedgerEvent> events = {
        buy("ABC", "2024-01-01", 100, "200.00", 1),
        action(EventKind::BONUS, "ABC", "2024-01-15", 10, 2),
        sell("ABC", "2024-02-01", 35, "210.00", 3),
        buy("ABC", "2024-02-10", 40, "190.00", 4),
        action(EventKind::RIGHTS, "ABC", "2024-03-01", 5, 5),
        sell("ABC", "2024-03-05", 80, "220.00", 6),
        action(EventKind::DEMAT, "ABC", "2024-03-10", 10, 7),
        sell("ABC", "2024-04-01", 30, "230.00", 8)
    };

    LotLedger ledger;
    int64_t net = 0;
    for (const auto& e : events) {
        ledger.apply(e);
        net += isAcquisition(e.kind) ? e.quantity : -e.quantity;

        int64_t lotSum = 0;
        for (const auto& lot : ledger.lots("ABC")) {
            EXPECT_GE(lot.remainingQuantity, 0);
            EXPECT_LE(lot.remainingQuantity, lot.openedQuantity);
            lotSum += lot.remainingQuantity;
        }
        EXPECT_EQ(lotSum, net) << "after sequence " << e.sequence;
        EXPECT_EQ(ledger.remainingQuantity("ABC"), net);
    }
    EXPECT_EQ(net, 0);
}

TEST_F(LotLedgerTest, Discard_DropsSymbolState) {
    ledger_.discard("ABC");

    EXPECT_TRUE(ledger_.lots("ABC").empty());
    EXPECT_TRUE(ledger_.symbols().empty());
}
