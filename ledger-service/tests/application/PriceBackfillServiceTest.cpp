/**
 * @file PriceBackfillServiceTest.cpp
 * @brief Unit tests for PriceBackfillService
 */

#include <gtest/gtest.h>
#include "application/PriceBackfillService.hpp"
#include "../mocks/FakeLedgerRepository.hpp"
#include "../mocks/TestEvents.hpp"

using namespace ledger::application;
using namespace ledger::domain;
using namespace ledger::tests;

namespace {

PriceBackfillEntry entry(const std::string& symbol, const std::string& day,
                         int64_t quantity, const std::string& price) {
    PriceBackfillEntry e;
    e.symbol = symbol;
    e.date = date(day);
    e.quantity = quantity;
    e.unitPrice = Money::fromString(price);
    return e;
}

PriceBackfillEntry bySequence(int64_t sequence, const std::string& price) {
    PriceBackfillEntry e;
    e.sequence = sequence;
    e.unitPrice = Money::fromString(price);
    return e;
}

} // namespace

class PriceBackfillServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository = std::make_shared<FakeLedgerRepository>();
        service = std::make_shared<PriceBackfillService>(
            repository,
            std::make_shared<LedgerReplayService>()
        );
    }

    std::optional<Money> priceOf(int64_t sequence) {
        for (const auto& e : repository->loadTransactions("p1")) {
            if (e.sequence == sequence) return e.unitPrice;
        }
        return std::nullopt;
    }

    std::shared_ptr<FakeLedgerRepository> repository;
    std::shared_ptr<PriceBackfillService> service;
};

// ============================================================================
// СОПОСТАВЛЕНИЕ
// ============================================================================

TEST_F(PriceBackfillServiceTest, Backfill_BySymbolDateQuantity_PricesAndReplays) {
    repository->seed("p1", {buy("NABIL", "2024-01-05", 10, "", 1)});

    auto report = service->backfill("p1", {entry("NABIL", "2024-01-05", 10, "500")});

    EXPECT_EQ(report.entries, 1);
    EXPECT_EQ(report.applied, 1);
    EXPECT_EQ(report.pendingPrice, 0);
    EXPECT_TRUE(report.unmatched.empty());
    EXPECT_TRUE(report.replayFailures.empty());

    EXPECT_EQ(repository->commitCallCount(), 1);
    ASSERT_EQ(repository->lastUpserted().size(), 1u);
    EXPECT_EQ(priceOf(1)->toDecimalString(), "500.00");

    auto snapshot = repository->loadSnapshot("p1");
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot->holdings.size(), 1u);
    EXPECT_EQ(snapshot->holdings[0].totalCost.toDecimalString(), "5000.00");
}

TEST_F(PriceBackfillServiceTest, Backfill_ByTransactionId_Matched) {
    auto pending = buy("ADBL", "2024-03-01", 50, "", 1);
    pending.memo.transactionId = "789012";
    repository->seed("p1", {pending});

    PriceBackfillEntry e;
    e.transactionId = "789012";
    e.unitPrice = Money::fromString("410.10");

    auto report = service->backfill("p1", {e});

    EXPECT_EQ(report.applied, 1);
    EXPECT_EQ(priceOf(1)->toDecimalString(), "410.10");
}

TEST_F(PriceBackfillServiceTest, Backfill_BuyEntry_MatchesIpo) {
    auto ipo = buy("NABIL", "2024-01-05", 10, "", 1);
    ipo.kind = EventKind::IPO;
    repository->seed("p1", {ipo});

    auto e = entry("NABIL", "2024-01-05", 10, "100");
    e.kind = EventKind::BUY;
    auto report = service->backfill("p1", {e});

    EXPECT_EQ(report.applied, 1);
    EXPECT_EQ(report.pendingPrice, 0);
}

TEST_F(PriceBackfillServiceTest, Backfill_SellWithFees_FeesCarriedToDisposal) {
    repository->seed("p1", {
        buy("NABIL", "2024-01-05", 10, "100", 1),
        sell("NABIL", "2024-02-05", 4, "", 2)
    });

    auto e = entry("NABIL", "2024-02-05", 4, "120");
    e.kind = EventKind::SELL;
    e.fees = Money::fromString("2.00");
    service->backfill("p1", {e});

    auto snapshot = repository->loadSnapshot("p1");
    ASSERT_EQ(snapshot->disposals.size(), 1u);
    EXPECT_EQ(snapshot->disposals[0].fees->toDecimalString(), "2.00");
    EXPECT_EQ(snapshot->disposals[0].gain->toDecimalString(), "78.00");
}

// ============================================================================
// УЖЕ ОЦЕНЁННЫЕ И НЕ НАЙДЕННЫЕ
// ============================================================================

TEST_F(PriceBackfillServiceTest, Backfill_AlreadyPriced_Untouched) {
    repository->seed("p1", {buy("NABIL", "2024-01-05", 10, "400", 1)});

    auto report = service->backfill("p1", {entry("NABIL", "2024-01-05", 10, "500"), bySequence(1, "600")});

    EXPECT_EQ(report.alreadyPriced, 2);
    EXPECT_EQ(report.applied, 0);
    EXPECT_EQ(repository->commitCallCount(), 0);
    EXPECT_EQ(priceOf(1)->toDecimalString(), "400.00");
}

TEST_F(PriceBackfillServiceTest, Backfill_NoMatchingTransaction_Unmatched) {
    repository->seed("p1", {buy("NABIL", "2024-01-05", 10, "", 1)});

    auto report = service->backfill("p1", {
        entry("XYZ", "2024-01-05", 10, "500"),
        entry("NABIL", "2024-01-06", 10, "500"),
        entry("NABIL", "2024-01-05", 11, "500")
    });

    EXPECT_EQ(report.unmatched.size(), 3u);
    EXPECT_EQ(report.applied, 0);
    EXPECT_EQ(report.pendingPrice, 1);
}

TEST_F(PriceBackfillServiceTest, Backfill_NonPositivePrice_Unmatched) {
    repository->seed("p1", {buy("NABIL", "2024-01-05", 10, "", 1)});

    auto report = service->backfill("p1", {entry("NABIL", "2024-01-05", 10, "0")});

    ASSERT_EQ(report.unmatched.size(), 1u);
    EXPECT_NE(report.unmatched[0].find("non-positive price"), std::string::npos);
    EXPECT_FALSE(priceOf(1).has_value());
}

TEST_F(PriceBackfillServiceTest, Backfill_SequenceOfBonus_Unmatched) {
    repository->seed("p1", {action(EventKind::BONUS, "NABIL", "2024-01-05", 2, 1)});

    auto report = service->backfill("p1", {bySequence(1, "100")});

    ASSERT_EQ(report.unmatched.size(), 1u);
    EXPECT_NE(report.unmatched[0].find("BONUS carries no price"), std::string::npos);
}

// ============================================================================
// НЕСКОЛЬКО ЗАПИСЕЙ
// ============================================================================

TEST_F(PriceBackfillServiceTest, Backfill_TwoEntriesSameTransaction_LastWins) {
    repository->seed("p1", {buy("NABIL", "2024-01-05", 10, "", 1)});

    auto report = service->backfill("p1", {bySequence(1, "500"), bySequence(1, "520")});

    EXPECT_EQ(report.applied, 1);
    EXPECT_EQ(priceOf(1)->toDecimalString(), "520.00");
}

TEST_F(PriceBackfillServiceTest, Backfill_IdenticalPendingTrades_EachGetsOneEntry) {
    repository->seed("p1", {
        buy("NABIL", "2024-01-05", 10, "", 1),
        buy("NABIL", "2024-01-05", 10, "", 2)
    });

    auto report = service->backfill("p1", {
        entry("NABIL", "2024-01-05", 10, "500"),
        entry("NABIL", "2024-01-05", 10, "510")
    });

    EXPECT_EQ(report.applied, 2);
    EXPECT_EQ(priceOf(1)->toDecimalString(), "500.00");
    EXPECT_EQ(priceOf(2)->toDecimalString(), "510.00");
}
