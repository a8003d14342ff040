/**
 * @file JsonMapperTest.cpp
 * @brief Unit tests for CLI JSON output
 */

#include <gtest/gtest.h>
#include "adapters/primary/JsonMapper.hpp"
#include "domain/ValuationEngine.hpp"
#include "../mocks/TestEvents.hpp"

using namespace ledger::adapters::primary;
using namespace ledger::domain;
using namespace ledger::tests;

TEST(JsonMapperTest, Event_MoneyAsStringMissingPriceAsNull) {
    auto pending = buy("NABIL", "2024-01-05", 10, "", 1);
    pending.memo.transactionId = "789012";

    auto j = JsonMapper::event(pending);

    EXPECT_TRUE(j["unit_price"].is_null());
    EXPECT_TRUE(j["needs_price"].get<bool>());
    EXPECT_EQ(j["date"], "2024-01-05");
    EXPECT_EQ(j["kind"], "BUY");
    EXPECT_EQ(j["memo"]["transaction_id"], "789012");
    EXPECT_FALSE(j["memo"].contains("trade_id"));

    auto priced = JsonMapper::event(buy("NABIL", "2024-01-05", 10, "512.5", 2));
    EXPECT_EQ(priced["unit_price"], "512.50");
    EXPECT_FALSE(priced.contains("memo"));
}

TEST(JsonMapperTest, Valuation_WithoutQuote_NoteAndNoMarketFields) {
    Holding h("ABC", 10, Money::fromString("1000"), Money(), 1);

    auto j = JsonMapper::valuation(ValuationEngine::value(h, std::nullopt));

    EXPECT_FALSE(j["price_available"].get<bool>());
    EXPECT_EQ(j["note"], "price data unavailable");
    EXPECT_FALSE(j.contains("current_value"));
    EXPECT_FALSE(j.contains("unrealized_pnl"));
    EXPECT_EQ(j["total_cost"], "1000.00");
}

TEST(JsonMapperTest, Valuation_ZeroCost_PercentNull) {
    Holding h("ABC", 10, Money(), Money(), 1);
    Quote q("ABC", Money::fromString("50"), Date(2024, 7, 1));

    auto j = JsonMapper::valuation(ValuationEngine::value(h, q));

    EXPECT_TRUE(j["price_available"].get<bool>());
    EXPECT_EQ(j["current_value"], "500.00");
    EXPECT_EQ(j["as_of"], "2024-07-01");
    EXPECT_TRUE(j["unrealized_pnl_percent"].is_null());
}

TEST(JsonMapperTest, ImportReport_RowErrorsWithCodes) {
    ImportReport report;
    report.portfolioId = "p1";
    report.rowsRead = 3;
    report.imported = 1;
    report.duplicates = 1;
    RowError error;
    error.rowNumber = 4;
    error.code = RowErrorCode::MalformedDate;
    error.message = "MalformedDate: 'someday'";
    report.rowErrors.push_back(error);

    auto j = JsonMapper::importReport(report);

    EXPECT_EQ(j["skipped"], 2);
    ASSERT_EQ(j["row_errors"].size(), 1u);
    EXPECT_EQ(j["row_errors"][0]["code"], "MalformedDate");
    EXPECT_EQ(j["row_errors"][0]["row"], 4);
    EXPECT_TRUE(j["unclassified"].is_array());
}

TEST(JsonMapperTest, Page_TotalAndItems) {
    TransactionPage page;
    page.total = 7;
    page.limit = 2;
    page.offset = 4;
    page.items.push_back(buy("ABC", "2024-01-01", 1, "1", 5));

    auto j = JsonMapper::page(page);

    EXPECT_EQ(j["total"], 7);
    EXPECT_EQ(j["items"].size(), 1u);
    EXPECT_EQ(j["items"][0]["sequence"], 5);
}
