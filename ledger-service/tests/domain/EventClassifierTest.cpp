/**
 * @file EventClassifierTest.cpp
 * @brief Unit tests for row classification, memo parsing and row errors
 */

#include <gtest/gtest.h>
#include "domain/EventClassifier.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <memory>

using namespace ledger::domain;

namespace {

/// Строка депозитарной выгрузки: S.N, Scrip, Date, Credit, Debit, Balance, Description
std::vector<std::string> depositoryRow(const std::string& symbol, const std::string& date,
                                       const std::string& credit, const std::string& debit,
                                       const std::string& description,
                                       const std::string& balance = "-") {
    return {"1", symbol, date, credit, debit, balance, description};
}

} // namespace

class EventClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        depository_ = std::make_unique<EventClassifier>(ColumnMap::fromHeader({
            "S.N", "Scrip", "Transaction Date", "Credit Quantity", "Debit Quantity",
            "Balance After Transaction", "History Description"
        }));
        signedTrades_ = std::make_unique<EventClassifier>(ColumnMap::fromHeader({
            "Date", "Symbol", "Type", "Quantity", "Price", "Fees"
        }));
    }

    RowErrorCode classifyError(const EventClassifier& classifier, const std::vector<std::string>& row) {
        try {
            classifier.classify(row, 2);
        } catch (const RowParseError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected RowParseError";
        return RowErrorCode::ShortRow;
    }

    std::unique_ptr<EventClassifier> depository_;
    std::unique_ptr<EventClassifier> signedTrades_;
};

// ============================================================================
// ТИПЫ СОБЫТИЙ
// ============================================================================

TEST_F(EventClassifierTest, Classify_InitialPublicOffering_IpoWithoutPrice) {
    auto row = depository_->classify(depositoryRow(
        "nabil", "2024-01-05", "10", "-", "INITIAL PUBLIC OFFERING 00001234 CREDIT", "10"));

    EXPECT_EQ(row.event.kind, EventKind::IPO);
    EXPECT_EQ(row.event.symbol, "NABIL");
    EXPECT_EQ(row.event.quantity, 10);
    EXPECT_EQ(row.event.date, Date(2024, 1, 5));
    EXPECT_FALSE(row.event.unitPrice.has_value());
    EXPECT_TRUE(row.event.needsPrice());
    EXPECT_EQ(row.event.balanceAfter, 10);
    EXPECT_FALSE(row.unclassified);
}

TEST_F(EventClassifierTest, Classify_CaBonus_BonusWithRate) {
    auto row = depository_->classify(depositoryRow(
        "NABIL", "2024-02-01", "2", "-", "CA-Bonus 00009001 B-13.33%-2023/24 CREDIT"));

    EXPECT_EQ(row.event.kind, EventKind::BONUS);
    EXPECT_FALSE(row.event.needsPrice());
    EXPECT_EQ(row.event.memo.bonusRate, "B-13.33%-2023/24");
    EXPECT_EQ(row.event.memo.referenceId, "00009001");
}

TEST_F(EventClassifierTest, Classify_CaRights_Rights) {
    auto row = depository_->classify(depositoryRow(
        "NABIL", "2024-02-01", "5", "-", "CA-Rights 00009002 R-100%-2024 CREDIT"));

    EXPECT_EQ(row.event.kind, EventKind::RIGHTS);
    EXPECT_EQ(row.event.memo.rightsRate, "R-100%-2024");
}

TEST_F(EventClassifierTest, Classify_Merger_DirectionFromColumns) {
    auto in = depository_->classify(depositoryRow("NEW", "2024-06-01", "50", "-", "CA-Merger 00009003 CREDIT"));
    auto out = depository_->classify(depositoryRow("OLD", "2024-06-01", "-", "100", "CA-Merger 00009003 DEBIT"));

    EXPECT_EQ(in.event.kind, EventKind::MERGER_IN);
    EXPECT_EQ(out.event.kind, EventKind::MERGER_OUT);
    EXPECT_EQ(out.event.quantity, 100);
}

TEST_F(EventClassifierTest, Classify_Rearrangement_CarriesPurchaseDate) {
    auto row = depository_->classify(depositoryRow(
        "NABIL", "2025-05-01", "5", "-", "CA-Rearrangement 00009000 PUR 09-04-2025 CREDIT"));

    EXPECT_EQ(row.event.kind, EventKind::REARRANGEMENT);
    ASSERT_TRUE(row.event.memo.purchaseDate.has_value());
    EXPECT_EQ(*row.event.memo.purchaseDate, Date(2025, 4, 9));
}

TEST_F(EventClassifierTest, Classify_OnMarketCredit_BuyWithTradeIds) {
    auto row = depository_->classify(depositoryRow(
        "ADBL", "2024-03-01", "50", "-", "ON-CR TD:123456 TX:789012 1301020000003172 SET:1211002024015"));

    EXPECT_EQ(row.event.kind, EventKind::BUY);
    EXPECT_TRUE(row.event.needsPrice());
    EXPECT_EQ(row.event.memo.tradeId, "123456");
    EXPECT_EQ(row.event.memo.transactionId, "789012");
    EXPECT_EQ(row.event.memo.settlementCode, "1211002024015");
    EXPECT_TRUE(row.event.memo.referenceId.empty());
}

TEST_F(EventClassifierTest, Classify_OnMarketDebit_Sell) {
    auto row = depository_->classify(depositoryRow("ADBL", "2024-03-05", "-", "20", "ON-DR TD:123457 TX:789013"));

    EXPECT_EQ(row.event.kind, EventKind::SELL);
    EXPECT_EQ(row.event.quantity, 20);
}

TEST_F(EventClassifierTest, Classify_Dematerialization_DebitIsDemat_CreditIsBuy) {
    auto debit = depository_->classify(depositoryRow("HDL", "2024-03-05", "-", "20", "Dematerialization 00001111"));
    auto credit = depository_->classify(depositoryRow("HDL", "2024-03-05", "20", "-", "DEMAT 00001111"));

    EXPECT_EQ(debit.event.kind, EventKind::DEMAT);
    EXPECT_EQ(credit.event.kind, EventKind::BUY);
    EXPECT_TRUE(credit.event.needsPrice());
}

TEST_F(EventClassifierTest, Classify_UnknownDescription_FallsBackToDirection) {
    auto credit = depository_->classify(depositoryRow("NABIL", "2024-03-05", "5", "-", "TRANSFER FROM IPOWER"));
    auto debit = depository_->classify(depositoryRow("NABIL", "2024-03-05", "-", "5", "Pledge release"));

    EXPECT_TRUE(credit.unclassified);
    EXPECT_EQ(credit.event.kind, EventKind::BUY);
    EXPECT_TRUE(debit.unclassified);
    EXPECT_EQ(debit.event.kind, EventKind::SELL);
}

// ============================================================================
// ПРИОРИТЕТ ПРАВИЛ
// ============================================================================

TEST(EventClassifierRulesTest, Categorize_MoreSpecificKeywordWins) {
    EXPECT_EQ(EventClassifier::categorize("IPO BONUS ALLOTMENT"), EventClassifier::Category::Ipo);
    EXPECT_EQ(EventClassifier::categorize("CA-Bonus rights issue"), EventClassifier::Category::Bonus);
    EXPECT_EQ(EventClassifier::categorize("CA-Rights merger"), EventClassifier::Category::Rights);
    EXPECT_EQ(EventClassifier::categorize("Demat buy"), EventClassifier::Category::Demat);
    EXPECT_EQ(EventClassifier::categorize("on-cr sell"), EventClassifier::Category::RegularCredit);
}

TEST(EventClassifierRulesTest, Categorize_WordRule_IgnoresEmbeddedKeyword) {
    EXPECT_EQ(EventClassifier::categorize("IPO-2024 allotment"), EventClassifier::Category::Ipo);
    EXPECT_FALSE(EventClassifier::categorize("IPOWER transfer").has_value());
    EXPECT_FALSE(EventClassifier::categorize("BUYBACK settlement").has_value());
}

// ============================================================================
// ОШИБКИ СТРОК
// ============================================================================

TEST_F(EventClassifierTest, Classify_DebitBonus_DirectionMismatch) {
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "-", "2", "CA-Bonus 00009001")),
              RowErrorCode::DirectionMismatch);
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "-", "2", "IPO allotment")),
              RowErrorCode::DirectionMismatch);
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "-", "2", "ON-CR TD:1")),
              RowErrorCode::DirectionMismatch);
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "2", "-", "ON-DR TD:1")),
              RowErrorCode::DirectionMismatch);
}

TEST_F(EventClassifierTest, Classify_BothOrNeitherQuantity_Ambiguous) {
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "5", "5", "ON-CR")),
              RowErrorCode::AmbiguousQuantity);
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "-", "-", "ON-CR")),
              RowErrorCode::AmbiguousQuantity);
}

TEST_F(EventClassifierTest, Classify_BadFields_ReportedByCode) {
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "someday", "5", "-", "ON-CR")),
              RowErrorCode::MalformedDate);
    EXPECT_EQ(classifyError(*depository_, depositoryRow(" ", "2024-02-01", "5", "-", "ON-CR")),
              RowErrorCode::MissingSymbol);
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "10.5", "-", "ON-CR")),
              RowErrorCode::MalformedQuantity);
    EXPECT_EQ(classifyError(*depository_, depositoryRow("NABIL", "2024-02-01", "-5", "-", "ON-CR")),
              RowErrorCode::MalformedQuantity);
    EXPECT_EQ(classifyError(*depository_, {"1", "NABIL", "2024-02-01"}),
              RowErrorCode::ShortRow);
}

TEST_F(EventClassifierTest, Classify_QuantityFormatting_Accepted) {
    auto grouped = depository_->classify(depositoryRow("NABIL", "2024-02-01", "1,000", "-", "ON-CR"));
    auto decimal = depository_->classify(depositoryRow("NABIL", "2024-02-01", "10.00", "-", "ON-CR"));

    EXPECT_EQ(grouped.event.quantity, 1000);
    EXPECT_EQ(decimal.event.quantity, 10);
}

// ============================================================================
// ЗНАКОВОЕ КОЛИЧЕСТВО И ЦЕНА
// ============================================================================

TEST_F(EventClassifierTest, Classify_SignedQuantityWithPrice_PricedBuy) {
    auto row = signedTrades_->classify({"2024-01-05", "nabil", "Buy", "10", "512.50", ""});

    EXPECT_EQ(row.event.kind, EventKind::BUY);
    ASSERT_TRUE(row.event.unitPrice.has_value());
    EXPECT_EQ(row.event.unitPrice->minorUnits(), 51250);
    EXPECT_FALSE(row.event.needsPrice());
}

TEST_F(EventClassifierTest, Classify_NegativeQuantity_SellWithFees) {
    auto row = signedTrades_->classify({"2024-01-06", "NABIL", "SELL", "-4", "530", "12.40"});

    EXPECT_EQ(row.event.kind, EventKind::SELL);
    EXPECT_EQ(row.event.quantity, 4);
    ASSERT_TRUE(row.event.fees.has_value());
    EXPECT_EQ(row.event.fees->minorUnits(), 1240);
}

TEST_F(EventClassifierTest, Classify_BuyWithNegativeQuantity_DirectionMismatch) {
    EXPECT_EQ(classifyError(*signedTrades_, {"2024-01-05", "NABIL", "BUY", "-10", "500", ""}),
              RowErrorCode::DirectionMismatch);
}

TEST_F(EventClassifierTest, Classify_ZeroPrice_MeansNoPriceYet) {
    auto row = signedTrades_->classify({"2024-01-05", "NABIL", "BUY", "10", "0", ""});

    EXPECT_FALSE(row.event.unitPrice.has_value());
    EXPECT_TRUE(row.event.needsPrice());
}

TEST_F(EventClassifierTest, Classify_BadPrice_MalformedPrice) {
    EXPECT_EQ(classifyError(*signedTrades_, {"2024-01-05", "NABIL", "BUY", "10", "abc", ""}),
              RowErrorCode::MalformedPrice);
    EXPECT_EQ(classifyError(*signedTrades_, {"2024-01-05", "NABIL", "BUY", "10", "-5", ""}),
              RowErrorCode::MalformedPrice);
}

TEST_F(EventClassifierTest, Classify_PriceOnBonus_Ignored) {
    auto row = signedTrades_->classify({"2024-01-05", "NABIL", "BONUS", "3", "100", ""});

    EXPECT_EQ(row.event.kind, EventKind::BONUS);
    EXPECT_FALSE(row.event.unitPrice.has_value());
}

// ============================================================================
// MEMO
// ============================================================================

TEST(EventClassifierMemoTest, ParseMemo_PlainText_Empty) {
    EXPECT_TRUE(EventClassifier::parseMemo("Pledge release").empty());
}

TEST(EventClassifierMemoTest, ParseQuantity_DashAndEmpty_Zero) {
    EXPECT_EQ(EventClassifier::parseQuantity(""), 0);
    EXPECT_EQ(EventClassifier::parseQuantity("-"), 0);
    EXPECT_EQ(EventClassifier::parseQuantity("+25"), 25);
    EXPECT_THROW(EventClassifier::parseQuantity("1234567890123456"), RowParseError);
}
