/**
 * @file JsonFileQuoteProviderTest.cpp
 * @brief Unit tests for the JSON quotes provider
 */

#include <gtest/gtest.h>
#include "adapters/secondary/quotes/JsonFileQuoteProvider.hpp"

using namespace ledger::adapters::secondary;
using namespace ledger::domain;

TEST(JsonFileQuoteProviderTest, FromJson_StringAndNumberPrices) {
    auto provider = JsonFileQuoteProvider::fromJson(nlohmann::json::parse(R"([
        {"symbol": "NABIL", "price": "1,512.30", "asOf": "2024-07-15"},
        {"symbol": "ADBL", "price": 410.5}
    ])"));

    EXPECT_EQ(provider->size(), 2u);

    auto nabil = provider->getQuote("NABIL");
    ASSERT_TRUE(nabil.has_value());
    EXPECT_EQ(nabil->price.toDecimalString(), "1512.30");
    EXPECT_EQ(nabil->asOf, Date(2024, 7, 15));

    EXPECT_EQ(provider->getQuote("ADBL")->price.minorUnits(), 41050);
}

TEST(JsonFileQuoteProviderTest, GetQuote_Unknown_Nullopt) {
    auto provider = JsonFileQuoteProvider::fromJson(nlohmann::json::array());

    EXPECT_FALSE(provider->getQuote("NABIL").has_value());
}

TEST(JsonFileQuoteProviderTest, EmptyPath_NoQuotes) {
    JsonFileQuoteProvider provider("");

    EXPECT_EQ(provider.size(), 0u);
    EXPECT_FALSE(provider.getQuote("NABIL").has_value());
}

TEST(JsonFileQuoteProviderTest, BadInput_Throws) {
    EXPECT_THROW(JsonFileQuoteProvider::fromJson(nlohmann::json::object()), std::runtime_error);
    EXPECT_THROW(JsonFileQuoteProvider::fromJson(nlohmann::json::parse(
        R"([{"symbol": "NABIL", "price": "1", "asOf": "soon"}])")), std::runtime_error);
    EXPECT_THROW(JsonFileQuoteProvider("/nonexistent/quotes.json"), std::runtime_error);
}

TEST(JsonFileQuoteProviderTest, FromJson_NumberPrice_RoundsFromDecimalText) {
    auto provider = JsonFileQuoteProvider::fromJson(nlohmann::json::parse(R"([
        {"symbol": "NICA", "price": 512.345},
        {"symbol": "HDL", "price": 500}
    ])"));

    EXPECT_EQ(provider->getQuote("NICA")->price.minorUnits(), 51235);
    EXPECT_EQ(provider->getQuote("HDL")->price.minorUnits(), 50000);
}

TEST(JsonFileQuoteProviderTest, FromJson_PriceNotNumber_Throws) {
    EXPECT_THROW(JsonFileQuoteProvider::fromJson(nlohmann::json::parse(
        R"([{"symbol": "NABIL", "price": true}])")), std::runtime_error);
}
