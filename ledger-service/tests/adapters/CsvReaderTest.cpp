/**
 * @file CsvReaderTest.cpp
 * @brief Unit tests for CSV export reading
 */

#include <gtest/gtest.h>
#include "adapters/primary/CsvReader.hpp"
#include <sstream>

using namespace ledger::adapters::primary;

namespace {

CsvReader::Table parse(const std::string& text) {
    std::istringstream in(text);
    return CsvReader::parse(in);
}

} // namespace

TEST(CsvReaderTest, Parse_PlainRows) {
    auto table = parse("a,b,c\n1,2,3\n");

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[1], (std::vector<std::string>{"1", "2", "3"}));
}

TEST(CsvReaderTest, Parse_QuotedFieldWithCommaAndQuote) {
    auto table = parse("\"ON-CR TD:1, TX:2\",\"say \"\"hi\"\"\",x\n");

    ASSERT_EQ(table.size(), 1u);
    ASSERT_EQ(table[0].size(), 3u);
    EXPECT_EQ(table[0][0], "ON-CR TD:1, TX:2");
    EXPECT_EQ(table[0][1], "say \"hi\"");
}

TEST(CsvReaderTest, Parse_NewlineInsideQuotes_SameField) {
    auto table = parse("a,\"line1\nline2\"\nb,c");

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[0][1], "line1\nline2");
    EXPECT_EQ(table[1][1], "c");
}

TEST(CsvReaderTest, Parse_CrLfAndBlankLines) {
    auto table = parse("a,b\r\n\r\n1,2\r\n\n");

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[1][1], "2");
}

TEST(CsvReaderTest, Parse_TrailingEmptyField_Kept) {
    auto table = parse("a,b,\n");

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table[0].size(), 3u);
    EXPECT_EQ(table[0][2], "");
}

TEST(CsvReaderTest, Parse_ByteOrderMark_Stripped) {
    auto table = parse("\xEF\xBB\xBFScrip,Date\n");

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table[0][0], "Scrip");
}

TEST(CsvReaderTest, Parse_PartialByteOrderMark_BytesKept) {
    auto table = parse("\xEF\xBB" "Q,1\n");

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table[0][0], std::string("\xEF\xBB" "Q"));
    EXPECT_EQ(table[0][1], "1");
}

TEST(CsvReaderTest, Parse_ByteOrderMarkOnlyAtStart) {
    auto table = parse("a\n\xEF\xBB\xBF" "b\n");

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[1][0], std::string("\xEF\xBB\xBF" "b"));
}

TEST(CsvReaderTest, Parse_UnterminatedQuote_Throws) {
    EXPECT_THROW(parse("a,\"open\n"), std::runtime_error);
}

TEST(CsvReaderTest, ReadFile_Missing_ThrowsIoFailure) {
    EXPECT_THROW(CsvReader::readFile("/nonexistent/ledger/export.csv"), std::ios_base::failure);
}
