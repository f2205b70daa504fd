// csv_utils_test.cpp: record tokenization, quoting, BOM handling and header cleanup.

#include <gtest/gtest.h>

#include "CSVUtils.h"

#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::vector<std::string>> readAll(const std::string& text, char delimiter = ',') {
    std::istringstream in(text);
    CSVUtils::Reader reader(in, delimiter);
    std::vector<std::vector<std::string>> rows;
    for (CSVUtils::Row row = reader.next(); row.status == CSVUtils::RowStatus::OK; row = reader.next()) {
        rows.push_back(row.fields);
    }
    return rows;
}

using Fields = std::vector<std::string>;

}  // namespace

// ===========================================================================
// Reader
// ===========================================================================
TEST(CsvReaderTest, SplitsAndTrimsUnquotedFields) {
    const auto rows = readAll("a, b ,c\n1,2,3\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (Fields{"a", "b", "c"}));
    EXPECT_EQ(rows[1], (Fields{"1", "2", "3"}));
}

TEST(CsvReaderTest, QuotedFieldsKeepDelimitersSpacesAndEscapedQuotes) {
    const auto rows = readAll("\"free, fast\",\" padded \",\"say \"\"hi\"\"\"\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (Fields{"free, fast", " padded ", "say \"hi\""}));
}

TEST(CsvReaderTest, EmbeddedNewlineSpansPhysicalLines) {
    std::istringstream in("\"line one\nline two\",x\nnext,row\n");
    CSVUtils::Reader reader(in, ',');

    const CSVUtils::Row first = reader.next();
    ASSERT_EQ(first.status, CSVUtils::RowStatus::OK);
    EXPECT_EQ(first.fields, (Fields{"line one\nline two", "x"}));
    EXPECT_EQ(first.firstLine, 1u);

    const CSVUtils::Row second = reader.next();
    ASSERT_EQ(second.status, CSVUtils::RowStatus::OK);
    EXPECT_EQ(second.firstLine, 3u);
    EXPECT_EQ(reader.next().status, CSVUtils::RowStatus::END);
}

TEST(CsvReaderTest, SkipsBlankLinesAndHandlesCrLf) {
    const auto rows = readAll("a,b\r\n\r\n\n1,2\r\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (Fields{"1", "2"}));
}

TEST(CsvReaderTest, KeepsEmptyTrailingField) {
    const auto rows = readAll("a,,\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (Fields{"a", "", ""}));
}

TEST(CsvReaderTest, LastRecordWithoutNewline) {
    const auto rows = readAll("a,b\n1,2");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (Fields{"1", "2"}));
}

TEST(CsvReaderTest, ReportsUnterminatedQuote) {
    std::istringstream in("a,b\n\"open,2\n3,4\n");
    CSVUtils::Reader reader(in, ',');
    EXPECT_EQ(reader.next().status, CSVUtils::RowStatus::OK);
    const CSVUtils::Row bad = reader.next();
    EXPECT_EQ(bad.status, CSVUtils::RowStatus::UNTERMINATED_QUOTE);
    EXPECT_EQ(bad.firstLine, 2u);
}

TEST(CsvReaderTest, EnforcesParseLimits) {
    CSVUtils::ParseLimits limits;
    limits.maxFieldBytes = 4;
    std::istringstream in("abcdefgh,1\n");
    CSVUtils::Reader reader(in, ',', limits);
    EXPECT_EQ(reader.next().status, CSVUtils::RowStatus::LIMIT_EXCEEDED);

    CSVUtils::ParseLimits columns;
    columns.maxColumns = 2;
    std::istringstream wide("a,b,c,d\n");
    CSVUtils::Reader wideReader(wide, ',', columns);
    EXPECT_EQ(wideReader.next().status, CSVUtils::RowStatus::LIMIT_EXCEEDED);
}

TEST(CsvReaderTest, AlternateDelimiter) {
    const auto rows = readAll("term;cost\nfree, cheap;1,50\n", ';');
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (Fields{"free, cheap", "1,50"}));
}

// ===========================================================================
// Helpers
// ===========================================================================
TEST(CsvHelpersTest, SkipBomRemovesOnlyACompleteMark) {
    std::istringstream withBom("\xEF\xBB\xBF" "a,b");
    CSVUtils::skipBOM(withBom);
    std::string line;
    std::getline(withBom, line);
    EXPECT_EQ(line, "a,b");

    std::istringstream plain("a,b");
    CSVUtils::skipBOM(plain);
    std::getline(plain, line);
    EXPECT_EQ(line, "a,b");
}

TEST(CsvHelpersTest, SniffDelimiterIgnoresQuotedText) {
    EXPECT_EQ(CSVUtils::sniffDelimiter("term;cost;clicks"), ';');
    EXPECT_EQ(CSVUtils::sniffDelimiter("term\tcost"), '\t');
    EXPECT_EQ(CSVUtils::sniffDelimiter("\"a;b;c\",d"), ',');
    EXPECT_EQ(CSVUtils::sniffDelimiter("a|b|c"), '|');
    EXPECT_EQ(CSVUtils::sniffDelimiter("single"), ',');
}

TEST(CsvHelpersTest, NormalizeHeaderFillsBlanksAndDisambiguates) {
    EXPECT_EQ(CSVUtils::normalizeHeader({"Cost", "", " Cost ", "Cost"}),
              (Fields{"Cost", "column_2", "Cost_2", "Cost_3"}));
}

TEST(CsvHelpersTest, QuoteFieldOnlyWhenNeeded) {
    EXPECT_EQ(CSVUtils::quoteField("plain"), "plain");
    EXPECT_EQ(CSVUtils::quoteField("a,b"), "\"a,b\"");
    EXPECT_EQ(CSVUtils::quoteField("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(CSVUtils::quoteField("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(CSVUtils::quoteField(" lead"), "\" lead\"");
    EXPECT_EQ(CSVUtils::quoteField("a;b"), "a;b");
    EXPECT_EQ(CSVUtils::quoteField("a;b", ';'), "\"a;b\"");
}

TEST(CsvHelpersTest, WrittenRowsReadBackUnchanged) {
    const Fields awkward = {"free, fast", "say \"hi\"", " padded ", "multi\nline", ""};
    std::ostringstream out;
    CSVUtils::writeRow(out, awkward);
    const auto rows = readAll(out.str());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], awkward);
}
