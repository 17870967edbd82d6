#include <gtest/gtest.h>
#include "io/table_reader.hpp"
#include "common/errors.hpp"

#include <fstream>
#include <string>

using namespace biokg;

TEST(TableReaderTest, ParsesHeaderAndRows) {
    Table t = Table::parse("node_index,node_type,node_name\n0,gene/protein,TP53\n1,disease,asthma\n");
    ASSERT_EQ(t.columnCount(), 3);
    ASSERT_EQ(t.rowCount(), 2);
    EXPECT_EQ(t.header()[2], "node_name");
    EXPECT_EQ(t.cell(1, 2), "asthma");
    EXPECT_EQ(t.integer(1, 0), 1);
}

TEST(TableReaderTest, QuotedFieldsKeepDelimitersQuotesAndNewlines) {
    Table t = Table::parse(
        "id,name,description\n"
        "1,\"asthma, allergic\",\"said \"\"wheeze\"\"\"\n"
        "2,\"multi\nline\",plain\n");
    ASSERT_EQ(t.rowCount(), 2);
    EXPECT_EQ(t.cell(0, 1), "asthma, allergic");
    EXPECT_EQ(t.cell(0, 2), "said \"wheeze\"");
    EXPECT_EQ(t.cell(1, 1), "multi\nline");
    EXPECT_EQ(t.cell(1, 2), "plain");
}

TEST(TableReaderTest, HandlesCrlfBlankLinesAndTrailingEmptyField) {
    Table t = Table::parse("a,b\r\n1,\r\n\r\n2,x\r\n");
    ASSERT_EQ(t.rowCount(), 2);
    EXPECT_EQ(t.row(0).size(), 2);
    EXPECT_EQ(t.cell(0, 1), "");
    EXPECT_EQ(t.cell(1, 1), "x");
}

TEST(TableReaderTest, TabDelimited) {
    Table t = Table::parse("id\tname\n5\tBRCA1\n", '\t');
    EXPECT_EQ(t.cell(0, 1), "BRCA1");
    EXPECT_EQ(delimiterFromString("\\t"), '\t');
    EXPECT_EQ(delimiterFromString("tsv"), '\t');
    EXPECT_EQ(delimiterFromString(","), ',');
    EXPECT_EQ(delimiterFromString(";"), ';');
}

TEST(TableReaderTest, StripsByteOrderMark) {
    Table t = Table::parse("\xEF\xBB\xBFnode_index,x\n1,2\n");
    EXPECT_TRUE(t.findColumn("node_index").has_value());
}

TEST(TableReaderTest, ColumnLookup) {
    Table t = Table::parse("x_index,y_index,relation\n1,2,ppi\n");
    EXPECT_EQ(t.findColumn({"source", "x_index"}), 0u);
    EXPECT_FALSE(t.findColumn({"display_relation"}).has_value());
    EXPECT_EQ(t.requireColumn({"relation"}, "relation"), 2u);
    EXPECT_THROW(t.requireColumn({"display_relation"}, "display"), SchemaError);
}

TEST(TableReaderTest, ShortRowsThrowParseErrorOnAccess) {
    Table t = Table::parse("a,b,c\n1,2\n");
    EXPECT_EQ(t.cell(0, 1), "2");
    EXPECT_THROW(t.cell(0, 2), ParseError);
    EXPECT_EQ(t.cellOrEmpty(0, 2), "");
}

TEST(TableReaderTest, ParseIdentifier) {
    EXPECT_EQ(parseIdentifier("42"), 42);
    EXPECT_EQ(parseIdentifier(" 42 "), 42);
    EXPECT_EQ(parseIdentifier("42.0"), 42);
    EXPECT_EQ(parseIdentifier("-3"), -3);
    EXPECT_THROW(parseIdentifier(""), ParseError);
    EXPECT_THROW(parseIdentifier("abc"), ParseError);
    EXPECT_THROW(parseIdentifier("42.5"), ParseError);
    EXPECT_THROW(parseIdentifier("Gene::1017"), ParseError);
}

TEST(TableReaderTest, UnterminatedQuoteAtEndFlagsLastRow) {
    Table t = Table::parse("a,b\n1,x\n2,\"open\n");
    ASSERT_EQ(t.rowCount(), 2);
    EXPECT_FALSE(t.malformed(0));
    EXPECT_TRUE(t.malformed(1));
    EXPECT_TRUE(t.row(1).empty());
    EXPECT_THROW(t.cell(1, 0), ParseError);
    EXPECT_EQ(t.malformedCount(), 1);
}

TEST(TableReaderTest, StrayQuoteCostsOnlyItsOwnLine) {
    Table t = Table::parse(
        "id,name,source\n"
        "0,\"broken name,DrugBank\n"
        "1,aspirin,DrugBank\n"
        "2,\"asthma\",MONDO\n"
        "3,eczema,MONDO\n");
    ASSERT_EQ(t.rowCount(), 4);
    EXPECT_TRUE(t.malformed(0));
    EXPECT_EQ(t.cell(1, 1), "aspirin");
    EXPECT_EQ(t.cell(2, 1), "asthma");
    EXPECT_EQ(t.cell(3, 1), "eczema");
    EXPECT_EQ(t.malformedCount(), 1);
}

TEST(TableReaderTest, TextAfterClosingQuoteIsMalformed) {
    Table t = Table::parse("a,b\n\"ab\"c,2\n3,4\n");
    ASSERT_EQ(t.rowCount(), 2);
    EXPECT_TRUE(t.malformed(0));
    EXPECT_FALSE(t.malformed(1));
    EXPECT_EQ(t.cell(1, 0), "3");
}

TEST(TableReaderTest, MalformedHeaderFailsParse) {
    EXPECT_THROW(Table::parse("\"a,b\n1,2\n"), ParseError);
}

TEST(TableReaderTest, WhitespaceOnlyLinesAreBlank) {
    Table t = Table::parse("node_index,node_type\n1,drug\n   \n\t\n2,disease\n");
    ASSERT_EQ(t.rowCount(), 2);
    EXPECT_EQ(t.cell(1, 1), "disease");
}

TEST(TableReaderTest, EmptyInputGivesEmptyTable) {
    Table t = Table::parse("");
    EXPECT_EQ(t.columnCount(), 0);
    EXPECT_EQ(t.rowCount(), 0);
}

TEST(TableReaderTest, ReadFile) {
    const std::string path = ::testing::TempDir() + "biokg_table_reader.csv";
    {
        std::ofstream out(path);
        out << "id,name\n1,asthma\n";
    }
    Table t = Table::readFile(path);
    EXPECT_EQ(t.cell(0, 1), "asthma");
    EXPECT_THROW(Table::readFile(path + ".missing"), TableError);
}

TEST(TableReaderTest, ReadFileKeepsRowsAroundBadQuotes) {
    const std::string path = ::testing::TempDir() + "biokg_table_reader_bad.csv";
    {
        std::ofstream out(path);
        out << "id,name\n1,asthma\n2,\"bad";
    }
    Table t = Table::readFile(path);
    ASSERT_EQ(t.rowCount(), 2);
    EXPECT_EQ(t.cell(0, 1), "asthma");
    EXPECT_TRUE(t.malformed(1));
}
