#include "AugurExceptions.h"
#include "CSVUtils.h"
#include "TestSupport.h"
#include "TypedDataset.h"

#include <gtest/gtest.h>
#include <cmath>
#include <sstream>

TEST(CsvParsing, QuotedFieldsKeepDelimitersNewlinesAndQuotes) {
    std::istringstream in("a,\"b,c\",\"say \"\"hi\"\"\",\"two\nlines\"\nnext,row\n");
    bool malformed = true;
    const auto row = CSVUtils::parseCSVLine(in, ',', &malformed);
    EXPECT_FALSE(malformed);
    ASSERT_EQ(row.size(), 4u);
    EXPECT_EQ(row[0], "a");
    EXPECT_EQ(row[1], "b,c");
    EXPECT_EQ(row[2], "say \"hi\"");
    EXPECT_EQ(row[3], "two\nlines");

    const auto second = CSVUtils::parseCSVLine(in, ',', &malformed);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[1], "row");
}

TEST(CsvParsing, UnterminatedQuoteIsMalformed) {
    std::istringstream in("x,\"never closed\n");
    bool malformed = false;
    CSVUtils::parseCSVLine(in, ',', &malformed);
    EXPECT_TRUE(malformed);
}

TEST(CsvParsing, HeaderNormalizationFillsBlanksAndDeduplicates) {
    const auto names = CSVUtils::normalizeHeader({"id", "", "id", "id"});
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "id");
    EXPECT_EQ(names[1], "column_2");
    EXPECT_EQ(names[2], "id_2");
    EXPECT_EQ(names[3], "id_3");
}

TEST(CsvParsing, BomIsSkipped) {
    std::istringstream in("\xEF\xBB\xBFname,value\n");
    CSVUtils::skipBOM(in);
    const auto row = CSVUtils::parseCSVLine(in, ',');
    ASSERT_EQ(row.size(), 2u);
    EXPECT_EQ(row[0], "name");
}

TEST(TypedDatasetLoad, InfersColumnTypesAndMissingCells) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("mixed.csv");
    TestSupport::writeTextFile(path,
        "age,city,score,empty\n"
        "31,Paris,1.5,\n"
        "NA,Lyon,2.5,\n"
        "40,,n/a,\n"
        "22,Paris\n");

    TypedDataset data(path);
    data.load();
    ASSERT_EQ(data.rowCount(), 4u);
    ASSERT_EQ(data.colCount(), 4u);

    const auto& cols = data.columns();
    EXPECT_EQ(cols[0].type, ColumnType::NUMERIC);
    EXPECT_EQ(cols[1].type, ColumnType::CATEGORICAL);
    EXPECT_EQ(cols[2].type, ColumnType::NUMERIC);
    EXPECT_EQ(cols[3].type, ColumnType::NUMERIC);

    EXPECT_EQ(cols[0].missing[1], 1u);
    EXPECT_EQ(cols[1].missing[2], 1u);
    EXPECT_EQ(cols[2].missing[2], 1u);
    EXPECT_EQ(cols[2].missing[3], 1u);   // short row padded
    EXPECT_TRUE(std::isnan(std::get<std::vector<double>>(cols[2].values)[3]));

    EXPECT_EQ(cols[0].textAt(0), "31");
    EXPECT_EQ(cols[2].textAt(0), "1.5");
    EXPECT_EQ(data.distinctCount(1), 2u);
    EXPECT_EQ(data.findColumnIndex("score"), 2);
    EXPECT_EQ(data.findColumnIndex("nope"), -1);
}

TEST(TypedDatasetLoad, MissingFileRaisesDatasetError) {
    TypedDataset data("/nonexistent/augur/data.csv");
    EXPECT_THROW(data.load(), Augur::DatasetException);
}

TEST(TypedDatasetLoad, HeaderOnlyFileRaisesDatasetError) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("header_only.csv");
    TestSupport::writeTextFile(path, "a,b,c\n");
    TypedDataset data(path);
    EXPECT_THROW(data.load(), Augur::DatasetException);
}

TEST(TypedDatasetLoad, FromRowsBuildsInMemoryDataset) {
    const TypedDataset data = TypedDataset::fromRows({"x", "y"}, {{"1", "a"}, {"2", "b"}, {"3"}});
    EXPECT_EQ(data.rowCount(), 3u);
    EXPECT_EQ(data.columns()[1].missing[2], 1u);
    EXPECT_EQ(data.numericColumnIndices(), std::vector<size_t>({0}));
    EXPECT_EQ(data.categoricalColumnIndices(), std::vector<size_t>({1}));
}
