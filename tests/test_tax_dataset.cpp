#include "TaxDataset.h"
#include "TaxSynthExceptions.h"
#include "TestSupport.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class TaxDatasetTest : public TempDirTest {};

// ============================================================================
// Loading
// ============================================================================

TEST_F(TaxDatasetTest, LoadsIntegerAndRealColumns) {
    const auto path = writeFile("in.csv", "RECID,e00200,s006\n1,100,1.5\n2,-20,2\n");
    TaxDataset data(path.string());
    data.load();

    ASSERT_EQ(data.rowCount(), 2u);
    ASSERT_EQ(data.colCount(), 3u);
    EXPECT_EQ(data.columnNames(), (std::vector<std::string>{"RECID", "e00200", "s006"}));
    EXPECT_EQ(data.columns()[0].kind, ColumnKind::INTEGER);
    EXPECT_EQ(data.columns()[1].kind, ColumnKind::INTEGER);
    EXPECT_EQ(data.columns()[2].kind, ColumnKind::REAL);
    EXPECT_EQ(std::get<std::vector<int64_t>>(data.columns()[1].values), (std::vector<int64_t>{100, -20}));
    EXPECT_EQ(std::get<std::vector<double>>(data.columns()[2].values), (std::vector<double>{1.5, 2.0}));
}

TEST_F(TaxDatasetTest, LoadsSampleRecords) {
    const auto path = writeFile("puf.csv", kSampleRecordsCsv);
    TaxDataset data(path.string());
    data.load();
    EXPECT_EQ(data.rowCount(), 6u);
    EXPECT_EQ(data.colCount(), 10u);
    EXPECT_EQ(data.findColumnIndex("e00650"), 8);
    EXPECT_EQ(data.findColumnIndex("missing"), -1);
}

TEST_F(TaxDatasetTest, RejectsRaggedRow) {
    const auto path = writeFile("in.csv", "a,b\n1,2\n3\n");
    TaxDataset data(path.string());
    try {
        data.load();
        FAIL() << "expected DatasetException";
    } catch (const TaxSynth::DatasetException& e) {
        EXPECT_NE(std::string(e.what()).find("Data row 2"), std::string::npos) << e.what();
    }
}

TEST_F(TaxDatasetTest, RejectsNonNumericAndEmptyCells) {
    TaxDataset text(writeFile("text.csv", "a\nx\n").string());
    EXPECT_THROW(text.load(), TaxSynth::DatasetException);

    TaxDataset empty(writeFile("empty.csv", "a,b\n1,\n").string());
    EXPECT_THROW(empty.load(), TaxSynth::DatasetException);
}

TEST_F(TaxDatasetTest, MissingFileIsIOError) {
    TaxDataset data(tmpFile("nope.csv").string());
    EXPECT_THROW(data.load(), TaxSynth::IOException);
}

TEST_F(TaxDatasetTest, EmptyFileIsDatasetError) {
    TaxDataset data(writeFile("empty.csv", "").string());
    EXPECT_THROW(data.load(), TaxSynth::DatasetException);
}

// ============================================================================
// Column operations
// ============================================================================

TEST_F(TaxDatasetTest, IntegerValuesRoundHalfToEven) {
    TaxDataset data;
    data.addColumn("v", std::vector<double>{0.5, 1.5, 2.5, -0.5, -1.5, 2.4999});
    EXPECT_EQ(data.integerValues("v"), (std::vector<int64_t>{0, 2, 2, 0, -2, 2}));
}

TEST_F(TaxDatasetTest, IntegerValuesRejectRealsOutsideInt64) {
    TaxDataset data;
    data.addColumn("big", std::vector<double>{5.0, 1e19});
    data.addColumn("small", std::vector<double>{-1e19});
    data.addColumn("edge", std::vector<double>{-9223372036854775808.0});
    EXPECT_THROW(data.integerValues("big"), TaxSynth::DatasetException);
    EXPECT_THROW(data.integerValues("small"), TaxSynth::DatasetException);
    EXPECT_EQ(data.integerValues("edge"), (std::vector<int64_t>{INT64_MIN}));
}

TEST_F(TaxDatasetTest, AddColumnChecksNameAndLength) {
    TaxDataset data;
    data.addColumn("a", std::vector<int64_t>{1, 2, 3});
    EXPECT_THROW(data.addColumn("a", std::vector<int64_t>{1, 2, 3}), TaxSynth::DatasetException);
    EXPECT_THROW(data.addColumn("b", std::vector<int64_t>{1, 2}), TaxSynth::DatasetException);
    EXPECT_EQ(data.rowCount(), 3u);
}

TEST_F(TaxDatasetTest, SetIntegerColumnReplacesInPlaceOrAppends) {
    TaxDataset data;
    data.addColumn("a", std::vector<double>{1.5, 2.5});
    data.addColumn("b", std::vector<int64_t>{7, 8});

    data.setIntegerColumn("a", {10, 20});
    EXPECT_EQ(data.columnNames(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(data.columns()[0].kind, ColumnKind::INTEGER);
    EXPECT_EQ(data.integerValues("a"), (std::vector<int64_t>{10, 20}));

    data.setIntegerColumn("FLPDYR", {2013, 2013});
    EXPECT_EQ(data.columnNames(), (std::vector<std::string>{"a", "b", "FLPDYR"}));
    EXPECT_THROW(data.setIntegerColumn("b", {1}), TaxSynth::DatasetException);
}

TEST_F(TaxDatasetTest, DropColumnRemovesOnlyThatColumn) {
    TaxDataset data;
    data.addColumn("a", std::vector<int64_t>{1});
    data.addColumn("b", std::vector<int64_t>{2});
    data.dropColumn("a");
    EXPECT_EQ(data.columnNames(), (std::vector<std::string>{"b"}));
    EXPECT_THROW(data.dropColumn("a"), TaxSynth::DatasetException);
}

TEST_F(TaxDatasetTest, SelectRowsKeepsRequestedOrder) {
    TaxDataset data;
    data.addColumn("i", std::vector<int64_t>{10, 11, 12, 13});
    data.addColumn("r", std::vector<double>{0.5, 1.5, 2.5, 3.5});
    data.selectRows({3, 0, 2});

    EXPECT_EQ(data.rowCount(), 3u);
    EXPECT_EQ(data.integerValues("i"), (std::vector<int64_t>{13, 10, 12}));
    EXPECT_EQ(std::get<std::vector<double>>(data.columns()[1].values), (std::vector<double>{3.5, 0.5, 2.5}));
    EXPECT_THROW(data.selectRows({5}), TaxSynth::DatasetException);
}

TEST_F(TaxDatasetTest, ColumnTotalsFollowColumnOrder) {
    TaxDataset data;
    data.addColumn("i", std::vector<int64_t>{1, -2, 3});
    data.addColumn("r", std::vector<double>{0.25, 0.5, 1.0});
    const auto totals = data.columnTotals();
    ASSERT_EQ(totals.size(), 2u);
    EXPECT_EQ(totals[0], 2.0L);
    EXPECT_EQ(totals[1], 1.75L);
}

// ============================================================================
// Saving
// ============================================================================

TEST_F(TaxDatasetTest, SaveWritesPlainIntegersAndShortestReals) {
    TaxDataset data;
    data.addColumn("i", std::vector<int64_t>{1, -2, 3});
    data.addColumn("r", std::vector<double>{1.5, 3.0, 0.1});

    const auto out = tmpFile("x13.csv");
    data.save(out.string());
    EXPECT_EQ(readFile(out), "i,r\n1,1.5\n-2,3.0\n3,0.1\n");
    EXPECT_FALSE(fs::exists(out.string() + ".tmp"));
}

TEST_F(TaxDatasetTest, SaveKeepsLargeIntegralRealsInFixedNotation) {
    TaxDataset data;
    data.addColumn("r", std::vector<double>{1000000.0, -250000.0, 0.00001, 0.0});
    const auto out = tmpFile("reals.csv");
    data.save(out.string());
    EXPECT_EQ(readFile(out), "r\n1000000.0\n-250000.0\n1e-05\n0.0\n");
}

TEST_F(TaxDatasetTest, SaveThenLoadKeepsValues) {
    const auto path = writeFile("puf.csv", kSampleRecordsCsv);
    TaxDataset data(path.string());
    data.load();
    data.save(tmpFile("copy.csv").string());

    TaxDataset copy(tmpFile("copy.csv").string());
    copy.load();
    ASSERT_EQ(copy.colCount(), data.colCount());
    for (size_t c = 0; c < data.colCount(); ++c) {
        EXPECT_EQ(copy.columns()[c].name, data.columns()[c].name);
        EXPECT_TRUE(copy.columns()[c].values == data.columns()[c].values) << data.columns()[c].name;
    }
}

TEST_F(TaxDatasetTest, SaveIntoMissingDirectoryIsIOError) {
    TaxDataset data;
    data.addColumn("i", std::vector<int64_t>{1});
    const auto out = tmpFile("missing") / "x13.csv";
    EXPECT_THROW(data.save(out.string()), TaxSynth::IOException);
    EXPECT_FALSE(fs::exists(out));
}
