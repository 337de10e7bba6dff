#include "SynthesisPipeline.h"
#include "TaxSynthExceptions.h"
#include "TestSupport.h"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class SynthesisPipelineTest : public TempDirTest {
protected:
    ColumnSchemaRegistry registry_ = ColumnSchemaRegistry::taxCalculatorInputs();
    std::ostringstream log_;

    SynthConfig sampleConfig() {
        SynthConfig config;
        config.inputPath = writeFile("puf.csv", kSampleRecordsCsv).string();
        config.outputDir = tmpDir_.string();
        config.dropColumns = {"filer", "s006"};
        config.skipColumns = {"RECID", "MARS", "FLPDYR"};
        config.constraints = {ConstraintGroup::sum("e00200", "e00200p", "e00200s"),
                              ConstraintGroup::dominance("e00600", "e00650")};
        return config;
    }
};

// ============================================================================
// Synthetic mode
// ============================================================================

TEST_F(SynthesisPipelineTest, WritesSeededSample) {
    const SynthConfig config = sampleConfig();
    SynthesisPipeline pipeline(registry_, log_);
    const PipelineResult result = pipeline.run(config, RunContext{2013, 42, 4});

    EXPECT_EQ(result.outputPath, (tmpDir_ / "x13.csv").string());
    EXPECT_EQ(result.rows, 4u);
    EXPECT_EQ(result.cols, 8u);
    EXPECT_EQ(readFile(result.outputPath),
              "RECID,MARS,FLPDYR,e00200,e00200p,e00200s,e00600,e00650\n"
              "1,1,2013,130770,130770,0,568,397\n"
              "2,2,2013,189604,138712,50892,0,0\n"
              "3,2,2013,250178,140250,109928,8819,8188\n"
              "4,1,2013,0,0,0,2984,2107\n");
}

TEST_F(SynthesisPipelineTest, FullSampleKeepsEveryRowOnce) {
    const SynthConfig config = sampleConfig();
    SynthesisPipeline pipeline(registry_, log_);
    const PipelineResult result = pipeline.run(config, RunContext{2023, 7, 6});

    EXPECT_EQ(readFile(result.outputPath),
              "RECID,MARS,FLPDYR,e00200,e00200p,e00200s,e00600,e00650\n"
              "1,2,2023,-1028,-1028,0,184,148\n"
              "2,2,2023,288947,166398,122549,14636,9264\n"
              "3,1,2023,125828,125828,0,747,482\n"
              "4,1,2023,0,0,0,3399,2666\n"
              "5,2,2023,191873,118879,72994,0,0\n"
              "6,4,2023,74700,74700,0,0,0\n");
}

TEST_F(SynthesisPipelineTest, SameArgumentsGiveIdenticalBytes) {
    const SynthConfig config = sampleConfig();
    SynthesisPipeline pipeline(registry_, log_);
    const std::string first = readFile(pipeline.run(config, RunContext{2017, 123456, 5}).outputPath);
    const std::string second = readFile(pipeline.run(config, RunContext{2017, 123456, 5}).outputPath);
    EXPECT_EQ(first, second);

    const std::string other = readFile(pipeline.run(config, RunContext{2017, 123457, 5}).outputPath);
    EXPECT_NE(first, other);
}

TEST_F(SynthesisPipelineTest, TransformRestoresIdentitiesAndIds) {
    const SynthConfig config = sampleConfig();
    TaxDataset data(config.inputPath);
    data.load();
    SynthesisPipeline pipeline(registry_, log_);
    pipeline.transform(data, config, RunContext{2019, 555, 5});

    ASSERT_EQ(data.rowCount(), 5u);
    const auto total = data.integerValues("e00200");
    const auto p = data.integerValues("e00200p");
    const auto s = data.integerValues("e00200s");
    const auto div = data.integerValues("e00600");
    const auto qdiv = data.integerValues("e00650");
    const auto ids = data.integerValues("RECID");
    for (size_t r = 0; r < data.rowCount(); ++r) {
        EXPECT_EQ(total[r], p[r] + s[r]);
        EXPECT_GE(div[r], qdiv[r]);
        EXPECT_EQ(ids[r], static_cast<int64_t>(r + 1));
    }
    EXPECT_FALSE(data.hasColumn("filer"));
    EXPECT_FALSE(data.hasColumn("s006"));
}

TEST_F(SynthesisPipelineTest, TraceReportsShapesAndColumns) {
    SynthConfig config = sampleConfig();
    config.trace = true;
    SynthesisPipeline pipeline(registry_, log_);
    pipeline.run(config, RunContext{2013, 42, 4});

    const std::string log = log_.str();
    EXPECT_NE(log.find("shape before drop: (6, 10)"), std::string::npos) << log;
    EXPECT_NE(log.find("shape after drop: (6, 8)"), std::string::npos) << log;
    EXPECT_NE(log.find("e00200 int64 -400 int64 -1000\n"), std::string::npos) << log;
    EXPECT_NE(log.find("e00650 float64 0.0 int64 0\n"), std::string::npos) << log;
    EXPECT_NE(log.find("randomization skips: 3"), std::string::npos) << log;
    EXPECT_NE(log.find("shape after sampling: (4, 8)"), std::string::npos) << log;
}

TEST_F(SynthesisPipelineTest, VerboseWarnsAboutUnregisteredColumns) {
    SynthConfig config = sampleConfig();
    config.verbose = true;
    const ColumnSchemaRegistry narrow({"RECID", "FLPDYR", "filer", "s006", "e00200", "e00200p",
                                       "e00200s", "e00600", "e00650"});
    config.skipColumns = {"RECID", "FLPDYR"};
    SynthesisPipeline pipeline(narrow, log_);
    pipeline.run(config, RunContext{2013, 42, 4});
    EXPECT_NE(log_.str().find("[TaxSynth][Warning] column MARS is not a recognized input variable"),
              std::string::npos) << log_.str();
}

// ============================================================================
// Pass-through mode
// ============================================================================

TEST_F(SynthesisPipelineTest, PassThroughReproducesInputAggregates) {
    SynthConfig config = sampleConfig();
    config.mode = PipelineMode::PASS_THROUGH;
    config.verbose = true;
    SynthesisPipeline pipeline(registry_, log_);
    const PipelineResult result = pipeline.run(config, RunContext{2020, 1, 1});

    EXPECT_EQ(result.rows, 6u);
    EXPECT_TRUE(result.randomization.columns.empty());
    EXPECT_EQ(readFile(result.outputPath),
              "RECID,MARS,FLPDYR,e00200,e00200p,e00200s,e00600,e00650,s006\n"
              "1,1,2020,52000,52000,0,300,200.0,1250.5\n"
              "2,2,2020,91000,60000,31000,0,0.0,980.25\n"
              "3,1,2020,0,0,0,1200,1150.5,1100.0\n"
              "4,2,2020,-400,-400,0,75,80.0,1020.75\n"
              "5,4,2020,33000,33000,0,0,0.0,1300.0\n"
              "6,2,2020,120000,70000,50000,5000,4000.0,870.5\n");
    EXPECT_NE(log_.str().find("PASS-THROUGH AGGREGATES"), std::string::npos);
    EXPECT_EQ(log_.str().find("MISMATCH"), std::string::npos);
}

TEST_F(SynthesisPipelineTest, AggregateAuditFlagsChangedAndMissingColumns) {
    SynthConfig config = sampleConfig();
    config.mode = PipelineMode::PASS_THROUGH;
    config.passThroughDropColumns = {"filer"};

    TaxDataset input;
    input.addColumn("RECID", std::vector<int64_t>{7, 9});
    input.addColumn("filer", std::vector<int64_t>{1, 1});
    input.addColumn("e00200", std::vector<int64_t>{100, 200});
    input.addColumn("e00300", std::vector<double>{0.1, 0.2});
    input.addColumn("e00600", std::vector<int64_t>{5, 5});
    const SynthesisPipeline::NamedTotals totals = SynthesisPipeline::namedTotals(input);

    const auto path = writeFile("written.csv",
                                "RECID,e00200,e00300,e00900\n"
                                "1,100,0.1,4\n"
                                "2,201,0.2,0\n");
    TaxDataset written(path.string());
    written.load();

    const std::vector<AggregateAuditRow> rows = SynthesisPipeline::auditAggregates(totals, written, config);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].column, "e00200");
    EXPECT_FALSE(rows[0].matches());
    EXPECT_EQ(rows[1].column, "e00300");
    EXPECT_TRUE(rows[1].matches());
    EXPECT_EQ(rows[2].column, "e00600");
    EXPECT_FALSE(rows[2].inBoth);
    EXPECT_EQ(rows[3].column, "e00900");
    EXPECT_FALSE(rows[3].inBoth);
}

TEST_F(SynthesisPipelineTest, PassThroughAuditReadsTheWrittenFile) {
    SynthConfig config = sampleConfig();
    config.mode = PipelineMode::PASS_THROUGH;
    SynthesisPipeline pipeline(registry_, log_);
    const PipelineResult result = pipeline.run(config, RunContext{2020, 1, 1});

    TaxDataset source(config.inputPath);
    source.load();
    TaxDataset written(result.outputPath);
    written.load();
    for (const auto& row : SynthesisPipeline::auditAggregates(SynthesisPipeline::namedTotals(source), written, config)) {
        EXPECT_TRUE(row.matches()) << row.column;
    }

    // Same totals against a tampered copy of the output.
    std::string text = readFile(result.outputPath);
    text.replace(text.find("52000,52000"), 11, "52001,52000");
    const auto tampered = writeFile("tampered.csv", text);
    TaxDataset changed(tampered.string());
    changed.load();
    const auto rows = SynthesisPipeline::auditAggregates(SynthesisPipeline::namedTotals(source), changed, config);
    EXPECT_TRUE(std::any_of(rows.begin(), rows.end(),
                            [](const AggregateAuditRow& row) { return row.column == "e00200" && !row.matches(); }));
    EXPECT_EQ(log_.str().find("PASS-THROUGH AGGREGATES"), std::string::npos);
}

// ============================================================================
// Failures leave no output
// ============================================================================

TEST_F(SynthesisPipelineTest, SizeAboveRowCountIsOutOfRange) {
    const SynthConfig config = sampleConfig();
    SynthesisPipeline pipeline(registry_, log_);
    EXPECT_THROW(pipeline.run(config, RunContext{2013, 42, 7}), TaxSynth::OutOfRangeException);
    EXPECT_FALSE(fs::exists(tmpDir_ / "x13.csv"));
}

TEST_F(SynthesisPipelineTest, MissingInputIsIOError) {
    SynthConfig config = sampleConfig();
    config.inputPath = tmpFile("absent.csv").string();
    SynthesisPipeline pipeline(registry_, log_);
    EXPECT_THROW(pipeline.run(config, RunContext{2013, 42, 4}), TaxSynth::IOException);
    EXPECT_FALSE(fs::exists(tmpDir_ / "x13.csv"));
}

TEST_F(SynthesisPipelineTest, OutOfRangeYearIsRejected) {
    const SynthConfig config = sampleConfig();
    SynthesisPipeline pipeline(registry_, log_);
    EXPECT_THROW(pipeline.run(config, RunContext{2012, 42, 4}), TaxSynth::ConfigurationException);
    EXPECT_FALSE(fs::exists(tmpDir_ / "x12.csv"));
}

TEST_F(SynthesisPipelineTest, DropColumnProblemsAreConfigurationErrors) {
    SynthConfig absent = sampleConfig();
    absent.dropColumns = {"filer", "e09700"};
    SynthesisPipeline pipeline(registry_, log_);
    EXPECT_THROW(pipeline.run(absent, RunContext{2013, 42, 4}), TaxSynth::ConfigurationException);

    SynthConfig unknown = sampleConfig();
    unknown.dropColumns = {"filer", "not_a_variable"};
    EXPECT_THROW(pipeline.run(unknown, RunContext{2013, 42, 4}), TaxSynth::ConfigurationException);

    SynthConfig twice = sampleConfig();
    twice.dropColumns = {"filer", "filer"};
    EXPECT_THROW(pipeline.run(twice, RunContext{2013, 42, 4}), TaxSynth::ConfigurationException);
    EXPECT_FALSE(fs::exists(tmpDir_ / "x13.csv"));
}

TEST_F(SynthesisPipelineTest, UnknownSkipColumnIsConfigurationError) {
    SynthConfig config = sampleConfig();
    config.skipColumns.push_back("not_a_variable");
    SynthesisPipeline pipeline(registry_, log_);
    EXPECT_THROW(pipeline.run(config, RunContext{2013, 42, 4}), TaxSynth::ConfigurationException);
}

TEST_F(SynthesisPipelineTest, MissingConstraintColumnIsDatasetError) {
    SynthConfig config = sampleConfig();
    config.constraints.push_back(ConstraintGroup::dominance("e01500", "e01700"));
    SynthesisPipeline pipeline(registry_, log_);
    EXPECT_THROW(pipeline.run(config, RunContext{2013, 42, 4}), TaxSynth::DatasetException);
    EXPECT_FALSE(fs::exists(tmpDir_ / "x13.csv"));
}

#ifndef TAXSYNTH_USE_NATIVE_PARQUET
TEST_F(SynthesisPipelineTest, ParquetWithoutSupportWarnsAndKeepsCsv) {
    SynthConfig config = sampleConfig();
    config.exportFormat = "parquet";
    SynthesisPipeline pipeline(registry_, log_);
    const PipelineResult result = pipeline.run(config, RunContext{2013, 42, 4});
    EXPECT_TRUE(fs::exists(result.outputPath));
    EXPECT_FALSE(fs::exists(tmpDir_ / "x13.parquet"));
    EXPECT_NE(log_.str().find("without native parquet support"), std::string::npos);
}
#endif
