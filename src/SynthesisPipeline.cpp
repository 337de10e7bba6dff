#include "SynthesisPipeline.h"

#include "ColumnFilter.h"
#include "ConstraintRepairer.h"
#include "RandomStream.h"
#include "Sampler.h"
#include "TaxSynthExceptions.h"
#include "TerminalUI.h"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <system_error>
#ifdef TAXSYNTH_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
#ifdef TAXSYNTH_USE_NATIVE_PARQUET
bool exportParquetNative(const TaxDataset& data, const std::string& parquetPath, std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(data.colCount());
    arrays.reserve(data.colCount());

    for (const auto& col : data.columns()) {
        std::shared_ptr<arrow::Array> arr;
        arrow::Status status;
        if (col.kind == ColumnKind::INTEGER) {
            arrow::Int64Builder builder;
            const auto& vals = std::get<std::vector<int64_t>>(col.values);
            status = builder.AppendValues(vals);
            if (status.ok()) status = builder.Finish(&arr);
            fields.push_back(arrow::field(col.name, arrow::int64(), false));
        } else {
            arrow::DoubleBuilder builder;
            const auto& vals = std::get<std::vector<double>>(col.values);
            status = builder.AppendValues(vals);
            if (status.ok()) status = builder.Finish(&arr);
            fields.push_back(arrow::field(col.name, arrow::float64(), false));
        }
        if (!status.ok()) {
            errorOut = "Failed to build Arrow array for column '" + col.name + "': " + status.ToString();
            return false;
        }
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(data.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(data.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif
}

SynthesisPipeline::SynthesisPipeline(const SchemaRegistry& registry, std::ostream& log)
    : registry_(registry), log_(log) {}

void SynthesisPipeline::validateAgainstRegistry(const SynthConfig& config) const {
    for (const auto& name : config.skipColumns) {
        if (!registry_.isKnown(name)) {
            throw TaxSynth::ConfigurationException("skip column " + name + " is not a recognized input variable");
        }
    }
}

void SynthesisPipeline::validateAgainstDataset(const TaxDataset& data, const SynthConfig& config) const {
    if (config.mode != PipelineMode::SYNTHETIC) return;
    for (const auto& group : config.constraints) {
        if (!data.hasColumn(group.target)) {
            throw TaxSynth::DatasetException("constraint '" + group.describe() + "' needs missing column " + group.target);
        }
        for (const auto& source : group.sources) {
            if (!data.hasColumn(source)) {
                throw TaxSynth::DatasetException("constraint '" + group.describe() + "' needs missing column " + source);
            }
        }
    }
}

void SynthesisPipeline::auditSchemaAvailability(const TaxDataset& data) const {
    for (const auto& col : data.columns()) {
        if (!registry_.isKnown(col.name)) {
            TerminalUI::printWarning(log_, "column " + col.name +
                                     " is not a recognized input variable and is carried through unchanged by schema");
        }
    }
}

RandomizationReport SynthesisPipeline::transform(TaxDataset& data,
                                                 const SynthConfig& config,
                                                 const RunContext& context) const {
    const std::vector<std::string> argumentErrors = context.validationErrors();
    if (!argumentErrors.empty()) {
        throw TaxSynth::ConfigurationException(argumentErrors.front());
    }
    validateAgainstRegistry(config);
    validateAgainstDataset(data, config);

    const bool passThrough = config.mode == PipelineMode::PASS_THROUGH;
    if (config.trace) TerminalUI::printShape(log_, "shape before drop", data.rowCount(), data.colCount());

    ColumnFilter::run(data, config.activeDropColumns(), registry_);
    if (config.trace) TerminalUI::printShape(log_, "shape after drop", data.rowCount(), data.colCount());
    if (config.verbose) {
        TerminalUI::printProgress(log_, "Dropped " + std::to_string(config.activeDropColumns().size()) +
                                  " columns; " + std::to_string(data.colCount()) + " remain");
    }
    if (config.verbose || config.trace) auditSchemaAvailability(data);

    RandomizationReport report;
    if (passThrough) {
        Randomizer::stampTaxYear(data, config, context.year);
        Sampler::assignIdentifiers(data, config.idColumn);
        return report;
    }

    const uint32_t seed = static_cast<uint32_t>(context.seed);
    RandomStream rng(seed);

    if (config.verbose) TerminalUI::printProgress(log_, "Randomizing variables for tax year " + std::to_string(context.year));
    report = Randomizer::run(data, config, context.year, seed, rng);
    if (config.trace) TerminalUI::printRandomizationTrace(log_, report);

    if (config.verbose) {
        TerminalUI::printProgress(log_, "Restoring " + std::to_string(config.constraints.size()) + " accounting identities");
    }
    ConstraintRepairer::run(data, config.constraints);

    if (config.verbose) TerminalUI::printProgress(log_, "Sampling " + std::to_string(context.size) + " records");
    Sampler::run(data, static_cast<size_t>(context.size), seed, rng);
    Sampler::assignIdentifiers(data, config.idColumn);
    if (config.trace) TerminalUI::printShape(log_, "shape after sampling", data.rowCount(), data.colCount());
    return report;
}

SynthesisPipeline::NamedTotals SynthesisPipeline::namedTotals(const TaxDataset& data) {
    NamedTotals out;
    const std::vector<long double> totals = data.columnTotals();
    out.reserve(totals.size());
    for (size_t c = 0; c < totals.size(); ++c) out.emplace_back(data.columns()[c].name, totals[c]);
    return out;
}

std::vector<AggregateAuditRow> SynthesisPipeline::auditAggregates(const NamedTotals& input,
                                                                  const TaxDataset& written,
                                                                  const SynthConfig& config) {
    std::set<std::string> excluded{config.idColumn, config.yearColumn};
    for (const auto& name : config.activeDropColumns()) excluded.insert(name);

    const std::vector<long double> writtenTotals = written.columnTotals();
    std::vector<AggregateAuditRow> rows;
    std::set<std::string> inputNames;
    for (const auto& entry : input) {
        inputNames.insert(entry.first);
        if (excluded.count(entry.first)) continue;
        AggregateAuditRow row;
        row.column = entry.first;
        row.inputTotal = entry.second;
        const int idx = written.findColumnIndex(entry.first);
        if (idx < 0) {
            row.inBoth = false;
        } else {
            row.outputTotal = writtenTotals[static_cast<size_t>(idx)];
        }
        rows.push_back(row);
    }
    for (size_t c = 0; c < writtenTotals.size(); ++c) {
        const std::string& name = written.columns()[c].name;
        if (excluded.count(name) || inputNames.count(name)) continue;
        AggregateAuditRow row;
        row.column = name;
        row.outputTotal = writtenTotals[c];
        row.inBoth = false;
        rows.push_back(row);
    }
    return rows;
}

void SynthesisPipeline::auditWrittenOutput(const NamedTotals& input,
                                           const SynthConfig& config,
                                           const std::string& path) const {
    TaxDataset written(path);
    written.load();
    const std::vector<AggregateAuditRow> audit = auditAggregates(input, written, config);
    const bool mismatch = std::any_of(audit.begin(), audit.end(),
                                      [](const AggregateAuditRow& row) { return !row.matches(); });
    if (config.verbose || mismatch) TerminalUI::printAggregateAudit(log_, audit);
    if (mismatch) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw TaxSynth::DatasetException("pass-through output " + path + " aggregates differ from input aggregates");
    }
}

void SynthesisPipeline::exportParquet(const TaxDataset& data,
                                      const SynthConfig& config,
                                      long long year,
                                      const std::string& csvPath) const {
    const std::string parquetPath = config.outputPath(year, "parquet");
#ifdef TAXSYNTH_USE_NATIVE_PARQUET
    std::string parquetError;
    if (!exportParquetNative(data, parquetPath, parquetError)) {
        TerminalUI::printWarning(log_, "Native parquet export failed: " + parquetError +
                                 ". CSV export is available at " + csvPath);
    } else if (config.verbose) {
        TerminalUI::printProgress(log_, "Wrote " + parquetPath);
    }
#else
    (void)data;
    TerminalUI::printWarning(log_, "Parquet export to " + parquetPath +
                             " requested, but this build was compiled without native parquet support. "
                             "Rebuild with TAXSYNTH_ENABLE_PARQUET=ON. CSV export is available at " + csvPath);
#endif
}

PipelineResult SynthesisPipeline::run(const SynthConfig& config, const RunContext& context) const {
    if (!std::filesystem::is_regular_file(config.inputPath)) {
        throw TaxSynth::IOException(config.inputPath + " file not found");
    }

    TaxDataset data(config.inputPath);
    data.load();
    if (config.verbose) {
        TerminalUI::printProgress(log_, "Loaded " + std::to_string(data.rowCount()) + " rows x " +
                                  std::to_string(data.colCount()) + " columns from " + config.inputPath);
    }

    const bool passThrough = config.mode == PipelineMode::PASS_THROUGH;
    NamedTotals inputTotals;
    if (passThrough) inputTotals = namedTotals(data);

    PipelineResult result;
    result.randomization = transform(data, config, context);

    result.outputPath = config.outputPath(context.year);
    data.save(result.outputPath);
    result.rows = data.rowCount();
    result.cols = data.colCount();
    if (config.verbose) TerminalUI::printProgress(log_, "Wrote " + result.outputPath);
    if (passThrough) auditWrittenOutput(inputTotals, config, result.outputPath);

    if (config.exportFormat == "parquet") exportParquet(data, config, context.year, result.outputPath);
    return result;
}
