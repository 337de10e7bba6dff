#pragma once

#include "Randomizer.h"
#include "SchemaRegistry.h"
#include "SynthConfig.h"
#include "TaxDataset.h"
#include "TerminalUI.h"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

struct PipelineResult {
    std::string outputPath;
    size_t rows = 0;
    size_t cols = 0;
    RandomizationReport randomization;
};

/**
 * Load -> filter -> randomize -> repair -> sample -> assign ids -> write.
 *
 * The mode stored in SynthConfig decides which stages run: PASS_THROUGH keeps
 * only the filter, the year stamp and the id reassignment. run() then reloads
 * the written CSV and audits that every other column total is unchanged.
 */
class SynthesisPipeline final {
public:
    explicit SynthesisPipeline(const SchemaRegistry& registry, std::ostream& log);

    /**
     * @brief Runs every in-memory stage on an already loaded dataset.
     * @throws TaxSynth::ConfigurationException for invalid run arguments or
     *         columns outside the registry.
     * @throws TaxSynth::DatasetException when required columns are missing
     *         or the sample is out of range.
     */
    RandomizationReport transform(TaxDataset& data, const SynthConfig& config, const RunContext& context) const;

    /**
     * @brief Full run: loads config.inputPath, transforms, writes config.outputPath(year).
     * @post The output file exists only when every stage succeeded.
     * @throws TaxSynth::IOException when the input is missing or the output cannot be written.
     * @throws TaxSynth::DatasetException when a pass-through output file does not
     *         reproduce the input totals; the file is removed first.
     */
    PipelineResult run(const SynthConfig& config, const RunContext& context) const;

    using NamedTotals = std::vector<std::pair<std::string, long double>>;

    // Column totals in column order.
    static NamedTotals namedTotals(const TaxDataset& data);

    /**
     * @brief Compares input totals with the totals of a written dataset.
     * @details The id, year and active drop columns are excluded. A column found on
     *          only one side yields a row with inBoth == false.
     */
    static std::vector<AggregateAuditRow> auditAggregates(const NamedTotals& input,
                                                          const TaxDataset& written,
                                                          const SynthConfig& config);

private:
    const SchemaRegistry& registry_;
    std::ostream& log_;

    void validateAgainstRegistry(const SynthConfig& config) const;
    void validateAgainstDataset(const TaxDataset& data, const SynthConfig& config) const;
    void auditSchemaAvailability(const TaxDataset& data) const;
    void auditWrittenOutput(const NamedTotals& input, const SynthConfig& config, const std::string& path) const;
    void exportParquet(const TaxDataset& data, const SynthConfig& config, long long year,
                       const std::string& csvPath) const;
};
