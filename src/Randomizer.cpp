#include "Randomizer.h"
#include "TaxSynthExceptions.h"

#include <algorithm>
#include <cmath>
#include <variant>

namespace {
// 2^63 is exactly representable; every double strictly below it fits int64.
constexpr double kInt64Bound = 9223372036854775808.0;

double columnMinimum(const DataColumn& col) {
    return std::visit([](const auto& values) -> double {
        if (values.empty()) return 0.0;
        return static_cast<double>(*std::min_element(values.begin(), values.end()));
    }, col.values);
}
}

void Randomizer::stampTaxYear(TaxDataset& data, const SynthConfig& config, long long taxYear) {
    data.setIntegerColumn(config.yearColumn, std::vector<int64_t>(data.rowCount(), static_cast<int64_t>(taxYear)));
}

RandomizationReport Randomizer::run(TaxDataset& data,
                                    const SynthConfig& config,
                                    long long taxYear,
                                    uint32_t seed,
                                    RandomStream& rng) {
    stampTaxYear(data, config, taxYear);

    const size_t rows = data.rowCount();
    const double mean = noiseMean(config, taxYear);
    const double sdev = config.noiseStdDev;
    rng.reseed(seed);

    RandomizationReport report;
    std::vector<double> factors(rows);
    for (const std::string& name : data.columnNames()) {
        if (name == config.yearColumn || config.isSkipped(name)) {
            ++report.skipCount;
            continue;
        }

        const DataColumn& source = data.columns()[static_cast<size_t>(data.findColumnIndex(name))];
        ColumnTrace trace;
        trace.name = name;
        trace.oldType = (source.kind == ColumnKind::INTEGER) ? "int64" : "float64";
        trace.oldMin = columnMinimum(source);

        const std::vector<int64_t> oldInt = data.integerValues(name);
        for (size_t r = 0; r < rows; ++r) factors[r] = rng.normal(mean, sdev);

        const bool allowNegative = !oldInt.empty() && *std::min_element(oldInt.begin(), oldInt.end()) < 0;
        std::vector<int64_t> next(rows);
        for (size_t r = 0; r < rows; ++r) {
            const double base = static_cast<double>(oldInt[r]);
            // A zero base yields a zero addon, so sparsity survives.
            const double raw = base + std::nearbyint(base * factors[r]);
            if (!(raw > -kInt64Bound && raw < kInt64Bound)) {
                throw TaxSynth::DatasetException("Randomized value overflows int64 in column " + name +
                                                 " at row " + std::to_string(r + 1));
            }
            const int64_t value = static_cast<int64_t>(raw);
            next[r] = allowNegative ? value : std::max<int64_t>(value, 0);
        }

        trace.newType = "int64";
        trace.newMin = next.empty() ? 0 : *std::min_element(next.begin(), next.end());
        data.setIntegerColumn(name, std::move(next));
        report.columns.push_back(std::move(trace));
    }
    return report;
}
