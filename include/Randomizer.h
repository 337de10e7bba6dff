#pragma once
#include "RandomStream.h"
#include "SynthConfig.h"
#include "TaxDataset.h"
#include <cstdint>
#include <string>
#include <vector>

struct ColumnTrace {
    std::string name;
    std::string oldType;   // int64|float64
    double oldMin = 0.0;
    std::string newType;
    int64_t newMin = 0;
};

struct RandomizationReport {
    std::vector<ColumnTrace> columns;
    size_t skipCount = 0;
};

class Randomizer {
public:
    /**
     * @brief Multiplies every eligible column by independent normal noise.
     * @details Reseeds rng with `seed`, stamps the year column, then walks the
     *          columns in dataset order. For each column not on the skip list,
     *          one factor per row is drawn from N(1 + drift * (year - base), sd)
     *          and the value becomes round(v) + round(round(v) * factor).
     *          Columns whose rounded minimum is >= 0 are floored at zero.
     *          The column walk and per-row draw order fix the output for a seed.
     * @throws TaxSynth::DatasetException when a perturbed value overflows int64.
     */
    static RandomizationReport run(TaxDataset& data,
                                   const SynthConfig& config,
                                   long long taxYear,
                                   uint32_t seed,
                                   RandomStream& rng);

    /**
     * @brief Sets every row of the configured year column to taxYear.
     */
    static void stampTaxYear(TaxDataset& data, const SynthConfig& config, long long taxYear);

    static double noiseMean(const SynthConfig& config, long long taxYear) {
        return 1.0 + config.annualDrift * static_cast<double>(taxYear - config.driftBaseYear);
    }
};
