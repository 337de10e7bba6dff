#pragma once
#include "RandomStream.h"
#include "TaxDataset.h"
#include <cstdint>
#include <string>

class Sampler {
public:
    /**
     * @brief Keeps sampleSize rows drawn without replacement.
     * @details Reseeds rng with `seed`, permutes all row indices and keeps the
     *          first sampleSize of them in permutation order, so a fixed seed
     *          and row count always select the same rows.
     * @throws TaxSynth::OutOfRangeException when sampleSize is 0 or exceeds rowCount().
     */
    static void run(TaxDataset& data, size_t sampleSize, uint32_t seed, RandomStream& rng);

    /**
     * @brief Overwrites (or appends) idColumn with 1..rowCount() in row order.
     */
    static void assignIdentifiers(TaxDataset& data, const std::string& idColumn);
};
