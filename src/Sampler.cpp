#include "Sampler.h"
#include "TaxSynthExceptions.h"

#include <numeric>
#include <vector>

void Sampler::run(TaxDataset& data, size_t sampleSize, uint32_t seed, RandomStream& rng) {
    if (sampleSize == 0 || sampleSize > data.rowCount()) {
        throw TaxSynth::OutOfRangeException("cannot sample " + std::to_string(sampleSize) +
                                            " rows without replacement from " +
                                            std::to_string(data.rowCount()) + " available rows");
    }
    rng.reseed(seed);
    std::vector<size_t> order = rng.permutation(data.rowCount());
    order.resize(sampleSize);
    data.selectRows(order);
}

void Sampler::assignIdentifiers(TaxDataset& data, const std::string& idColumn) {
    std::vector<int64_t> ids(data.rowCount());
    std::iota(ids.begin(), ids.end(), int64_t{1});
    data.setIntegerColumn(idColumn, std::move(ids));
}
