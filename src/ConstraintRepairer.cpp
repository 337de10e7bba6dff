#include "ConstraintRepairer.h"
#include "TaxSynthExceptions.h"

#include <algorithm>
#include <limits>
#include <string>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
bool addOverflows(int64_t a, int64_t b) {
    if (b > 0) return a > std::numeric_limits<int64_t>::max() - b;
    return a < std::numeric_limits<int64_t>::min() - b;
}
}

void ConstraintRepairer::run(TaxDataset& data, const std::vector<ConstraintGroup>& constraints) {
    const long long rows = static_cast<long long>(data.rowCount());
    for (const auto& group : constraints) {
        std::vector<int64_t> target = data.integerValues(group.target);
        const std::vector<int64_t> first = data.integerValues(group.sources.at(0));

        if (group.kind == ConstraintGroup::Kind::SUM) {
            const std::vector<int64_t> second = data.integerValues(group.sources.at(1));
            long long overflowRow = rows;
            #ifdef USE_OPENMP
            #pragma omp parallel for schedule(static) reduction(min:overflowRow)
            #endif
            for (long long r = 0; r < rows; ++r) {
                const size_t i = static_cast<size_t>(r);
                if (addOverflows(first[i], second[i])) {
                    overflowRow = std::min(overflowRow, r);
                    continue;
                }
                target[i] = first[i] + second[i];
            }
            if (overflowRow < rows) {
                throw TaxSynth::DatasetException("constraint '" + group.describe() + "' overflows int64 at row " +
                                                 std::to_string(overflowRow + 1));
            }
        } else {
            #ifdef USE_OPENMP
            #pragma omp parallel for schedule(static)
            #endif
            for (long long r = 0; r < rows; ++r) {
                const size_t i = static_cast<size_t>(r);
                target[i] = std::max(target[i], first[i]);
            }
        }
        data.setIntegerColumn(group.target, std::move(target));
    }
}
