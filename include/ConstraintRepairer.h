#pragma once
#include "SynthConfig.h"
#include "TaxDataset.h"
#include <vector>

class ConstraintRepairer {
public:
    /**
     * @brief Recomputes each constraint target from its already randomized sources.
     * @details Groups are applied in order; SUM sets target = a + b row by row,
     *          DOMINANCE sets target = max(target, related). No random draws.
     * @throws TaxSynth::DatasetException when a referenced column is absent or a
     *         sum does not fit in int64; the dataset is left unchanged for that group.
     */
    static void run(TaxDataset& data, const std::vector<ConstraintGroup>& constraints);
};
