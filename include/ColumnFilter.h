#pragma once
#include "SchemaRegistry.h"
#include "TaxDataset.h"
#include <string>
#include <vector>

class ColumnFilter {
public:
    /**
     * @brief Removes every column named in dropColumns.
     * @details All names are checked before the first column is removed, so a
     *          rejected configuration leaves the dataset untouched.
     * @throws TaxSynth::ConfigurationException when a name is unknown to the
     *         registry (stale configuration), absent from the dataset, or
     *         listed twice.
     */
    static void run(TaxDataset& data,
                    const std::vector<std::string>& dropColumns,
                    const SchemaRegistry& registry);
};
