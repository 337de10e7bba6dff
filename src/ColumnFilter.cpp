#include "ColumnFilter.h"
#include "TaxSynthExceptions.h"

#include <set>

void ColumnFilter::run(TaxDataset& data,
                       const std::vector<std::string>& dropColumns,
                       const SchemaRegistry& registry) {
    std::set<std::string> seen;
    for (const auto& name : dropColumns) {
        if (!seen.insert(name).second) {
            throw TaxSynth::ConfigurationException("variable " + name + " already dropped");
        }
        if (!registry.isKnown(name)) {
            throw TaxSynth::ConfigurationException("drop column " + name +
                                                   " is not a recognized input variable (already dropped?)");
        }
        if (!data.hasColumn(name)) {
            throw TaxSynth::ConfigurationException("drop column " + name + " is not present in " +
                                                   (data.filename().empty() ? std::string("the dataset") : data.filename()));
        }
    }
    for (const auto& name : dropColumns) data.dropColumn(name);
}
