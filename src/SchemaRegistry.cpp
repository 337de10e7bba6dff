#include "SchemaRegistry.h"
#include "CommonUtils.h"
#include "TaxSynthExceptions.h"

#include <fstream>

ColumnSchemaRegistry ColumnSchemaRegistry::taxCalculatorInputs() {
    return ColumnSchemaRegistry({
        "RECID", "MARS", "FLPDYR", "DSI", "EIC", "XTOT", "MIDR",
        "age_head", "age_spouse", "agi_bin", "blind_head", "blind_spouse",
        "a_lineno", "ffpos", "fips", "h_seq", "filer", "s006", "cmbtp",
        "e00200", "e00200p", "e00200s", "e00300", "e00400", "e00600", "e00650",
        "e00700", "e00800", "e00900", "e00900p", "e00900s", "e01100", "e01200",
        "e01400", "e01500", "e01700", "e02000", "e02100", "e02100p", "e02100s",
        "e02300", "e02400", "e03150", "e03210", "e03220", "e03230", "e03240",
        "e03270", "e03290", "e03300", "e03400", "e03500", "e07240", "e07260",
        "e07300", "e07400", "e07600", "e09700", "e09800", "e09900", "e11200",
        "e17500", "e18400", "e18500", "e19200", "e19800", "e20100", "e20400",
        "g20500", "e24515", "e24518", "e26270", "e27200", "e32800", "e58990",
        "e62900", "e87521", "e87530", "elderly_dependent", "f2441", "f6251",
        "k1bx14p", "k1bx14s", "n24", "nu05", "nu13", "nu18", "n1820", "n21",
        "p08000", "p22250", "p23250",
        "PT_SSTB_income", "PT_binc_w2_wages", "PT_ubia_property",
        "housing_ben", "mcaid_ben", "mcare_ben", "other_ben", "snap_ben",
        "ssi_ben", "tanf_ben", "vet_ben", "wic_ben"
    });
}

ColumnSchemaRegistry ColumnSchemaRegistry::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw TaxSynth::IOException("Could not open schema file: " + path);

    std::set<std::string> names;
    std::string line;
    while (std::getline(in, line)) {
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = CommonUtils::trim(line);
        if (!line.empty()) names.insert(line);
    }
    if (names.empty()) {
        throw TaxSynth::ConfigurationException("Schema file lists no column names: " + path);
    }
    return ColumnSchemaRegistry(std::move(names));
}
