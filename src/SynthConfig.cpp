#include "SynthConfig.h"
#include "CommonUtils.h"
#include "TaxSynthExceptions.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value, const std::string& key, Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw TaxSynth::ConfigurationException("Invalid number for " + key + ": " + value);
        }
        return parsed;
    } catch (const TaxSynth::TaxSynthException&) {
        throw;
    } catch (const std::exception& ex) {
        throw TaxSynth::ConfigurationException("Invalid number for " + key + ": " + value + " (" + ex.what() + ")");
    }
}

long long parseIntegerStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<long long>(
        CommonUtils::trim(value), key,
        [](const std::string& v, size_t* pos) { return std::stoll(v, pos); });
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    const double parsed = parseNumericStrict<double>(
        CommonUtils::trim(value), key,
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw TaxSynth::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw TaxSynth::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

// Drops braces outside quotes and a trailing comma so "key": "value", lines parse like YAML.
std::string stripStructuralTokens(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t last = out.find_last_not_of(" \t\r\n");
    if (last != std::string::npos && out[last] == ',') out.erase(last, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        else if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void requireKnownColumnName(const std::string& name, const std::string& key) {
    if (name.empty() || name.find_first_of(" \t,") != std::string::npos) {
        throw TaxSynth::ConfigurationException("Invalid column name for " + key + ": '" + name + "'");
    }
}
}

ConstraintGroup ConstraintGroup::sum(std::string target, std::string partA, std::string partB) {
    ConstraintGroup g;
    g.kind = Kind::SUM;
    g.target = std::move(target);
    g.sources = {std::move(partA), std::move(partB)};
    return g;
}

ConstraintGroup ConstraintGroup::dominance(std::string target, std::string related) {
    ConstraintGroup g;
    g.kind = Kind::DOMINANCE;
    g.target = std::move(target);
    g.sources = {std::move(related)};
    return g;
}

ConstraintGroup ConstraintGroup::parse(const std::string& text) {
    const std::string t = CommonUtils::trim(text);
    const size_t ge = t.find(">=");
    if (ge != std::string::npos) {
        const std::string target = CommonUtils::trim(t.substr(0, ge));
        const std::string related = CommonUtils::trim(t.substr(ge + 2));
        if (target.empty() || related.empty()) {
            throw TaxSynth::ConfigurationException("Malformed dominance constraint: " + t);
        }
        return dominance(target, related);
    }

    const size_t eq = t.find('=');
    const size_t plus = t.find('+', eq == std::string::npos ? 0 : eq);
    if (eq == std::string::npos || plus == std::string::npos) {
        throw TaxSynth::ConfigurationException("Constraint must be 'total=partA+partB' or 'column>=related': " + t);
    }
    const std::string target = CommonUtils::trim(t.substr(0, eq));
    const std::string partA = CommonUtils::trim(t.substr(eq + 1, plus - eq - 1));
    const std::string partB = CommonUtils::trim(t.substr(plus + 1));
    if (target.empty() || partA.empty() || partB.empty() || partB.find('+') != std::string::npos) {
        throw TaxSynth::ConfigurationException("Malformed sum constraint: " + t);
    }
    return sum(target, partA, partB);
}

std::string ConstraintGroup::describe() const {
    if (kind == Kind::DOMINANCE) return target + " >= " + sources.at(0);
    return target + " = " + sources.at(0) + " + " + sources.at(1);
}

std::vector<std::string> RunContext::validationErrors() const {
    std::vector<std::string> errors;
    auto check = [&](const char* name, long long value, long long lo, long long hi) {
        if (value < lo || value > hi) {
            errors.push_back("ERROR: " + std::string(name) + " " + std::to_string(value) + " not in [" +
                             std::to_string(lo) + "," + std::to_string(hi) + "] range");
        }
    };
    check("YEAR", year, kMinTaxYear, kMaxTaxYear);
    check("SEED", seed, kMinSeed, kMaxSeed);
    check("SIZE", size, kMinSampleSize, kMaxSampleSize);
    return errors;
}

bool SynthConfig::isSkipped(const std::string& column) const {
    return std::find(skipColumns.begin(), skipColumns.end(), column) != skipColumns.end();
}

std::string SynthConfig::outputPath(long long year, const std::string& extension) const {
    std::ostringstream name;
    name << 'x' << std::setw(2) << std::setfill('0') << (year % 100) << '.' << extension;
    return (std::filesystem::path(outputDir.empty() ? "." : outputDir) / name.str()).string();
}

void SynthConfig::assign(const std::string& rawKey, const std::string& value) {
    const std::string key = normalizeConfigKey(rawKey);

    static const std::unordered_map<std::string, std::string SynthConfig::*> stringFields = {
        {"input", &SynthConfig::inputPath},
        {"output_dir", &SynthConfig::outputDir},
        {"schema_file", &SynthConfig::schemaFile},
        {"year_column", &SynthConfig::yearColumn},
        {"id_column", &SynthConfig::idColumn}
    };
    static const std::unordered_map<std::string, std::vector<std::string> SynthConfig::*> listFields = {
        {"drop", &SynthConfig::dropColumns},
        {"passthrough_drop", &SynthConfig::passThroughDropColumns},
        {"skip", &SynthConfig::skipColumns}
    };
    static const std::unordered_map<std::string, bool SynthConfig::*> boolFields = {
        {"trace", &SynthConfig::trace},
        {"verbose", &SynthConfig::verbose}
    };

    if (auto it = stringFields.find(key); it != stringFields.end()) {
        this->*(it->second) = CommonUtils::trim(value);
        return;
    }
    if (auto it = listFields.find(key); it != listFields.end()) {
        std::vector<std::string> names = CommonUtils::splitList(value);
        for (const auto& n : names) requireKnownColumnName(n, key);
        this->*(it->second) = std::move(names);
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        this->*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (key == "export") {
        exportFormat = CommonUtils::toLower(CommonUtils::trim(value));
        return;
    }
    if (key == "mode") {
        const std::string m = CommonUtils::toLower(CommonUtils::trim(value));
        if (m == "synthetic") mode = PipelineMode::SYNTHETIC;
        else if (m == "passthrough" || m == "pass_through" || m == "debug") mode = PipelineMode::PASS_THROUGH;
        else throw TaxSynth::ConfigurationException("mode must be one of: synthetic, passthrough");
        return;
    }
    if (key == "constraints") {
        std::vector<ConstraintGroup> parsed;
        for (const auto& item : CommonUtils::splitList(value)) parsed.push_back(ConstraintGroup::parse(item));
        constraints = std::move(parsed);
        return;
    }
    if (key == "annual_drift") {
        annualDrift = parseDoubleStrict(value, key);
        return;
    }
    if (key == "noise_std_dev") {
        noiseStdDev = parseDoubleStrict(value, key);
        return;
    }
    if (key == "drift_base_year") {
        driftBaseYear = parseIntegerStrict(value, key);
        return;
    }
    throw TaxSynth::ConfigurationException("Unknown configuration key: " + rawKey);
}

SynthConfig SynthConfig::fromFile(const std::string& configPath, const SynthConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw TaxSynth::ConfigurationException("Could not open config file: " + configPath);

    SynthConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokens(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw TaxSynth::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": expected 'key: value'");
        }

        try {
            config.assign(maybeUnquote(line.substr(0, sep)), maybeUnquote(line.substr(sep + 1)));
        } catch (const TaxSynth::TaxSynthException& ex) {
            throw TaxSynth::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();
    return config;
}

void SynthConfig::validate() const {
    if (inputPath.empty()) {
        throw TaxSynth::ConfigurationException("input path is required");
    }
    if (exportFormat != "csv" && exportFormat != "parquet") {
        throw TaxSynth::ConfigurationException("export must be one of: csv, parquet");
    }
    if (noiseStdDev < 0.0) {
        throw TaxSynth::ConfigurationException("noise_std_dev must be >= 0");
    }
    if (yearColumn.empty() || idColumn.empty()) {
        throw TaxSynth::ConfigurationException("year_column and id_column must be non-empty");
    }
    for (const auto& g : constraints) {
        const size_t expected = (g.kind == ConstraintGroup::Kind::SUM) ? 2 : 1;
        if (g.target.empty() || g.sources.size() != expected) {
            throw TaxSynth::ConfigurationException("Malformed constraint group for target '" + g.target + "'");
        }
        if (isSkipped(g.target)) {
            throw TaxSynth::ConfigurationException("Constraint target " + g.target + " is on the skip list");
        }
        for (const auto& source : g.sources) {
            if (isSkipped(source)) {
                throw TaxSynth::ConfigurationException("Constraint column " + source + " in '" + g.describe() +
                                                       "' is on the skip list");
            }
        }
    }
}

CommandLine CommandLine::parse(int argc, char* argv[]) {
    CommandLine cmd;
    SynthConfig base;
    base.inputPath = defaultInputPath(argc > 0 ? argv[0] : nullptr);

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw TaxSynth::ConfigurationException("Missing value for " + arg);
            return argv[++i];
        };
        if (arg == "--help" || arg == "-h") {
            cmd.showHelp = true;
        } else if (arg == "--config") {
            configPath = next();
        } else if (arg == "--input") {
            overrides.emplace_back("input", next());
        } else if (arg == "--output-dir") {
            overrides.emplace_back("output_dir", next());
        } else if (arg == "--schema") {
            overrides.emplace_back("schema_file", next());
        } else if (arg == "--export") {
            overrides.emplace_back("export", next());
        } else if (arg == "--passthrough") {
            overrides.emplace_back("mode", "passthrough");
        } else if (arg == "--trace") {
            overrides.emplace_back("trace", "true");
        } else if (arg == "--verbose") {
            overrides.emplace_back("verbose", "true");
        } else if (arg.rfind("--", 0) == 0) {
            throw TaxSynth::ConfigurationException("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (cmd.showHelp) return cmd;

    if (positional.size() > 3) {
        throw TaxSynth::ConfigurationException("Too many positional arguments (expected YEAR SEED SIZE)");
    }
    const char* names[3] = {"YEAR", "SEED", "SIZE"};
    long long* targets[3] = {&cmd.context.year, &cmd.context.seed, &cmd.context.size};
    for (size_t p = 0; p < positional.size(); ++p) {
        *targets[p] = parseIntegerStrict(positional[p], names[p]);
    }

    cmd.config = configPath.empty() ? base : SynthConfig::fromFile(configPath, base);
    for (const auto& kv : overrides) cmd.config.assign(kv.first, kv.second);
    cmd.config.validate();
    return cmd;
}

std::string defaultInputPath(const char* argv0) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        ec.clear();
        exe = fs::absolute(fs::path(argv0 ? argv0 : ""), ec);
    }
    return (exe.parent_path().parent_path() / "puf.csv").string();
}

void printUsage(std::ostream& out, const std::string& prog) {
    out << "Usage: " << prog << " YEAR SEED SIZE [options]\n"
              << "Adds random amounts to most variables in the puf.csv input file and writes the\n"
              << "randomized, sub-sampled CSV file to xYY.csv, where YY is the two-digit tax year.\n"
              << "Positional arguments:\n"
              << "  YEAR                     Tax year; must be in [" << kMinTaxYear << "," << kMaxTaxYear << "] range\n"
              << "  SEED                     Random-number seed; must be in [" << kMinSeed << "," << kMaxSeed << "] range\n"
              << "  SIZE                     Sample size; must be in [" << kMinSampleSize << "," << kMaxSampleSize << "] range\n"
              << "Options:\n"
              << "  --config <file>          Load key: value settings (see SynthConfig keys)\n"
              << "  --input <file>           Source CSV (default: puf.csv in the top-level directory)\n"
              << "  --output-dir <dir>       Directory for xYY.csv (default: current directory)\n"
              << "  --schema <file>          Recognized input columns, one per line\n"
              << "  --export <csv|parquet>   Output format (parquet also writes the CSV)\n"
              << "  --passthrough            No randomization or sampling; aggregates must match the input\n"
              << "  --trace                  Write per-column randomization trace to stdout\n"
              << "  --verbose                Enable stage progress logs\n"
              << "  --help                   Show this help message\n";
}
