#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

enum class PipelineMode { SYNTHETIC, PASS_THROUGH };

// Valid ranges of the three positional arguments.
constexpr long long kMinTaxYear = 2013;
constexpr long long kMaxTaxYear = 2023;
constexpr long long kMinSeed = 1;
constexpr long long kMaxSeed = 999999999;
constexpr long long kMinSampleSize = 1;
constexpr long long kMaxSampleSize = 100000;

/**
 * One accounting identity restored after randomization.
 *   SUM:       target = sources[0] + sources[1]
 *   DOMINANCE: target = max(target, sources[0])
 */
struct ConstraintGroup {
    enum class Kind { SUM, DOMINANCE };
    Kind kind = Kind::SUM;
    std::string target;
    std::vector<std::string> sources;

    static ConstraintGroup sum(std::string target, std::string partA, std::string partB);
    static ConstraintGroup dominance(std::string target, std::string related);

    /**
     * @brief Parses "t=a+b" or "t>=r".
     * @throws TaxSynth::ConfigurationException on any other form.
     */
    static ConstraintGroup parse(const std::string& text);
    std::string describe() const;
};

/**
 * Target tax year, random seed and sample size of one invocation.
 * A missing positional argument stays 0, which is outside every valid range.
 */
struct RunContext {
    long long year = 0;
    long long seed = 0;
    long long size = 0;

    /**
     * @brief Checks each argument against its range independently.
     * @return One "ERROR: ..." line per violation; empty when all are valid.
     */
    std::vector<std::string> validationErrors() const;
};

struct SynthConfig {
    std::string inputPath;
    std::string outputDir = ".";
    std::string schemaFile;
    std::string exportFormat = "csv";    // csv|parquet
    PipelineMode mode = PipelineMode::SYNTHETIC;

    std::vector<std::string> dropColumns = {
        "filer", "s006", "cmbtp", "nu05", "nu13", "elderly_dependent",
        "e09700", "e09800", "e09900", "e11200"
    };
    std::vector<std::string> passThroughDropColumns = {"filer"};
    std::vector<std::string> skipColumns = {
        "RECID", "MARS", "DSI", "MIDR", "FLPDYR", "age_head", "age_spouse",
        "XTOT", "EIC", "n24", "f2441", "f6251"
    };
    std::vector<ConstraintGroup> constraints = {
        ConstraintGroup::sum("e00200", "e00200p", "e00200s"),
        ConstraintGroup::sum("e00900", "e00900p", "e00900s"),
        ConstraintGroup::sum("e02100", "e02100p", "e02100s"),
        ConstraintGroup::dominance("e00600", "e00650"),
        ConstraintGroup::dominance("e01500", "e01700")
    };

    double annualDrift = 0.03;
    double noiseStdDev = 0.25;
    long long driftBaseYear = 2009;
    std::string yearColumn = "FLPDYR";
    std::string idColumn = "RECID";

    bool trace = false;
    bool verbose = false;

    const std::vector<std::string>& activeDropColumns() const {
        return mode == PipelineMode::PASS_THROUGH ? passThroughDropColumns : dropColumns;
    }
    bool isSkipped(const std::string& column) const;

    /**
     * @brief Output path: <outputDir>/x<YY>.<extension>, YY being the two-digit year.
     */
    std::string outputPath(long long year, const std::string& extension = "csv") const;

    /**
     * @brief Loads key: value pairs (loose YAML/JSON) on top of `base`.
     * @throws TaxSynth::ConfigurationException on parse/validation failures.
     */
    static SynthConfig fromFile(const std::string& configPath, const SynthConfig& base);

    /**
     * @brief Applies one configuration key, as used by config files and CLI flags.
     * @throws TaxSynth::ConfigurationException on unknown keys or invalid values.
     */
    void assign(const std::string& key, const std::string& value);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws TaxSynth::ConfigurationException on invalid values.
     */
    void validate() const;
};

struct CommandLine {
    SynthConfig config;
    RunContext context;
    bool showHelp = false;

    /**
     * @brief Parses "YEAR SEED SIZE [options]".
     * @post config is validated; context is not (see RunContext::validationErrors).
     * @throws TaxSynth::ConfigurationException on malformed arguments.
     */
    static CommandLine parse(int argc, char* argv[]);
};

std::string defaultInputPath(const char* argv0);
void printUsage(std::ostream& out, const std::string& prog);
