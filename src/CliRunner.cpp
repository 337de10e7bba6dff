#include "CliRunner.h"

#include "SchemaRegistry.h"
#include "SynthConfig.h"
#include "SynthesisPipeline.h"
#include "TaxSynthExceptions.h"

#include <filesystem>
#include <string>

namespace {
constexpr const char* kUsageHint = "USAGE: taxsynth --help";

std::string programName(int argc, char* argv[]) {
    if (argc < 1 || argv[0] == nullptr) return "taxsynth";
    const std::string name = std::filesystem::path(argv[0]).filename().string();
    return name.empty() ? "taxsynth" : name;
}
}

int runCli(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    CommandLine cmd;
    try {
        cmd = CommandLine::parse(argc, argv);
    } catch (const TaxSynth::TaxSynthException& e) {
        err << "ERROR: " << e.what() << "\n" << kUsageHint << "\n";
        return 1;
    }

    if (cmd.showHelp) {
        printUsage(out, programName(argc, argv));
        return 0;
    }

    const std::vector<std::string> argumentErrors = cmd.context.validationErrors();
    if (!argumentErrors.empty()) {
        for (const auto& line : argumentErrors) err << line << "\n";
        err << kUsageHint << "\n";
        return 1;
    }

    try {
        const ColumnSchemaRegistry registry = cmd.config.schemaFile.empty()
            ? ColumnSchemaRegistry::taxCalculatorInputs()
            : ColumnSchemaRegistry::fromFile(cmd.config.schemaFile);
        SynthesisPipeline pipeline(registry, out);
        pipeline.run(cmd.config, cmd.context);
    } catch (const TaxSynth::TaxSynthException& e) {
        err << "ERROR: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        err << "ERROR: unexpected failure: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
