#include <spdlog/spdlog.h>
#include <exception>
#include <optional>

#include <analysisgate/core/config/loader.hpp>
#include <analysisgate/core/quality/gate_runner.hpp>
#include <analysisgate/core/quality/quality_gate.hpp>

using namespace AnalysisGate;

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(bool verbose) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::debug("AnalysisGate v1.0.0, build: {} {}", __DATE__, __TIME__);
}

static void printUsage(const char* program) {
    spdlog::error("Usage: {} <quality_gate.yaml> <analysis_run.yaml> [--verbose]", program);
}

int main(int argc, char* argv[]) {
    std::optional<CommandLine> commandLine = parseCommandLine(argc, argv);
    setupLogging(commandLine && commandLine->verbose);

    if (!commandLine) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    try {
        QualityGate gate(ConfigLoader::loadThresholds(commandLine->gatePath));
        AnalysisRunCounts run = ConfigLoader::loadRunCounts(commandLine->runPath);
        return toExitCode(enforceQualityGate(gate, run));
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitUsage;
    }
}
