#include <analysisgate/core/quality/gate_runner.hpp>

#include <cstring>
#include <vector>

#include <spdlog/spdlog.h>

namespace AnalysisGate {

std::optional<CommandLine> parseCommandLine(int argc, const char* const argv[]) {
    CommandLine commandLine;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            commandLine.verbose = true;
        } else {
            paths.emplace_back(argv[i]);
        }
    }

    if (paths.size() != 2) {
        return std::nullopt;
    }
    commandLine.gatePath = paths[0];
    commandLine.runPath = paths[1];
    return commandLine;
}

int toExitCode(Result result) {
    switch (result) {
        case Result::SUCCESS:   return kExitSuccess;
        case Result::UNSTABLE:  return kExitUnstable;
        case Result::FAILURE:   return kExitFailure;
        default:                return kExitUsage;
    }
}

Result enforceQualityGate(const QualityGate& gate, const AnalysisRunCounts& run) {
    if (!gate.isEnabled()) {
        spdlog::warn("[QualityGate] No thresholds enabled, skipping evaluation");
        return Result::SUCCESS;
    }

    QualityGateResult result = gate.evaluate(run);
    for (const std::string& message : result.getEvaluations()) {
        spdlog::warn("[QualityGate] {}", message);
    }

    Result overall = result.getOverallResult();
    if (overall == Result::SUCCESS) {
        spdlog::info("[QualityGate] Result: {}", toString(overall));
    } else {
        spdlog::error("[QualityGate] Result: {}", toString(overall));
    }
    return overall;
}

} // namespace AnalysisGate
