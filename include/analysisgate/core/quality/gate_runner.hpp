#pragma once

#include <optional>
#include <string>

#include <analysisgate/core/analysis/run_counts.hpp>
#include <analysisgate/core/quality/quality_gate.hpp>
#include <analysisgate/core/quality/result.hpp>

namespace AnalysisGate {

// ============================================================================
// Exit codes reported to the calling build system
// ============================================================================

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUsage = 1;      // Bad arguments or configuration
inline constexpr int kExitUnstable = 2;
inline constexpr int kExitFailure = 3;

/**
 * Arguments of `analysisgate <quality_gate.yaml> <analysis_run.yaml> [--verbose]`
 */
struct CommandLine {
    std::string gatePath;
    std::string runPath;
    bool verbose = false;
};

/**
 * @return nullopt unless exactly two paths were given
 */
std::optional<CommandLine> parseCommandLine(int argc, const char* const argv[]);

int toExitCode(Result result);

/**
 * Evaluates the run and logs every violation and the verdict.
 * A gate without any enabled limit is skipped with a warning and
 * reported as SUCCESS.
 */
Result enforceQualityGate(const QualityGate& gate, const AnalysisRunCounts& run);

} // namespace AnalysisGate
