#pragma once

#include <string>
#include <analysisgate/core/analysis/run_counts.hpp>
#include <analysisgate/core/config/thresholds.hpp>

namespace AnalysisGate {

/**
 * Loads quality gate thresholds and run counts from YAML.
 *
 * Every value must be a non-negative integer. Any violation (missing
 * file, malformed YAML, missing required field, unknown key, wrong
 * type, negative value) throws std::runtime_error naming the key path.
 */
class ConfigLoader {
public:
    /**
     * Reads the `quality_gate` document. Omitted categories and
     * severities stay 0 (disabled).
     */
    static Thresholds loadThresholds(const std::string& filepath);
    static Thresholds parseThresholds(const std::string& yaml);

    /**
     * Reads the `analysis_run` document. All eight counts are required.
     */
    static AnalysisRunCounts loadRunCounts(const std::string& filepath);
    static AnalysisRunCounts parseRunCounts(const std::string& yaml);
};

} // namespace AnalysisGate
