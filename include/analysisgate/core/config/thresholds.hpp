#pragma once

#include <cstdint>

namespace AnalysisGate {

/**
 * @struct Thresholds
 * @brief Flat quality gate configuration (4 categories x 4 severities)
 *
 * Every value is an issue count limit; 0 disables that limit.
 * - failedTotal*:   reaching it marks the build as FAILURE (all issues)
 * - unstableTotal*: reaching it marks the build as UNSTABLE (all issues)
 * - failedNew*:     reaching it marks the build as FAILURE (new issues)
 * - unstableNew*:   reaching it marks the build as UNSTABLE (new issues)
 */
struct Thresholds {
    uint32_t failedTotalAll = 0;
    uint32_t failedTotalHigh = 0;
    uint32_t failedTotalNormal = 0;
    uint32_t failedTotalLow = 0;

    uint32_t unstableTotalAll = 0;
    uint32_t unstableTotalHigh = 0;
    uint32_t unstableTotalNormal = 0;
    uint32_t unstableTotalLow = 0;

    uint32_t failedNewAll = 0;
    uint32_t failedNewHigh = 0;
    uint32_t failedNewNormal = 0;
    uint32_t failedNewLow = 0;

    uint32_t unstableNewAll = 0;
    uint32_t unstableNewHigh = 0;
    uint32_t unstableNewNormal = 0;
    uint32_t unstableNewLow = 0;
};

} // namespace AnalysisGate
