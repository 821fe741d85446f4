#pragma once

#include <cstdint>
#include <analysisgate/core/quality/severity.hpp>

namespace AnalysisGate {

/**
 * @struct AnalysisRunCounts
 * @brief Issue counts of one static analysis run
 *
 * "total" counts every issue of the run, "new" only the issues that
 * were introduced since the reference build. Filled in by whoever
 * collected the run; total >= totalHigh + totalNormal + totalLow is
 * expected but not checked here.
 */
struct AnalysisRunCounts {
    uint32_t total = 0;
    uint32_t totalHigh = 0;
    uint32_t totalNormal = 0;
    uint32_t totalLow = 0;

    uint32_t newTotal = 0;
    uint32_t newHigh = 0;
    uint32_t newNormal = 0;
    uint32_t newLow = 0;

    uint32_t totalCount(Severity severity) const {
        switch (severity) {
            case Severity::ALL:     return total;
            case Severity::HIGH:    return totalHigh;
            case Severity::NORMAL:  return totalNormal;
            case Severity::LOW:     return totalLow;
        }
        return 0;
    }

    uint32_t newCount(Severity severity) const {
        switch (severity) {
            case Severity::ALL:     return newTotal;
            case Severity::HIGH:    return newHigh;
            case Severity::NORMAL:  return newNormal;
            case Severity::LOW:     return newLow;
        }
        return 0;
    }
};

} // namespace AnalysisGate
