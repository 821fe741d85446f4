#pragma once

#include <cstdint>

namespace AnalysisGate {

/**
 * Build verdict produced by a quality gate.
 * Values are ordered from best to worst; the host build system maps
 * them 1:1 onto its own result type.
 */
enum class Result : uint8_t {
    SUCCESS = 0,    // All thresholds passed
    UNSTABLE = 1,   // An unstable threshold was reached
    FAILURE = 2     // A failed threshold was reached
};

/**
 * String representation for logging and messages
 */
const char* toString(Result result);

/**
 * Returns the worse of both results
 */
Result combine(Result lhs, Result rhs);

inline bool isWorseThan(Result lhs, Result rhs) {
    return lhs > rhs;
}

} // namespace AnalysisGate
