#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace AnalysisGate {

/**
 * Severity channels a ThresholdSet limits.
 * ALL is the overall issue count. Declaration order is the order
 * in which violations are reported.
 */
enum class Severity : uint8_t {
    ALL = 0,
    HIGH = 1,
    NORMAL = 2,
    LOW = 3
};

inline constexpr size_t kSeverityCount = 4;

inline constexpr std::array<Severity, kSeverityCount> kSeverities = {
    Severity::ALL,
    Severity::HIGH,
    Severity::NORMAL,
    Severity::LOW
};

inline constexpr size_t indexOf(Severity severity) {
    return static_cast<size_t>(severity);
}

const char* toString(Severity severity);

} // namespace AnalysisGate
