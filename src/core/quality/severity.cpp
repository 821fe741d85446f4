#include <analysisgate/core/quality/severity.hpp>

namespace AnalysisGate {

const char* toString(Severity severity) {
    switch (severity) {
        case Severity::ALL:     return "ALL";
        case Severity::HIGH:    return "HIGH";
        case Severity::NORMAL:  return "NORMAL";
        case Severity::LOW:     return "LOW";
        default:                return "UNKNOWN";
    }
}

} // namespace AnalysisGate
