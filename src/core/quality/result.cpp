#include <analysisgate/core/quality/result.hpp>

namespace AnalysisGate {

const char* toString(Result result) {
    switch (result) {
        case Result::SUCCESS:   return "SUCCESS";
        case Result::UNSTABLE:  return "UNSTABLE";
        case Result::FAILURE:   return "FAILURE";
        default:                return "UNKNOWN";
    }
}

Result combine(Result lhs, Result rhs) {
    return isWorseThan(lhs, rhs) ? lhs : rhs;
}

} // namespace AnalysisGate
