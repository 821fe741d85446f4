#include <analysisgate/core/quality/threshold_set.hpp>

#include <algorithm>

using namespace AnalysisGate;

// ============================================================================
// ThresholdResult
// ============================================================================

ThresholdResult::ThresholdResult(bool totalReached, bool highReached, bool normalReached, bool lowReached)
    : reached_{totalReached, highReached, normalReached, lowReached} {
}

bool ThresholdResult::isSuccess() const {
    return std::none_of(reached_.begin(), reached_.end(), [](bool reached) { return reached; });
}

// ============================================================================
// ThresholdSet
// ============================================================================

ThresholdSet::ThresholdSet(uint32_t totalThreshold, uint32_t highThreshold,
                           uint32_t normalThreshold, uint32_t lowThreshold)
    : limits_{totalThreshold, highThreshold, normalThreshold, lowThreshold} {
}

bool ThresholdSet::isEnabled() const {
    return std::any_of(limits_.begin(), limits_.end(), [](uint32_t limit) { return limit > 0; });
}

ThresholdResult ThresholdSet::evaluate(uint32_t total, uint32_t high, uint32_t normal, uint32_t low) const {
    return ThresholdResult(
        isReached(getTotalThreshold(), total),
        isReached(getHighThreshold(), high),
        isReached(getNormalThreshold(), normal),
        isReached(getLowThreshold(), low)
    );
}

// A disabled limit (0) is never reached, not even by a count of 0
bool ThresholdSet::isReached(uint32_t limit, uint32_t count) {
    return limit > 0 && count >= limit;
}

size_t ThresholdSet::hash() const {
    size_t result = 0;
    for (uint32_t limit : limits_) {
        result = 31 * result + limit;
    }
    return result;
}

// ============================================================================
// ThresholdSetBuilder
// ============================================================================

ThresholdSetBuilder& ThresholdSetBuilder::setTotalThreshold(uint32_t threshold) {
    totalThreshold_ = threshold;
    return *this;
}

ThresholdSetBuilder& ThresholdSetBuilder::setHighThreshold(uint32_t threshold) {
    highThreshold_ = threshold;
    return *this;
}

ThresholdSetBuilder& ThresholdSetBuilder::setNormalThreshold(uint32_t threshold) {
    normalThreshold_ = threshold;
    return *this;
}

ThresholdSetBuilder& ThresholdSetBuilder::setLowThreshold(uint32_t threshold) {
    lowThreshold_ = threshold;
    return *this;
}

ThresholdSet ThresholdSetBuilder::build() const {
    return ThresholdSet(totalThreshold_, highThreshold_, normalThreshold_, lowThreshold_);
}
