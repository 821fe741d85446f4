#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <analysisgate/core/quality/severity.hpp>

namespace AnalysisGate {

/**
 * Outcome of evaluating one ThresholdSet: which limits were reached.
 */
class ThresholdResult {
public:
    ThresholdResult() = default;
    ThresholdResult(bool totalReached, bool highReached, bool normalReached, bool lowReached);

    bool isTotalReached() const { return isReached(Severity::ALL); }
    bool isHighReached() const { return isReached(Severity::HIGH); }
    bool isNormalReached() const { return isReached(Severity::NORMAL); }
    bool isLowReached() const { return isReached(Severity::LOW); }

    bool isReached(Severity severity) const { return reached_[indexOf(severity)]; }

    /**
     * True if no limit was reached
     */
    bool isSuccess() const;

    bool operator==(const ThresholdResult& other) const { return reached_ == other.reached_; }
    bool operator!=(const ThresholdResult& other) const { return !(*this == other); }

private:
    std::array<bool, kSeverityCount> reached_{};
};

/**
 * @class ThresholdSet
 * @brief One threshold category: limits for the overall, high, normal
 *        and low issue counts
 *
 * A limit of 0 is disabled and is never reached. An enabled limit is
 * reached as soon as the observed count is equal to or above it.
 * Immutable; safe to evaluate concurrently.
 */
class ThresholdSet {
public:
    ThresholdSet() = default;
    ThresholdSet(uint32_t totalThreshold, uint32_t highThreshold,
                 uint32_t normalThreshold, uint32_t lowThreshold);

    uint32_t getTotalThreshold() const { return getThreshold(Severity::ALL); }
    uint32_t getHighThreshold() const { return getThreshold(Severity::HIGH); }
    uint32_t getNormalThreshold() const { return getThreshold(Severity::NORMAL); }
    uint32_t getLowThreshold() const { return getThreshold(Severity::LOW); }

    uint32_t getThreshold(Severity severity) const { return limits_[indexOf(severity)]; }

    /**
     * True if at least one of the four limits is non-zero
     */
    bool isEnabled() const;

    ThresholdResult evaluate(uint32_t total, uint32_t high, uint32_t normal, uint32_t low) const;

    size_t hash() const;

    bool operator==(const ThresholdSet& other) const { return limits_ == other.limits_; }
    bool operator!=(const ThresholdSet& other) const { return !(*this == other); }

private:
    static bool isReached(uint32_t limit, uint32_t count);

    std::array<uint32_t, kSeverityCount> limits_{};
};

/**
 * Fluent builder for ThresholdSet. All limits start disabled.
 * Values are kept across build() calls, so a builder can be
 * reconfigured and built again. Not thread-safe.
 */
class ThresholdSetBuilder {
public:
    ThresholdSetBuilder& setTotalThreshold(uint32_t threshold);
    ThresholdSetBuilder& setHighThreshold(uint32_t threshold);
    ThresholdSetBuilder& setNormalThreshold(uint32_t threshold);
    ThresholdSetBuilder& setLowThreshold(uint32_t threshold);

    ThresholdSet build() const;

private:
    uint32_t totalThreshold_ = 0;
    uint32_t highThreshold_ = 0;
    uint32_t normalThreshold_ = 0;
    uint32_t lowThreshold_ = 0;
};

} // namespace AnalysisGate

namespace std {

template <>
struct hash<AnalysisGate::ThresholdSet> {
    size_t operator()(const AnalysisGate::ThresholdSet& thresholds) const {
        return thresholds.hash();
    }
};

} // namespace std
