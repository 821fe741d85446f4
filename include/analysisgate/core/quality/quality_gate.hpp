#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <analysisgate/core/analysis/run_counts.hpp>
#include <analysisgate/core/config/thresholds.hpp>
#include <analysisgate/core/quality/result.hpp>
#include <analysisgate/core/quality/severity.hpp>
#include <analysisgate/core/quality/threshold_set.hpp>

namespace AnalysisGate {

/**
 * The four independent threshold categories of a quality gate.
 * Declaration order is the order in which violations are reported.
 */
enum class GateCategory : uint8_t {
    TOTAL_FAILED = 0,
    TOTAL_UNSTABLE = 1,
    NEW_FAILED = 2,
    NEW_UNSTABLE = 3
};

inline constexpr size_t kGateCategoryCount = 4;

inline constexpr std::array<GateCategory, kGateCategoryCount> kGateCategories = {
    GateCategory::TOTAL_FAILED,
    GateCategory::TOTAL_UNSTABLE,
    GateCategory::NEW_FAILED,
    GateCategory::NEW_UNSTABLE
};

const char* toString(GateCategory category);

/**
 * Verdict a category contributes when one of its limits is reached.
 * Throws std::invalid_argument for a value outside GateCategory.
 */
Result verdictOf(GateCategory category);

class QualityGateResult;

/**
 * @class QualityGate
 * @brief Quality gate for a static analysis run
 *
 * Holds four ThresholdSets and evaluates the total counts of a run
 * against the total-* categories and the new counts against the
 * new-* categories. Immutable after construction and safe for
 * concurrent evaluation of many runs.
 */
class QualityGate {
public:
    /**
     * All categories disabled
     */
    QualityGate() = default;

    explicit QualityGate(const Thresholds& thresholds);

    QualityGate(const ThresholdSet& totalFailedThreshold,
                const ThresholdSet& totalUnstableThreshold,
                const ThresholdSet& newFailedThreshold,
                const ThresholdSet& newUnstableThreshold);

    const ThresholdSet& getTotalFailedThreshold() const { return totalFailedThreshold_; }
    const ThresholdSet& getTotalUnstableThreshold() const { return totalUnstableThreshold_; }
    const ThresholdSet& getNewFailedThreshold() const { return newFailedThreshold_; }
    const ThresholdSet& getNewUnstableThreshold() const { return newUnstableThreshold_; }

    /**
     * @throws std::invalid_argument for a value outside GateCategory
     */
    const ThresholdSet& getThreshold(GateCategory category) const;

    /**
     * True if any category has at least one non-zero limit
     */
    bool isEnabled() const;

    /**
     * Enforces this quality gate for the specified run
     * @param run Issue counts of the run
     * @return Per-category results with the aggregated verdict
     */
    QualityGateResult evaluate(const AnalysisRunCounts& run) const;

    size_t hash() const;

    bool operator==(const QualityGate& other) const;
    bool operator!=(const QualityGate& other) const { return !(*this == other); }

private:
    ThresholdSet totalFailedThreshold_;
    ThresholdSet totalUnstableThreshold_;
    ThresholdSet newFailedThreshold_;
    ThresholdSet newUnstableThreshold_;
};

/**
 * @class QualityGateResult
 * @brief Result of a QualityGate evaluation
 *
 * Keeps the counts and the gate it was computed from, so the
 * violation messages can be rendered without extra context.
 */
class QualityGateResult {
public:
    QualityGateResult(const ThresholdResult& totalFailed,
                      const ThresholdResult& totalUnstable,
                      const ThresholdResult& newFailed,
                      const ThresholdResult& newUnstable,
                      const AnalysisRunCounts& run,
                      const QualityGate& gate);

    const ThresholdResult& getTotalFailed() const { return totalFailed_; }
    const ThresholdResult& getTotalUnstable() const { return totalUnstable_; }
    const ThresholdResult& getNewFailed() const { return newFailed_; }
    const ThresholdResult& getNewUnstable() const { return newUnstable_; }

    // Throws std::invalid_argument for a value outside GateCategory
    const ThresholdResult& getResult(GateCategory category) const;

    /**
     * FAILURE if a failed category was reached, else UNSTABLE if an
     * unstable category was reached, else SUCCESS
     */
    Result getOverallResult() const;

    /**
     * One message per reached limit, ordered by category
     * (total-failed, total-unstable, new-failed, new-unstable) and
     * by severity (all, high, normal, low) within a category
     */
    std::vector<std::string> getEvaluations() const;

private:
    void addMessages(std::vector<std::string>& messages, GateCategory category) const;
    uint32_t observedCount(GateCategory category, Severity severity) const;

    ThresholdResult totalFailed_;
    ThresholdResult totalUnstable_;
    ThresholdResult newFailed_;
    ThresholdResult newUnstable_;

    AnalysisRunCounts run_;
    QualityGate gate_;
};

/**
 * Assembles a QualityGate from independently supplied ThresholdSets.
 * Categories that are never set stay disabled.
 */
class QualityGateBuilder {
public:
    QualityGateBuilder& setTotalFailedThreshold(const ThresholdSet& threshold);
    QualityGateBuilder& setTotalUnstableThreshold(const ThresholdSet& threshold);
    QualityGateBuilder& setNewFailedThreshold(const ThresholdSet& threshold);
    QualityGateBuilder& setNewUnstableThreshold(const ThresholdSet& threshold);

    QualityGate build() const;

private:
    ThresholdSet totalFailedThreshold_;
    ThresholdSet totalUnstableThreshold_;
    ThresholdSet newFailedThreshold_;
    ThresholdSet newUnstableThreshold_;
};

} // namespace AnalysisGate

namespace std {

template <>
struct hash<AnalysisGate::QualityGate> {
    size_t operator()(const AnalysisGate::QualityGate& gate) const {
        return gate.hash();
    }
};

} // namespace std
