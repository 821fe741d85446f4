#include <analysisgate/core/quality/quality_gate.hpp>

#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace AnalysisGate {

namespace {

// Human readable description of each count, indexed by [category][severity]
constexpr const char* kDescriptions[kGateCategoryCount][kSeverityCount] = {
    // TOTAL_FAILED
    {"Total number of issues",
     "Number of high priority issues",
     "Number of normal priority issues",
     "Number of low priority issues"},
    // TOTAL_UNSTABLE
    {"Total number of issues",
     "Number of high priority issues",
     "Number of normal priority issues",
     "Number of low priority issues"},
    // NEW_FAILED
    {"Number of new issues",
     "Number of new high priority issues",
     "Number of new normal priority issues",
     "Number of new low priority issues"},
    // NEW_UNSTABLE
    {"New number of new issues",
     "Number of new high priority issues",
     "Number of new normal priority issues",
     "Number of new low priority issues"},
};

bool isNewCategory(GateCategory category) {
    return category == GateCategory::NEW_FAILED || category == GateCategory::NEW_UNSTABLE;
}

[[noreturn]] void throwUnknownCategory(GateCategory category) {
    throw std::invalid_argument(fmt::format("Unknown gate category: {}", static_cast<int>(category)));
}

} // namespace

const char* toString(GateCategory category) {
    switch (category) {
        case GateCategory::TOTAL_FAILED:    return "TOTAL_FAILED";
        case GateCategory::TOTAL_UNSTABLE:  return "TOTAL_UNSTABLE";
        case GateCategory::NEW_FAILED:      return "NEW_FAILED";
        case GateCategory::NEW_UNSTABLE:    return "NEW_UNSTABLE";
        default:                            return "UNKNOWN";
    }
}

Result verdictOf(GateCategory category) {
    switch (category) {
        case GateCategory::TOTAL_FAILED:
        case GateCategory::NEW_FAILED:
            return Result::FAILURE;
        case GateCategory::TOTAL_UNSTABLE:
        case GateCategory::NEW_UNSTABLE:
            return Result::UNSTABLE;
        default:
            throwUnknownCategory(category);
    }
}

// ============================================================================
// QualityGate
// ============================================================================

QualityGate::QualityGate(const Thresholds& thresholds)
    : totalFailedThreshold_(thresholds.failedTotalAll, thresholds.failedTotalHigh,
                            thresholds.failedTotalNormal, thresholds.failedTotalLow),
      totalUnstableThreshold_(thresholds.unstableTotalAll, thresholds.unstableTotalHigh,
                              thresholds.unstableTotalNormal, thresholds.unstableTotalLow),
      newFailedThreshold_(thresholds.failedNewAll, thresholds.failedNewHigh,
                          thresholds.failedNewNormal, thresholds.failedNewLow),
      newUnstableThreshold_(thresholds.unstableNewAll, thresholds.unstableNewHigh,
                            thresholds.unstableNewNormal, thresholds.unstableNewLow) {
}

QualityGate::QualityGate(const ThresholdSet& totalFailedThreshold,
                         const ThresholdSet& totalUnstableThreshold,
                         const ThresholdSet& newFailedThreshold,
                         const ThresholdSet& newUnstableThreshold)
    : totalFailedThreshold_(totalFailedThreshold),
      totalUnstableThreshold_(totalUnstableThreshold),
      newFailedThreshold_(newFailedThreshold),
      newUnstableThreshold_(newUnstableThreshold) {
}

const ThresholdSet& QualityGate::getThreshold(GateCategory category) const {
    switch (category) {
        case GateCategory::TOTAL_FAILED:    return totalFailedThreshold_;
        case GateCategory::TOTAL_UNSTABLE:  return totalUnstableThreshold_;
        case GateCategory::NEW_FAILED:      return newFailedThreshold_;
        case GateCategory::NEW_UNSTABLE:    return newUnstableThreshold_;
        default:                            throwUnknownCategory(category);
    }
}

bool QualityGate::isEnabled() const {
    return totalFailedThreshold_.isEnabled()
        || totalUnstableThreshold_.isEnabled()
        || newFailedThreshold_.isEnabled()
        || newUnstableThreshold_.isEnabled();
}

QualityGateResult QualityGate::evaluate(const AnalysisRunCounts& run) const {
    QualityGateResult result(
        totalFailedThreshold_.evaluate(run.total, run.totalHigh, run.totalNormal, run.totalLow),
        totalUnstableThreshold_.evaluate(run.total, run.totalHigh, run.totalNormal, run.totalLow),
        newFailedThreshold_.evaluate(run.newTotal, run.newHigh, run.newNormal, run.newLow),
        newUnstableThreshold_.evaluate(run.newTotal, run.newHigh, run.newNormal, run.newLow),
        run,
        *this
    );

    spdlog::debug("[QualityGate] Evaluated run: total={} (H={} N={} L={}), new={} (H={} N={} L={}) -> {}",
                  run.total, run.totalHigh, run.totalNormal, run.totalLow,
                  run.newTotal, run.newHigh, run.newNormal, run.newLow,
                  toString(result.getOverallResult()));
    return result;
}

size_t QualityGate::hash() const {
    size_t result = totalUnstableThreshold_.hash();
    result = 31 * result + totalFailedThreshold_.hash();
    result = 31 * result + newUnstableThreshold_.hash();
    result = 31 * result + newFailedThreshold_.hash();
    return result;
}

bool QualityGate::operator==(const QualityGate& other) const {
    return totalFailedThreshold_ == other.totalFailedThreshold_
        && totalUnstableThreshold_ == other.totalUnstableThreshold_
        && newFailedThreshold_ == other.newFailedThreshold_
        && newUnstableThreshold_ == other.newUnstableThreshold_;
}

// ============================================================================
// QualityGateResult
// ============================================================================

QualityGateResult::QualityGateResult(const ThresholdResult& totalFailed,
                                     const ThresholdResult& totalUnstable,
                                     const ThresholdResult& newFailed,
                                     const ThresholdResult& newUnstable,
                                     const AnalysisRunCounts& run,
                                     const QualityGate& gate)
    : totalFailed_(totalFailed),
      totalUnstable_(totalUnstable),
      newFailed_(newFailed),
      newUnstable_(newUnstable),
      run_(run),
      gate_(gate) {
}

const ThresholdResult& QualityGateResult::getResult(GateCategory category) const {
    switch (category) {
        case GateCategory::TOTAL_FAILED:    return totalFailed_;
        case GateCategory::TOTAL_UNSTABLE:  return totalUnstable_;
        case GateCategory::NEW_FAILED:      return newFailed_;
        case GateCategory::NEW_UNSTABLE:    return newUnstable_;
        default:                            throwUnknownCategory(category);
    }
}

Result QualityGateResult::getOverallResult() const {
    if (!totalFailed_.isSuccess() || !newFailed_.isSuccess()) {
        return Result::FAILURE;
    }
    if (!totalUnstable_.isSuccess() || !newUnstable_.isSuccess()) {
        return Result::UNSTABLE;
    }
    return Result::SUCCESS;
}

std::vector<std::string> QualityGateResult::getEvaluations() const {
    std::vector<std::string> messages;
    for (GateCategory category : kGateCategories) {
        addMessages(messages, category);
    }
    return messages;
}

void QualityGateResult::addMessages(std::vector<std::string>& messages, GateCategory category) const {
    const ThresholdResult& result = getResult(category);
    const ThresholdSet& thresholds = gate_.getThreshold(category);

    for (Severity severity : kSeverities) {
        if (!result.isReached(severity)) {
            continue;
        }
        messages.push_back(fmt::format("{} -> {}: {} - Quality Gate: {}",
                                       toString(verdictOf(category)),
                                       kDescriptions[static_cast<size_t>(category)][indexOf(severity)],
                                       observedCount(category, severity),
                                       thresholds.getThreshold(severity)));
    }
}

uint32_t QualityGateResult::observedCount(GateCategory category, Severity severity) const {
    return isNewCategory(category) ? run_.newCount(severity) : run_.totalCount(severity);
}

// ============================================================================
// QualityGateBuilder
// ============================================================================

QualityGateBuilder& QualityGateBuilder::setTotalFailedThreshold(const ThresholdSet& threshold) {
    totalFailedThreshold_ = threshold;
    return *this;
}

QualityGateBuilder& QualityGateBuilder::setTotalUnstableThreshold(const ThresholdSet& threshold) {
    totalUnstableThreshold_ = threshold;
    return *this;
}

QualityGateBuilder& QualityGateBuilder::setNewFailedThreshold(const ThresholdSet& threshold) {
    newFailedThreshold_ = threshold;
    return *this;
}

QualityGateBuilder& QualityGateBuilder::setNewUnstableThreshold(const ThresholdSet& threshold) {
    newUnstableThreshold_ = threshold;
    return *this;
}

QualityGate QualityGateBuilder::build() const {
    return QualityGate(totalFailedThreshold_, totalUnstableThreshold_,
                       newFailedThreshold_, newUnstableThreshold_);
}

} // namespace AnalysisGate
