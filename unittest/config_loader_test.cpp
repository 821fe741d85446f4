// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML quality gate / analysis run loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <analysisgate/core/config/loader.hpp>
#include <analysisgate/core/quality/quality_gate.hpp>

using namespace AnalysisGate;

static std::string testFile(const std::string& name) {
    return std::string(ANALYSISGATE_TEST_CONFIG_DIR) + "/" + name;
}

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidQualityGate) {
    Thresholds thresholds = ConfigLoader::loadThresholds(testFile("valid_gate.yaml"));

    EXPECT_EQ(thresholds.failedTotalAll, 100u);
    EXPECT_EQ(thresholds.failedTotalHigh, 5u);
    EXPECT_EQ(thresholds.failedTotalNormal, 0u);
    EXPECT_EQ(thresholds.unstableTotalAll, 50u);
    EXPECT_EQ(thresholds.unstableTotalHigh, 0u);
    EXPECT_EQ(thresholds.failedNewAll, 10u);
    EXPECT_EQ(thresholds.failedNewHigh, 1u);
    EXPECT_EQ(thresholds.failedNewNormal, 2u);
    EXPECT_EQ(thresholds.failedNewLow, 3u);

    // new.unstable omitted -> disabled
    EXPECT_EQ(thresholds.unstableNewAll, 0u);
    EXPECT_EQ(thresholds.unstableNewLow, 0u);
}

TEST(ConfigLoader, LoadValidAnalysisRun) {
    AnalysisRunCounts run = ConfigLoader::loadRunCounts(testFile("valid_run.yaml"));

    EXPECT_EQ(run.total, 15u);
    EXPECT_EQ(run.totalHigh, 2u);
    EXPECT_EQ(run.totalNormal, 8u);
    EXPECT_EQ(run.totalLow, 5u);
    EXPECT_EQ(run.newTotal, 4u);
    EXPECT_EQ(run.newHigh, 1u);
    EXPECT_EQ(run.newNormal, 2u);
    EXPECT_EQ(run.newLow, 1u);
}

TEST(ConfigLoader, LoadedFilesEvaluateEndToEnd) {
    QualityGate gate(ConfigLoader::loadThresholds(testFile("valid_gate.yaml")));
    AnalysisRunCounts run = ConfigLoader::loadRunCounts(testFile("valid_run.yaml"));

    QualityGateResult result = gate.evaluate(run);

    // new.failed high=1 reached by newHigh=1, new.failed normal=2 reached by newNormal=2
    EXPECT_EQ(result.getOverallResult(), Result::FAILURE);
    std::vector<std::string> expected = {
        "FAILURE -> Number of new high priority issues: 1 - Quality Gate: 1",
        "FAILURE -> Number of new normal priority issues: 2 - Quality Gate: 2",
    };
    EXPECT_EQ(result.getEvaluations(), expected);
}

TEST(ConfigLoader, EmptyGateDisablesEverything) {
    Thresholds thresholds = ConfigLoader::parseThresholds("quality_gate:\n");
    EXPECT_FALSE(QualityGate(thresholds).isEnabled());
}

TEST(ConfigLoader, ParseInlineGate) {
    Thresholds thresholds = ConfigLoader::parseThresholds(
        "quality_gate:\n"
        "  new:\n"
        "    unstable: { all: 1 }\n");

    EXPECT_EQ(thresholds.unstableNewAll, 1u);
    EXPECT_EQ(QualityGate(thresholds).getNewUnstableThreshold(), ThresholdSet(1, 0, 0, 0));
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadThresholds(testFile("non_existent.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadRunCounts(testFile("invalid/missing_field.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadThresholds(testFile("invalid/invalid_type.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadThresholds(testFile("invalid/invalid_value.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnUnknownField) {
    EXPECT_THROW(
        ConfigLoader::loadThresholds(testFile("invalid/unknown_field.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMalformedYaml) {
    EXPECT_THROW(
        ConfigLoader::loadThresholds(testFile("invalid/malformed.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRoot) {
    EXPECT_THROW(ConfigLoader::parseThresholds("thresholds: {}\n"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::parseRunCounts("quality_gate: {}\n"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnFractionalCount) {
    EXPECT_THROW(
        ConfigLoader::parseRunCounts(
            "analysis_run:\n"
            "  total: { all: 1.5, high: 0, normal: 0, low: 0 }\n"
            "  new:   { all: 0, high: 0, normal: 0, low: 0 }\n"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ErrorMessageNamesKeyPath) {
    try {
        ConfigLoader::loadThresholds(testFile("invalid/invalid_value.yaml"));
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("quality_gate.new.unstable.high"), std::string::npos) << e.what();
    }
}

// ============================================================================
// NUMBER FORMAT / RANGE TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnLeadingZero) {
    // Would otherwise be read as octal 8
    EXPECT_THROW(
        ConfigLoader::parseThresholds("quality_gate:\n  total:\n    failed: { all: 010 }\n"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnHexadecimal) {
    EXPECT_THROW(
        ConfigLoader::parseThresholds("quality_gate:\n  total:\n    failed: { all: 0x10 }\n"),
        std::runtime_error
    );
}

TEST(ConfigLoader, AcceptsPlainZeroAndDecimal) {
    Thresholds thresholds = ConfigLoader::parseThresholds(
        "quality_gate:\n  total:\n    failed: { all: 0, high: 10 }\n");

    EXPECT_EQ(thresholds.failedTotalAll, 0u);
    EXPECT_EQ(thresholds.failedTotalHigh, 10u);
}

TEST(ConfigLoader, ThrowsOnValueAboveUint32Range) {
    EXPECT_THROW(
        ConfigLoader::parseThresholds("quality_gate:\n  new:\n    failed: { all: 4294967296 }\n"),
        std::runtime_error
    );

    Thresholds thresholds = ConfigLoader::parseThresholds(
        "quality_gate:\n  new:\n    failed: { all: 4294967295 }\n");
    EXPECT_EQ(thresholds.failedNewAll, 4294967295u);
}

TEST(ConfigLoader, ThrowsOnUnknownRunField) {
    EXPECT_THROW(
        ConfigLoader::parseRunCounts(
            "analysis_run:\n"
            "  total: { all: 1, high: 0, normal: 0, low: 1 }\n"
            "  new:   { all: 0, high: 0, normal: 0, low: 0 }\n"
            "  fixed: { all: 2, high: 0, normal: 0, low: 2 }\n"),
        std::runtime_error
    );
}
