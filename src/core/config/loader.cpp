#include <analysisgate/core/config/loader.hpp>

#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

using namespace AnalysisGate;

namespace {

constexpr const char* kGateRoot = "quality_gate";
constexpr const char* kRunRoot = "analysis_run";

// Destination of the four severity values of one block
struct SeverityFields {
    uint32_t* all;
    uint32_t* high;
    uint32_t* normal;
    uint32_t* low;
};

YAML::Node readFile(const std::string& filepath) {
    try {
        return YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error(fmt::format("Cannot open configuration file: {}", filepath));
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(fmt::format("Malformed YAML in {}: {}", filepath, e.what()));
    }
}

YAML::Node readText(const std::string& yaml) {
    try {
        return YAML::Load(yaml);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(fmt::format("Malformed YAML: {}", e.what()));
    }
}

std::string childPath(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

void requireMap(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw std::runtime_error(fmt::format("{}: expected a mapping", path));
    }
}

void rejectUnknownKeys(const YAML::Node& node, const std::string& path,
                       std::initializer_list<const char*> allowed) {
    for (const auto& entry : node) {
        const std::string key = entry.first.as<std::string>();
        bool known = false;
        for (const char* candidate : allowed) {
            if (key == candidate) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw std::runtime_error(fmt::format("{}: unknown field '{}'", path, key));
        }
    }
}

// Optional sign followed by decimal digits, no leading zero. yaml-cpp would
// otherwise read 010 as octal and 0x10 as hex.
bool isDecimalInteger(const std::string& text) {
    size_t start = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    if (start >= text.size()) {
        return false;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return text[start] != '0' || text.size() - start == 1;
}

uint32_t readCount(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        throw std::runtime_error(fmt::format("{}: expected an integer", path));
    }
    if (!isDecimalInteger(node.Scalar())) {
        throw std::runtime_error(fmt::format("{}: '{}' is not a decimal integer", path, node.Scalar()));
    }

    int64_t value = 0;
    try {
        value = node.as<int64_t>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error(fmt::format("{}: '{}' is not an integer", path, node.Scalar()));
    }

    if (value < 0) {
        throw std::runtime_error(fmt::format("{}: must not be negative (got {})", path, value));
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error(fmt::format("{}: value {} is out of range", path, value));
    }
    return static_cast<uint32_t>(value);
}

// Reads {all, high, normal, low}. Missing keys are an error only when required.
void readSeverities(const YAML::Node& node, const std::string& path,
                    const SeverityFields& fields, bool required) {
    requireMap(node, path);
    rejectUnknownKeys(node, path, {"all", "high", "normal", "low"});

    const std::pair<const char*, uint32_t*> targets[] = {
        {"all", fields.all},
        {"high", fields.high},
        {"normal", fields.normal},
        {"low", fields.low},
    };
    for (const auto& [key, target] : targets) {
        const YAML::Node value = node[key];
        if (!value.IsDefined()) {
            if (required) {
                throw std::runtime_error(fmt::format("Missing required field: {}", childPath(path, key)));
            }
            continue;
        }
        *target = readCount(value, childPath(path, key));
    }
}

// Optional gate block; absent or null leaves the category disabled
void readGateCategory(const YAML::Node& group, const std::string& groupPath,
                      const char* key, const SeverityFields& fields) {
    const YAML::Node node = group[key];
    if (!node.IsDefined() || node.IsNull()) {
        return;
    }
    readSeverities(node, childPath(groupPath, key), fields, false);
}

Thresholds toThresholds(const YAML::Node& root) {
    Thresholds thresholds;

    requireMap(root, "<root>");
    const YAML::Node gate = root[kGateRoot];
    if (!gate.IsDefined()) {
        throw std::runtime_error(fmt::format("Missing required field: {}", kGateRoot));
    }
    if (gate.IsNull()) {
        spdlog::warn("[ConfigLoader] '{}' is empty, all thresholds disabled", kGateRoot);
        return thresholds;
    }
    requireMap(gate, kGateRoot);
    rejectUnknownKeys(gate, kGateRoot, {"total", "new"});

    const std::string totalPath = childPath(kGateRoot, "total");
    const YAML::Node total = gate["total"];
    if (total.IsDefined() && !total.IsNull()) {
        requireMap(total, totalPath);
        rejectUnknownKeys(total, totalPath, {"failed", "unstable"});
        readGateCategory(total, totalPath, "failed",
                         {&thresholds.failedTotalAll, &thresholds.failedTotalHigh,
                          &thresholds.failedTotalNormal, &thresholds.failedTotalLow});
        readGateCategory(total, totalPath, "unstable",
                         {&thresholds.unstableTotalAll, &thresholds.unstableTotalHigh,
                          &thresholds.unstableTotalNormal, &thresholds.unstableTotalLow});
    }

    const std::string newPath = childPath(kGateRoot, "new");
    const YAML::Node fresh = gate["new"];
    if (fresh.IsDefined() && !fresh.IsNull()) {
        requireMap(fresh, newPath);
        rejectUnknownKeys(fresh, newPath, {"failed", "unstable"});
        readGateCategory(fresh, newPath, "failed",
                         {&thresholds.failedNewAll, &thresholds.failedNewHigh,
                          &thresholds.failedNewNormal, &thresholds.failedNewLow});
        readGateCategory(fresh, newPath, "unstable",
                         {&thresholds.unstableNewAll, &thresholds.unstableNewHigh,
                          &thresholds.unstableNewNormal, &thresholds.unstableNewLow});
    }

    return thresholds;
}

AnalysisRunCounts toRunCounts(const YAML::Node& root) {
    AnalysisRunCounts run;

    requireMap(root, "<root>");
    const YAML::Node node = root[kRunRoot];
    if (!node.IsDefined()) {
        throw std::runtime_error(fmt::format("Missing required field: {}", kRunRoot));
    }
    requireMap(node, kRunRoot);
    rejectUnknownKeys(node, kRunRoot, {"total", "new"});

    const YAML::Node total = node["total"];
    if (!total.IsDefined()) {
        throw std::runtime_error(fmt::format("Missing required field: {}", childPath(kRunRoot, "total")));
    }
    readSeverities(total, childPath(kRunRoot, "total"),
                   {&run.total, &run.totalHigh, &run.totalNormal, &run.totalLow}, true);

    const YAML::Node fresh = node["new"];
    if (!fresh.IsDefined()) {
        throw std::runtime_error(fmt::format("Missing required field: {}", childPath(kRunRoot, "new")));
    }
    readSeverities(fresh, childPath(kRunRoot, "new"),
                   {&run.newTotal, &run.newHigh, &run.newNormal, &run.newLow}, true);

    return run;
}

} // namespace

Thresholds ConfigLoader::loadThresholds(const std::string& filepath) {
    spdlog::info("[ConfigLoader] Loading quality gate from: {}", filepath);
    return toThresholds(readFile(filepath));
}

Thresholds ConfigLoader::parseThresholds(const std::string& yaml) {
    return toThresholds(readText(yaml));
}

AnalysisRunCounts ConfigLoader::loadRunCounts(const std::string& filepath) {
    spdlog::info("[ConfigLoader] Loading analysis run from: {}", filepath);
    return toRunCounts(readFile(filepath));
}

AnalysisRunCounts ConfigLoader::parseRunCounts(const std::string& yaml) {
    return toRunCounts(readText(yaml));
}
