#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class RiskKind { Threat, Opportunity };

enum class DistributionModel { Triangular, Pert, Normal, Uniform };

// One register row as supplied by the caller, before validation.
// Numeric fields are optional so that a missing value can be told apart
// from an explicit zero.
struct RawRisk {
    std::string id;
    std::string kind = "threat";
    std::optional<double> p10;
    std::optional<double> p50;
    std::optional<double> p90;
    std::optional<double> probability;
    std::string distributionModel;
    std::string riskNumber;
    std::string title;
};

// Canonical register entry. p10/p50/p90 are magnitudes on the absolute-value
// axis (0 <= p10 <= p50 <= p90); the sign comes from kind.
struct RiskSpec {
    std::string id;
    RiskKind kind = RiskKind::Threat;
    double p10 = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    double probability = 0.0;
    DistributionModel distributionModel = DistributionModel::Triangular;
    std::string riskNumber;
    std::string title;

    [[nodiscard]] double sign() const { return kind == RiskKind::Opportunity ? -1.0 : 1.0; }
    [[nodiscard]] double signedP50() const { return sign() * p50; }
    [[nodiscard]] bool isDegenerate() const { return p10 == p90; }
};

struct SimulationRequest {
    std::vector<RawRisk> risks;
    std::int64_t iterations = 10000;
    double targetPercentile = 80.0;
    std::optional<std::uint64_t> seed;
};

struct HistogramBucket {
    double bucketStart = 0.0;
    double bucketEnd = 0.0;
    std::size_t count = 0;
};

struct PercentilePoint {
    double percentile = 0.0;
    double value = 0.0;
    double varianceFromBase = 0.0;
};

struct SensitivityEntry {
    std::string riskId;
    std::string riskNumber;
    std::string title;
    double contribution = 0.0;   // Var(totals) - Var(totals without this risk)
    double varianceShare = 0.0;  // contribution / Var(totals)
    double correlation = 0.0;    // Pearson(risk column, totals)
};

struct EmvEntry {
    std::string riskId;
    double expectedValue = 0.0;
};

struct EmvSummary {
    double total = 0.0;
    std::vector<EmvEntry> perRisk;
};

struct RunMetadata {
    std::uint64_t seed = 0;
    bool seedProvided = false;
    std::size_t iterations = 0;
    std::size_t riskCount = 0;
    int threads = 1;
    double elapsedSeconds = 0.0;
};

struct SimulationResult {
    double base = 0.0;
    double p10 = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    double mean = 0.0;
    double stdDev = 0.0;
    double targetPercentile = 80.0;
    double targetValue = 0.0;
    std::vector<HistogramBucket> distribution;
    std::vector<PercentilePoint> percentileTable;
    std::vector<SensitivityEntry> sensitivityAnalysis;
    EmvSummary emv;
    std::vector<double> samples;  // sorted totals, only when requested
    RunMetadata metadata;
};

[[nodiscard]] const char* toString(RiskKind kind);
[[nodiscard]] const char* toString(DistributionModel model);
