#pragma once

#include "risk_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ============================================================================
// Shared register fixtures
// ============================================================================

inline RawRisk makeRawRisk(const std::string& id,
                           double p10,
                           double p50,
                           double p90,
                           double probability,
                           const std::string& model,
                           const std::string& kind = "threat") {
    RawRisk risk;
    risk.id = id;
    risk.kind = kind;
    risk.p10 = p10;
    risk.p50 = p50;
    risk.p90 = p90;
    risk.probability = probability;
    risk.distributionModel = model;
    return risk;
}

inline RiskSpec makeSpec(const std::string& id,
                         double p10,
                         double p50,
                         double p90,
                         double probability,
                         DistributionModel model,
                         RiskKind kind = RiskKind::Threat) {
    RiskSpec spec;
    spec.id = id;
    spec.kind = kind;
    spec.p10 = p10;
    spec.p50 = p50;
    spec.p90 = p90;
    spec.probability = probability;
    spec.distributionModel = model;
    return spec;
}

// Two-threat register used by the end-to-end scenario.
inline SimulationRequest twoThreatRequest(std::int64_t iterations, std::optional<std::uint64_t> seed) {
    SimulationRequest request;
    request.risks.push_back(makeRawRisk("A", 10000.0, 20000.0, 50000.0, 0.5, "triangular"));
    request.risks.push_back(makeRawRisk("B", 0.0, 5000.0, 15000.0, 0.9, "normal"));
    request.iterations = iterations;
    request.targetPercentile = 80.0;
    request.seed = seed;
    return request;
}
