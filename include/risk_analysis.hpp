#pragma once

#include "risk_types.hpp"
#include "simulation_engine.hpp"
#include "statistics_aggregator.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

struct RunOptions {
    std::size_t blockSize = 4096;
    HistogramOptions histogram;
    bool keepSamples = false;
    ProgressCallback progress;
    const std::atomic<bool>* cancelFlag = nullptr;
};

// A request that passed validation, with its seed resolved. Risks with
// probability 0 are already removed: they can never contribute, so the run
// is the same with or without them.
struct PreparedRun {
    std::vector<RiskSpec> risks;
    std::size_t iterations = 0;
    double targetPercentile = 80.0;
    std::uint64_t seed = 0;
    bool seedProvided = false;
};

struct ConvergencePoint {
    std::size_t iterations = 0;
    std::size_t repeats = 0;
    double meanAverage = 0.0;
    double meanSpread = 0.0;  // std dev of the simulated mean across repeats
    double p50Average = 0.0;
    double p50Spread = 0.0;
    double stdDevAverage = 0.0;
};

// Validates everything up front and throws ValidationError (or
// UnsupportedDistributionError) listing all problems in the request.
[[nodiscard]] PreparedRun prepareRun(const SimulationRequest& request);

[[nodiscard]] SimulationResult executeRun(const PreparedRun& run, const RunOptions& options = {});

[[nodiscard]] SimulationResult runRiskAnalysis(const SimulationRequest& request,
                                               const RunOptions& options = {});

[[nodiscard]] EmvSummary expectedMonetaryValue(const std::vector<RiskSpec>& risks);

// Re-runs the register at each iteration count with `repeats` distinct
// seeds derived from the request seed; the spread columns shrink as the
// iteration count grows.
[[nodiscard]] std::vector<ConvergencePoint> convergenceStudy(
    const SimulationRequest& request,
    const std::vector<std::size_t>& sampleSizes,
    std::size_t repeats,
    const RunOptions& options = {});
