#pragma once

#include "risk_types.hpp"

#include <Eigen/Dense>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

using ProgressCallback = std::function<void(std::size_t completedTrials, std::size_t totalTrials)>;

struct EngineConfig {
    std::size_t iterations = 10000;
    std::uint64_t seed = 42;
    std::size_t blockSize = 4096;
};

// Per-run hooks. Both are checked once per trial block, never per trial.
struct RunControl {
    ProgressCallback progress;
    const std::atomic<bool>* cancelFlag = nullptr;
};

struct SimulationOutput {
    Eigen::VectorXd totals;          // one entry per trial
    Eigen::MatrixXd perRiskContrib;  // trials x risks, signed contributions
};

// Runs the trial loop. Trials are grouped into fixed-size blocks and every
// (block, risk) pair draws from its own generators, so the output is
// identical for any OpenMP thread count or block schedule.
class SimulationEngine {
public:
    SimulationEngine(std::vector<RiskSpec> risks, EngineConfig config);

    // Throws SimulationCancelledError when the cancel flag is observed and
    // rethrows the first error raised by any block.
    [[nodiscard]] SimulationOutput run(const RunControl& control = {}) const;

    [[nodiscard]] const std::vector<RiskSpec>& risks() const noexcept { return risks_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::size_t blockCount() const noexcept;

    [[nodiscard]] static int threadCount();

private:
    std::vector<RiskSpec> risks_;
    std::vector<std::uint64_t> streamKeys_;
    EngineConfig config_;

    void simulateBlock(std::size_t blockIndex, SimulationOutput& out) const;
};
