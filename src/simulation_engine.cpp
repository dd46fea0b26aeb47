#include "simulation_engine.hpp"

#include "distribution_sampler.hpp"
#include "occurrence_gate.hpp"
#include "random_streams.hpp"
#include "risk_errors.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <mutex>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

SimulationEngine::SimulationEngine(std::vector<RiskSpec> risks, EngineConfig config)
    : risks_(std::move(risks)), config_(config) {
    if (config_.iterations == 0) {
        throw ValidationError("", "iterations", "iterations must be positive");
    }
    if (config_.blockSize == 0) {
        config_.blockSize = 1024;
    }

    streamKeys_.reserve(risks_.size());
    for (const RiskSpec& risk : risks_) {
        const bool ordered = risk.p10 >= 0.0 && risk.p10 <= risk.p50 && risk.p50 <= risk.p90;
        if (!ordered || !std::isfinite(risk.p90)) {
            throw ValidationError(risk.id, "p10/p50/p90", "estimate is not normalized");
        }
        if (!(risk.probability >= 0.0 && risk.probability <= 1.0)) {
            throw ValidationError(risk.id, "probability", "probability must lie in [0, 1]");
        }
        streamKeys_.push_back(riskStreamKey(risk.id));
    }
}

std::size_t SimulationEngine::blockCount() const noexcept {
    return (config_.iterations + config_.blockSize - 1) / config_.blockSize;
}

int SimulationEngine::threadCount() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

void SimulationEngine::simulateBlock(std::size_t blockIndex, SimulationOutput& out) const {
    const std::size_t begin = blockIndex * config_.blockSize;
    const std::size_t count = std::min(config_.blockSize, config_.iterations - begin);
    const auto first = static_cast<Eigen::Index>(begin);
    const auto length = static_cast<Eigen::Index>(count);

    for (std::size_t r = 0; r < risks_.size(); ++r) {
        const RiskSpec& risk = risks_[r];
        if (risk.probability <= 0.0) {
            continue;  // column stays zero
        }

        Rng occurrenceRng =
            makeStream(config_.seed, blockIndex, streamKeys_[r], RandomStream::Occurrence);
        Rng magnitudeRng =
            makeStream(config_.seed, blockIndex, streamKeys_[r], RandomStream::Magnitude);

        auto column = out.perRiskContrib.col(static_cast<Eigen::Index>(r)).segment(first, length);
        for (Eigen::Index i = 0; i < length; ++i) {
            column[i] = occurs(risk.probability, occurrenceRng)
                            ? DistributionSampler::sample(risk, magnitudeRng)
                            : 0.0;
        }

        // Accumulating column by column keeps each trial's sum in risk order.
        out.totals.segment(first, length) += column;
    }
}

SimulationOutput SimulationEngine::run(const RunControl& control) const {
    const std::size_t trials = config_.iterations;
    const std::size_t blocks = blockCount();

    SimulationOutput out;
    out.totals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(trials));
    out.perRiskContrib = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(trials),
                                               static_cast<Eigen::Index>(risks_.size()));

    std::atomic<std::size_t> completed{0};
    std::atomic<bool> stop{false};
    bool cancelled = false;
    std::exception_ptr failure;
    std::mutex failureMutex;
    std::mutex progressMutex;

#pragma omp parallel for schedule(dynamic)
    for (std::size_t block = 0; block < blocks; ++block) {
        if (stop.load(std::memory_order_relaxed)) {
            continue;
        }
        if (control.cancelFlag != nullptr && control.cancelFlag->load(std::memory_order_relaxed)) {
            std::lock_guard guard(failureMutex);
            cancelled = true;
            stop.store(true, std::memory_order_relaxed);
            continue;
        }

        // Exceptions may not cross the parallel region; keep the first one.
        try {
            simulateBlock(block, out);
            const std::size_t begin = block * config_.blockSize;
            completed.fetch_add(std::min(config_.blockSize, trials - begin));
            if (control.progress) {
                std::lock_guard guard(progressMutex);
                control.progress(completed.load(), trials);
            }
        } catch (...) {
            std::lock_guard guard(failureMutex);
            if (!failure) {
                failure = std::current_exception();
            }
            stop.store(true, std::memory_order_relaxed);
        }
    }  // omp parallel for

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (cancelled) {
        throw SimulationCancelledError(completed.load(), trials);
    }
    return out;
}
