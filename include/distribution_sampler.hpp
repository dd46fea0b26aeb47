#pragma once

#include "random_streams.hpp"
#include "risk_types.hpp"

// Maps a three-point estimate onto a distribution and draws from it.
// P10/P50/P90 are used directly as shape anchors (min/mode/max, or the
// mean and an 80% interval for the normal model); they are not fitted as
// true percentiles.
class DistributionSampler {
public:
    // Width of the central 80% interval of N(0,1): 2 * 1.28155.
    static constexpr double kNormalInterval80 = 2.5631;

    // Signed draw for one occurrence of the risk: opportunities come back
    // negative. Degenerate estimates (p10 == p90) return p50 without
    // touching the generator. Throws NumericInstabilityError on a non-finite draw.
    [[nodiscard]] static double sample(const RiskSpec& spec, Rng& rng);

    [[nodiscard]] static double uniform(double min, double max, Rng& rng);
    [[nodiscard]] static double triangular(double min, double mode, double max, Rng& rng);
    [[nodiscard]] static double pert(double min, double mode, double max, Rng& rng);
    [[nodiscard]] static double normal(double mean, double stdDev, Rng& rng);

    [[nodiscard]] static double normalStdDev(double p10, double p90) {
        return (p90 - p10) / kNormalInterval80;
    }
};
