#include "distribution_sampler.hpp"

#include "risk_errors.hpp"

#include <cmath>
#include <string>

namespace {

inline double unitUniform(Rng& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

}  // namespace

double DistributionSampler::uniform(double min, double max, Rng& rng) {
    if (max == min) {
        return min;
    }
    return min + unitUniform(rng) * (max - min);
}

double DistributionSampler::triangular(double min, double mode, double max, Rng& rng) {
    const double range = max - min;
    if (range == 0.0) {
        return mode;
    }
    const double u = unitUniform(rng);
    const double fc = (mode - min) / range;
    if (u < fc) {
        return min + std::sqrt(u * range * (mode - min));
    }
    return max - std::sqrt((1.0 - u) * range * (max - mode));
}

double DistributionSampler::pert(double min, double mode, double max, Rng& rng) {
    const double range = max - min;
    if (range == 0.0) {
        return mode;
    }
    const double alpha = 1.0 + 4.0 * (mode - min) / range;
    const double beta = 1.0 + 4.0 * (max - mode) / range;

    // Beta(alpha, beta) as X / (X + Y) with X ~ Gamma(alpha), Y ~ Gamma(beta).
    std::gamma_distribution<double> gammaA(alpha, 1.0);
    std::gamma_distribution<double> gammaB(beta, 1.0);
    const double x = gammaA(rng);
    const double y = gammaB(rng);
    const double denom = x + y;
    if (!(denom > 0.0)) {
        throw NumericInstabilityError("", "degenerate Beta draw (alpha=" + std::to_string(alpha) +
                                              ", beta=" + std::to_string(beta) + ")");
    }
    return min + (x / denom) * range;
}

double DistributionSampler::normal(double mean, double stdDev, Rng& rng) {
    if (stdDev == 0.0) {
        return mean;
    }
    std::normal_distribution<double> dist(mean, stdDev);
    return dist(rng);
}

double DistributionSampler::sample(const RiskSpec& spec, Rng& rng) {
    if (spec.isDegenerate()) {
        return spec.sign() * spec.p50;
    }

    double magnitude = 0.0;
    switch (spec.distributionModel) {
        case DistributionModel::Uniform:
            magnitude = uniform(spec.p10, spec.p90, rng);
            break;
        case DistributionModel::Triangular:
            magnitude = triangular(spec.p10, spec.p50, spec.p90, rng);
            break;
        case DistributionModel::Pert:
            try {
                magnitude = pert(spec.p10, spec.p50, spec.p90, rng);
            } catch (const NumericInstabilityError& ex) {
                throw NumericInstabilityError(spec.id, ex.what());
            }
            break;
        case DistributionModel::Normal:
            magnitude = normal(spec.p50, normalStdDev(spec.p10, spec.p90), rng);
            break;
    }

    if (!std::isfinite(magnitude)) {
        throw NumericInstabilityError(spec.id, std::string("non-finite ") +
                                                   toString(spec.distributionModel) + " sample");
    }
    return spec.sign() * magnitude;
}
