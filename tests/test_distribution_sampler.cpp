#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

#include "distribution_sampler.hpp"
#include "risk_fixtures.hpp"

namespace {

struct Moments {
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

Moments drawMoments(const RiskSpec& spec, std::size_t n, std::uint64_t seed) {
    Rng rng(seed);
    std::vector<double> draws(n);
    for (auto& d : draws) {
        d = DistributionSampler::sample(spec, rng);
    }
    Moments m;
    m.min = draws.front();
    m.max = draws.front();
    double sum = 0.0;
    for (double d : draws) {
        sum += d;
        m.min = std::min(m.min, d);
        m.max = std::max(m.max, d);
    }
    m.mean = sum / static_cast<double>(n);
    double sq = 0.0;
    for (double d : draws) {
        sq += (d - m.mean) * (d - m.mean);
    }
    m.stdDev = std::sqrt(sq / static_cast<double>(n - 1));
    return m;
}

}  // namespace

TEST_CASE("Degenerate estimate returns p50 for every model without drawing", "[sampler]") {
    const DistributionModel models[] = {DistributionModel::Triangular, DistributionModel::Pert,
                                        DistributionModel::Normal, DistributionModel::Uniform};
    for (const auto model : models) {
        const RiskSpec spec = makeSpec("D", 1000.0, 1000.0, 1000.0, 1.0, model);
        Rng rng(7);
        const Rng before = rng;
        for (int i = 0; i < 10; ++i) {
            REQUIRE(DistributionSampler::sample(spec, rng) == 1000.0);
        }
        REQUIRE(rng == before);
    }
}

TEST_CASE("Opportunities sample as negative contributions", "[sampler]") {
    const RiskSpec spec =
        makeSpec("O", 100.0, 200.0, 400.0, 1.0, DistributionModel::Triangular, RiskKind::Opportunity);
    Rng rng(3);
    for (int i = 0; i < 1000; ++i) {
        const double value = DistributionSampler::sample(spec, rng);
        REQUIRE(value <= -100.0);
        REQUIRE(value >= -400.0);
    }
}

TEST_CASE("Uniform model ignores p50 and spans p10..p90", "[sampler]") {
    const RiskSpec spec = makeSpec("U", 10.0, 11.0, 50.0, 1.0, DistributionModel::Uniform);
    const Moments m = drawMoments(spec, 200000, 11);
    REQUIRE(m.min >= 10.0);
    REQUIRE(m.max < 50.0);
    REQUIRE(m.mean == Approx(30.0).margin(0.2));
    REQUIRE(m.stdDev == Approx(40.0 / std::sqrt(12.0)).epsilon(0.01));
}

TEST_CASE("Triangular model uses p10/p50/p90 as min/mode/max", "[sampler]") {
    const RiskSpec spec = makeSpec("T", 10.0, 20.0, 50.0, 1.0, DistributionModel::Triangular);
    const Moments m = drawMoments(spec, 200000, 21);
    REQUIRE(m.min >= 10.0);
    REQUIRE(m.max <= 50.0);
    REQUIRE(m.mean == Approx(80.0 / 3.0).margin(0.1));
    // sqrt((a^2 + b^2 + c^2 - ab - ac - bc) / 18)
    REQUIRE(m.stdDev == Approx(std::sqrt(1300.0 / 18.0)).epsilon(0.01));
}

TEST_CASE("PERT model matches Beta-PERT mean and bounds", "[sampler]") {
    const RiskSpec spec = makeSpec("P", 10.0, 20.0, 50.0, 1.0, DistributionModel::Pert);
    const Moments m = drawMoments(spec, 200000, 31);
    REQUIRE(m.min >= 10.0);
    REQUIRE(m.max <= 50.0);
    REQUIRE(m.mean == Approx((10.0 + 4.0 * 20.0 + 50.0) / 6.0).margin(0.1));
}

TEST_CASE("PERT with mode at an end point stays inside the range", "[sampler]") {
    Rng rng(5);
    for (int i = 0; i < 10000; ++i) {
        const double lo = DistributionSampler::pert(0.0, 0.0, 10.0, rng);
        const double hi = DistributionSampler::pert(0.0, 10.0, 10.0, rng);
        REQUIRE(lo >= 0.0);
        REQUIRE(lo <= 10.0);
        REQUIRE(hi >= 0.0);
        REQUIRE(hi <= 10.0);
    }
}

TEST_CASE("Normal model centres on p50 with the 80% interval width", "[sampler]") {
    const RiskSpec spec = makeSpec("N", 0.0, 5000.0, 15000.0, 1.0, DistributionModel::Normal);
    REQUIRE(DistributionSampler::normalStdDev(0.0, 15000.0) == Approx(15000.0 / 2.5631));

    const Moments m = drawMoments(spec, 200000, 41);
    REQUIRE(m.mean == Approx(5000.0).margin(40.0));
    REQUIRE(m.stdDev == Approx(15000.0 / 2.5631).epsilon(0.01));
}

TEST_CASE("Shape helpers collapse to a constant on a zero-width range", "[sampler]") {
    Rng rng(9);
    const Rng before = rng;
    REQUIRE(DistributionSampler::uniform(4.0, 4.0, rng) == 4.0);
    REQUIRE(DistributionSampler::triangular(4.0, 4.0, 4.0, rng) == 4.0);
    REQUIRE(DistributionSampler::pert(4.0, 4.0, 4.0, rng) == 4.0);
    REQUIRE(DistributionSampler::normal(4.0, 0.0, rng) == 4.0);
    REQUIRE(rng == before);
}

TEST_CASE("Identical generator state gives identical draws", "[sampler]") {
    const RiskSpec spec = makeSpec("R", 1.0, 2.0, 9.0, 1.0, DistributionModel::Pert);
    Rng a(99);
    Rng b(99);
    for (int i = 0; i < 100; ++i) {
        REQUIRE(DistributionSampler::sample(spec, a) == DistributionSampler::sample(spec, b));
    }
}
