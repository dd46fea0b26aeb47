#include "risk_analysis.hpp"
#include "simulation_service.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct StressConfig {
    std::size_t jobs = std::max(1u, std::thread::hardware_concurrency());
    std::size_t runs = 40;
    std::size_t iterations = 50'000;
    std::size_t risks = 25;
};

StressConfig parseArgs(int argc, char** argv) {
    StressConfig cfg;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--jobs" && i + 1 < argc) {
            cfg.jobs = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if (arg == "--runs" && i + 1 < argc) {
            cfg.runs = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if (arg == "--iterations" && i + 1 < argc) {
            cfg.iterations = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if (arg == "--risks" && i + 1 < argc) {
            cfg.risks = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: risk_stress [--jobs N] [--runs N] [--iterations N] [--risks N]\n";
            std::exit(0);
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    cfg.jobs = std::max<std::size_t>(1, cfg.jobs);
    cfg.risks = std::max<std::size_t>(1, cfg.risks);
    return cfg;
}

// Random but valid register: a mix of threats and opportunities over all
// four distribution models.
SimulationRequest randomRequest(std::mt19937_64& rng, const StressConfig& cfg, std::uint64_t seed) {
    static const char* kModels[] = {"triangular", "pert", "normal", "uniform"};
    std::uniform_real_distribution<double> lowDist(1e3, 5e4);
    std::uniform_real_distribution<double> spreadDist(1.0, 4.0);
    std::uniform_real_distribution<double> probabilityDist(0.05, 0.95);
    std::bernoulli_distribution opportunityDist(0.2);
    std::uniform_int_distribution<int> modelDist(0, 3);

    SimulationRequest request;
    request.iterations = static_cast<std::int64_t>(cfg.iterations);
    request.targetPercentile = 80.0;
    request.seed = seed;
    for (std::size_t i = 0; i < cfg.risks; ++i) {
        RawRisk risk;
        risk.id = "R" + std::to_string(i + 1);
        risk.kind = opportunityDist(rng) ? "opportunity" : "threat";
        const double p10 = lowDist(rng);
        const double p90 = p10 * spreadDist(rng);
        risk.p10 = p10;
        risk.p50 = p10 + (p90 - p10) * 0.4;
        risk.p90 = p90;
        risk.probability = probabilityDist(rng);
        risk.distributionModel = kModels[modelDist(rng)];
        request.risks.push_back(risk);
    }
    return request;
}

double quantile(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const double index = q * static_cast<double>(values.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(index);
    const std::size_t hi = std::min(values.size() - 1, lo + 1);
    const double weight = index - static_cast<double>(lo);
    return values[lo] * (1.0 - weight) + values[hi] * weight;
}

double mean(const std::vector<double>& c) {
    if (c.empty()) return 0.0;
    return std::accumulate(c.begin(), c.end(), 0.0) / static_cast<double>(c.size());
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const StressConfig cfg = parseArgs(argc, argv);

        std::cout << "[risk_stress] jobs=" << cfg.jobs << " runs=" << cfg.runs
                  << " iterations=" << cfg.iterations << " risks=" << cfg.risks << "\n";

        SimulationService service(cfg.jobs);
        std::mt19937_64 rng(17u);

        // Every request is submitted twice with the same seed; the pair must agree.
        std::vector<SimulationJob> first;
        std::vector<SimulationJob> second;
        const auto start = std::chrono::steady_clock::now();
        for (std::size_t i = 0; i < cfg.runs; ++i) {
            const SimulationRequest request = randomRequest(rng, cfg, 1000u + i);
            first.push_back(service.submit(request));
            second.push_back(service.submit(request));
        }

        std::vector<double> durations;
        std::vector<double> p80Values;
        std::size_t mismatches = 0;
        for (std::size_t i = 0; i < cfg.runs; ++i) {
            const SimulationResult a = first[i].get();
            const SimulationResult b = second[i].get();
            durations.push_back(a.metadata.elapsedSeconds);
            durations.push_back(b.metadata.elapsedSeconds);
            p80Values.push_back(a.targetValue);
            if (a.mean != b.mean || a.stdDev != b.stdDev || a.targetValue != b.targetValue) {
                ++mismatches;
                std::cerr << "[risk_stress] run " << i << " is not reproducible\n";
            }
        }

        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        std::cout << "\n=== Aggregate Metrics ===\n";
        std::cout << "Total runs        : " << durations.size() << "\n";
        std::cout << "Wall-clock        : " << elapsed << " s\n";
        std::cout << "Mean duration     : " << mean(durations) << " s\n";
        std::cout << "Median duration   : " << quantile(durations, 0.5) << " s\n";
        std::cout << "P99 duration      : " << quantile(durations, 0.99) << " s\n";
        std::cout << "Workers           : " << service.workers() << "\n";
        std::cout << "P80 mean          : " << mean(p80Values) << "\n";
        std::cout << "Mismatched pairs  : " << mismatches << "\n";

        return mismatches == 0 ? 0 : 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
