#include "risk_analysis.hpp"

#include "random_streams.hpp"
#include "risk_errors.hpp"
#include "risk_input_normalizer.hpp"
#include "sensitivity_analyzer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace {

std::vector<ValidationIssue> requestIssues(const SimulationRequest& request) {
    std::vector<ValidationIssue> issues;
    if (request.iterations <= 0) {
        issues.push_back({"", "iterations", "iterations must be a positive integer"});
    }
    if (!(request.targetPercentile >= 0.0 && request.targetPercentile <= 100.0)) {
        issues.push_back({"", "targetPercentile", "target percentile must lie in [0, 100]"});
    }
    return issues;
}

double spread(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const Eigen::Map<const Eigen::VectorXd> view(values.data(), static_cast<Eigen::Index>(values.size()));
    return StatisticsAggregator::sampleStdDev(view, view.mean());
}

double average(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const Eigen::Map<const Eigen::VectorXd> view(values.data(), static_cast<Eigen::Index>(values.size()));
    return view.mean();
}

}  // namespace

PreparedRun prepareRun(const SimulationRequest& request) {
    std::vector<ValidationIssue> issues = requestIssues(request);
    bool unsupported = false;

    const RiskInputNormalizer normalizer;
    std::vector<RiskSpec> specs;
    try {
        specs = normalizer.normalize(request.risks);
    } catch (const UnsupportedDistributionError& ex) {
        unsupported = true;
        issues.insert(issues.end(), ex.issues().begin(), ex.issues().end());
    } catch (const ValidationError& ex) {
        issues.insert(issues.end(), ex.issues().begin(), ex.issues().end());
    }

    if (unsupported) {
        throw UnsupportedDistributionError(std::move(issues));
    }
    if (!issues.empty()) {
        throw ValidationError(std::move(issues));
    }

    PreparedRun run;
    run.iterations = static_cast<std::size_t>(request.iterations);
    run.targetPercentile = request.targetPercentile;
    run.seedProvided = request.seed.has_value();
    run.seed = run.seedProvided ? *request.seed : randomSeed();
    run.risks.reserve(specs.size());
    for (RiskSpec& spec : specs) {
        if (spec.probability > 0.0) {
            run.risks.push_back(std::move(spec));
        }
    }
    return run;
}

EmvSummary expectedMonetaryValue(const std::vector<RiskSpec>& risks) {
    EmvSummary emv;
    emv.perRisk.reserve(risks.size());
    for (const RiskSpec& risk : risks) {
        const double value = risk.probability * risk.signedP50();
        emv.perRisk.push_back(EmvEntry{risk.id, value});
        emv.total += value;
    }
    return emv;
}

SimulationResult executeRun(const PreparedRun& run, const RunOptions& options) {
    const auto start = std::chrono::steady_clock::now();

    EngineConfig config;
    config.iterations = run.iterations;
    config.seed = run.seed;
    config.blockSize = options.blockSize;
    const SimulationEngine engine(run.risks, config);

    RunControl control;
    control.progress = options.progress;
    control.cancelFlag = options.cancelFlag;
    const SimulationOutput output = engine.run(control);

    SimulationResult result;
    for (const RiskSpec& risk : run.risks) {
        result.base += risk.signedP50();
    }

    const StatisticsAggregator aggregator(options.histogram);
    SummaryStatistics stats = aggregator.summarize(output.totals, run.targetPercentile, result.base);
    result.p10 = stats.p10;
    result.p50 = stats.p50;
    result.p90 = stats.p90;
    result.mean = stats.mean;
    result.stdDev = stats.stdDev;
    result.targetPercentile = run.targetPercentile;
    result.targetValue = stats.targetValue;
    result.distribution = std::move(stats.distribution);
    result.percentileTable = std::move(stats.percentileTable);
    if (options.keepSamples) {
        result.samples = std::move(stats.sorted);
    }

    const SensitivityAnalyzer analyzer;
    result.sensitivityAnalysis = analyzer.rank(output.perRiskContrib, run.risks);
    result.emv = expectedMonetaryValue(run.risks);

    result.metadata.seed = run.seed;
    result.metadata.seedProvided = run.seedProvided;
    result.metadata.iterations = run.iterations;
    result.metadata.riskCount = run.risks.size();
    result.metadata.threads = SimulationEngine::threadCount();
    result.metadata.elapsedSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

SimulationResult runRiskAnalysis(const SimulationRequest& request, const RunOptions& options) {
    return executeRun(prepareRun(request), options);
}

std::vector<ConvergencePoint> convergenceStudy(const SimulationRequest& request,
                                               const std::vector<std::size_t>& sampleSizes,
                                               std::size_t repeats,
                                               const RunOptions& options) {
    if (sampleSizes.empty()) {
        throw ValidationError("", "samples", "at least one iteration count is required");
    }
    if (repeats < 2) {
        throw ValidationError("", "repeats", "a spread needs at least two repeats");
    }

    PreparedRun base = prepareRun(request);
    std::vector<ConvergencePoint> points;
    points.reserve(sampleSizes.size());

    for (std::size_t s = 0; s < sampleSizes.size(); ++s) {
        if (sampleSizes[s] == 0) {
            throw ValidationError("", "samples", "iteration counts must be positive");
        }
        std::vector<double> means;
        std::vector<double> medians;
        std::vector<double> stdDevs;
        for (std::size_t k = 0; k < repeats; ++k) {
            PreparedRun run = base;
            run.iterations = sampleSizes[s];
            run.seed = base.seed + 7919u * static_cast<std::uint64_t>(k + repeats * s);
            const SimulationResult res = executeRun(run, options);
            means.push_back(res.mean);
            medians.push_back(res.p50);
            stdDevs.push_back(res.stdDev);
        }

        ConvergencePoint point;
        point.iterations = sampleSizes[s];
        point.repeats = repeats;
        point.meanAverage = average(means);
        point.meanSpread = spread(means);
        point.p50Average = average(medians);
        point.p50Spread = spread(medians);
        point.stdDevAverage = average(stdDevs);
        points.push_back(point);
    }
    return points;
}
