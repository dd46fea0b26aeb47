#pragma once

#include "risk_types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

struct HistogramOptions {
    std::size_t targetBuckets = 40;
};

struct SummaryStatistics {
    double p10 = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double targetValue = 0.0;
    std::vector<PercentilePoint> percentileTable;
    std::vector<HistogramBucket> distribution;
    std::vector<double> sorted;
};

class StatisticsAggregator {
public:
    explicit StatisticsAggregator(HistogramOptions options = {});

    // base is only used for the varianceFromBase column of the table.
    [[nodiscard]] SummaryStatistics summarize(const Eigen::VectorXd& totals,
                                              double targetPercentile,
                                              double base = 0.0) const;

    // Linear interpolation between closest ranks, rank = p/100 * (n-1).
    [[nodiscard]] static double percentile(const std::vector<double>& sorted, double p);

    [[nodiscard]] static double sampleStdDev(const Eigen::VectorXd& values, double mean);

    // Smallest 1/2/2.5/5 x 10^k width that covers range in targetBuckets.
    [[nodiscard]] static double niceBucketWidth(double range, std::size_t targetBuckets);

    [[nodiscard]] static std::vector<HistogramBucket> histogram(const std::vector<double>& sorted,
                                                                std::size_t targetBuckets);

    [[nodiscard]] static const std::vector<double>& tablePercentiles();

private:
    HistogramOptions options_;
};
