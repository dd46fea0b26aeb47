#include "statistics_aggregator.hpp"

#include "risk_errors.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr double kNiceSteps[] = {1.0, 2.0, 2.5, 5.0, 10.0};

void requirePercentile(double p) {
    if (!(p >= 0.0 && p <= 100.0)) {
        throw ValidationError("", "targetPercentile", "percentile must lie in [0, 100]");
    }
}

}  // namespace

StatisticsAggregator::StatisticsAggregator(HistogramOptions options) : options_(options) {
    if (options_.targetBuckets == 0) {
        options_.targetBuckets = 40;
    }
}

const std::vector<double>& StatisticsAggregator::tablePercentiles() {
    static const std::vector<double> kTable{5.0,  10.0, 20.0, 25.0, 30.0, 40.0, 50.0, 60.0,
                                            70.0, 75.0, 80.0, 85.0, 90.0, 95.0, 99.0};
    return kTable;
}

double StatisticsAggregator::percentile(const std::vector<double>& sorted, double p) {
    requirePercentile(p);
    if (sorted.empty()) {
        throw ValidationError("", "totals", "cannot take a percentile of an empty sample");
    }
    const double rank = p / 100.0 * static_cast<double>(sorted.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
    const std::size_t hi = std::min(sorted.size() - 1, lo + 1);
    const double weight = rank - static_cast<double>(lo);
    // lo + w*(hi-lo) returns the exact value when both ranks are equal.
    return sorted[lo] + weight * (sorted[hi] - sorted[lo]);
}

double StatisticsAggregator::sampleStdDev(const Eigen::VectorXd& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double sumSq = (values.array() - mean).square().sum();
    return std::sqrt(sumSq / static_cast<double>(values.size() - 1));
}

double StatisticsAggregator::niceBucketWidth(double range, std::size_t targetBuckets) {
    if (!(range > 0.0) || targetBuckets == 0) {
        return 0.0;
    }
    const double raw = range / static_cast<double>(targetBuckets);
    const double magnitude = std::pow(10.0, std::floor(std::log10(raw)));
    for (const double step : kNiceSteps) {
        const double width = step * magnitude;
        if (width >= raw) {
            return width;
        }
    }
    return 10.0 * magnitude;
}

std::vector<HistogramBucket> StatisticsAggregator::histogram(const std::vector<double>& sorted,
                                                             std::size_t targetBuckets) {
    if (sorted.empty()) {
        return {};
    }
    const double lo = sorted.front();
    const double hi = sorted.back();
    const double range = hi - lo;
    if (!(range > 0.0)) {
        return {HistogramBucket{lo, hi, sorted.size()}};
    }

    const double width = niceBucketWidth(range, targetBuckets);
    auto count = static_cast<std::size_t>(std::ceil(range / width));
    count = std::max<std::size_t>(1, count);
    // Rounding in range/width can leave an empty trailing bucket.
    while (count > 1 && lo + static_cast<double>(count - 1) * width >= hi) {
        --count;
    }

    std::vector<HistogramBucket> buckets(count);
    for (std::size_t i = 0; i < count; ++i) {
        buckets[i].bucketStart = lo + static_cast<double>(i) * width;
        buckets[i].bucketEnd = (i + 1 == count) ? hi : lo + static_cast<double>(i + 1) * width;
    }
    for (const double value : sorted) {
        auto index = static_cast<std::size_t>(std::floor((value - lo) / width));
        index = std::min(index, count - 1);
        ++buckets[index].count;
    }
    return buckets;
}

SummaryStatistics StatisticsAggregator::summarize(const Eigen::VectorXd& totals,
                                                  double targetPercentile,
                                                  double base) const {
    requirePercentile(targetPercentile);
    if (totals.size() == 0) {
        throw ValidationError("", "totals", "no simulated totals to summarize");
    }
    if (!totals.allFinite()) {
        throw NumericInstabilityError("", "simulated totals contain non-finite values");
    }

    SummaryStatistics stats;
    stats.sorted.assign(totals.data(), totals.data() + totals.size());
    std::sort(stats.sorted.begin(), stats.sorted.end());

    stats.min = stats.sorted.front();
    stats.max = stats.sorted.back();
    stats.mean = totals.mean();
    stats.stdDev = sampleStdDev(totals, stats.mean);
    stats.p10 = percentile(stats.sorted, 10.0);
    stats.p50 = percentile(stats.sorted, 50.0);
    stats.p90 = percentile(stats.sorted, 90.0);
    stats.targetValue = percentile(stats.sorted, targetPercentile);

    const auto& table = tablePercentiles();
    stats.percentileTable.reserve(table.size());
    for (const double p : table) {
        const double value = percentile(stats.sorted, p);
        stats.percentileTable.push_back(PercentilePoint{p, value, value - base});
    }

    stats.distribution = histogram(stats.sorted, options_.targetBuckets);

    if (!std::isfinite(stats.mean) || !std::isfinite(stats.stdDev)) {
        throw NumericInstabilityError("", "mean or standard deviation is not finite");
    }
    return stats;
}
