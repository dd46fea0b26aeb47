#include "sensitivity_analyzer.hpp"

#include "risk_errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

double pearson(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    const Eigen::ArrayXd dx = x.array() - x.mean();
    const Eigen::ArrayXd dy = y.array() - y.mean();
    const double sxx = dx.square().sum();
    const double syy = dy.square().sum();
    if (sxx <= 0.0 || syy <= 0.0) {
        return 0.0;
    }
    return (dx * dy).sum() / std::sqrt(sxx * syy);
}

}  // namespace

double SensitivityAnalyzer::sampleVariance(const Eigen::Ref<const Eigen::VectorXd>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double mean = values.mean();
    return (values.array() - mean).square().sum() / static_cast<double>(values.size() - 1);
}

std::vector<SensitivityEntry> SensitivityAnalyzer::rank(const Eigen::MatrixXd& perRiskContrib,
                                                        const std::vector<std::string>& riskIds) const {
    if (static_cast<std::size_t>(perRiskContrib.cols()) != riskIds.size()) {
        throw ValidationError("", "riskIds", "one id is required per contribution column");
    }

    const Eigen::VectorXd totals = perRiskContrib.rowwise().sum();
    const double totalVariance = sampleVariance(totals);

    std::vector<SensitivityEntry> entries;
    entries.reserve(riskIds.size());
    for (std::size_t r = 0; r < riskIds.size(); ++r) {
        const Eigen::VectorXd column = perRiskContrib.col(static_cast<Eigen::Index>(r));
        const Eigen::VectorXd without = totals - column;

        SensitivityEntry entry;
        entry.riskId = riskIds[r];
        entry.contribution = totalVariance - sampleVariance(without);
        entry.varianceShare = totalVariance > 0.0 ? entry.contribution / totalVariance : 0.0;
        entry.correlation = pearson(column, totals);
        if (!std::isfinite(entry.contribution) || !std::isfinite(entry.correlation)) {
            throw NumericInstabilityError(entry.riskId, "sensitivity is not finite");
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(),
              [](const SensitivityEntry& a, const SensitivityEntry& b) {
                  if (a.contribution != b.contribution) {
                      return a.contribution > b.contribution;
                  }
                  return a.riskId < b.riskId;
              });
    return entries;
}

std::vector<SensitivityEntry> SensitivityAnalyzer::rank(const Eigen::MatrixXd& perRiskContrib,
                                                        const std::vector<RiskSpec>& risks) const {
    std::vector<std::string> ids;
    ids.reserve(risks.size());
    for (const RiskSpec& risk : risks) {
        ids.push_back(risk.id);
    }

    std::vector<SensitivityEntry> entries = rank(perRiskContrib, ids);
    for (SensitivityEntry& entry : entries) {
        const auto it = std::find_if(risks.begin(), risks.end(),
                                     [&](const RiskSpec& risk) { return risk.id == entry.riskId; });
        if (it != risks.end()) {
            entry.riskNumber = it->riskNumber;
            entry.title = it->title;
        }
    }
    return entries;
}
