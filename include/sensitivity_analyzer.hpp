#pragma once

#include "risk_types.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

// Tornado ranking by leave-one-out variance: a risk's contribution is
// Var(totals) - Var(totals with that risk's column zeroed). Sorted by
// contribution descending, ties by risk id ascending.
class SensitivityAnalyzer {
public:
    [[nodiscard]] std::vector<SensitivityEntry> rank(const Eigen::MatrixXd& perRiskContrib,
                                                     const std::vector<std::string>& riskIds) const;

    // Same ranking, with riskNumber and title copied from the specs.
    [[nodiscard]] std::vector<SensitivityEntry> rank(const Eigen::MatrixXd& perRiskContrib,
                                                     const std::vector<RiskSpec>& risks) const;

    [[nodiscard]] static double sampleVariance(const Eigen::Ref<const Eigen::VectorXd>& values);
};
