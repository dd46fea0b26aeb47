#pragma once

#include "risk_types.hpp"

#include <optional>
#include <string_view>
#include <vector>

// Validates register rows and converts them to RiskSpec. Either every row is
// accepted or the call throws; rows are never dropped or repaired.
class RiskInputNormalizer {
public:
    // Throws UnsupportedDistributionError if any row names an unknown model,
    // otherwise ValidationError listing every offending row.
    [[nodiscard]] std::vector<RiskSpec> normalize(const std::vector<RawRisk>& rawRisks) const;

    [[nodiscard]] static std::optional<DistributionModel> parseDistributionModel(std::string_view text);
    [[nodiscard]] static std::optional<RiskKind> parseRiskKind(std::string_view text);
};
