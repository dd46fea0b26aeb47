#include "risk_input_normalizer.hpp"

#include "risk_errors.hpp"
#include "text_utils.hpp"

#include <cmath>
#include <string>
#include <unordered_set>
#include <utility>

namespace {

struct IssueCollector {
    std::vector<ValidationIssue> issues;
    bool unsupportedModel = false;

    void add(const std::string& riskId, std::string field, std::string reason) {
        issues.push_back(ValidationIssue{riskId, std::move(field), std::move(reason)});
    }
};

// Reports a missing or non-finite value; true when the value is usable.
bool requireFinite(const std::optional<double>& value,
                   const std::string& riskId,
                   const char* field,
                   IssueCollector& collector) {
    if (!value) {
        collector.add(riskId, field, "required value is missing");
        return false;
    }
    if (!std::isfinite(*value)) {
        collector.add(riskId, field, "value must be finite");
        return false;
    }
    return true;
}

}  // namespace

std::optional<DistributionModel> RiskInputNormalizer::parseDistributionModel(std::string_view text) {
    const std::string key = toLowerCopy(trimCopy(text));
    if (key == "triangular") return DistributionModel::Triangular;
    if (key == "pert" || key == "beta-pert" || key == "betapert") return DistributionModel::Pert;
    if (key == "normal") return DistributionModel::Normal;
    if (key == "uniform") return DistributionModel::Uniform;
    return std::nullopt;
}

std::optional<RiskKind> RiskInputNormalizer::parseRiskKind(std::string_view text) {
    const std::string key = toLowerCopy(trimCopy(text));
    if (key.empty() || key == "threat" || key == "risk") return RiskKind::Threat;
    if (key == "opportunity") return RiskKind::Opportunity;
    return std::nullopt;
}

std::vector<RiskSpec> RiskInputNormalizer::normalize(const std::vector<RawRisk>& rawRisks) const {
    if (rawRisks.empty()) {
        throw ValidationError("", "risks", "risk register is empty");
    }

    IssueCollector collector;
    std::vector<RiskSpec> specs;
    specs.reserve(rawRisks.size());
    std::unordered_set<std::string> seenIds;

    for (std::size_t index = 0; index < rawRisks.size(); ++index) {
        const RawRisk& raw = rawRisks[index];
        const std::string id = trimCopy(raw.id);
        const std::string label = id.empty() ? "#" + std::to_string(index + 1) : id;
        const std::size_t issuesBefore = collector.issues.size();

        if (id.empty()) {
            collector.add(label, "id", "risk id is required");
        } else if (!seenIds.insert(id).second) {
            collector.add(label, "id", "duplicate risk id");
        }

        const std::optional<RiskKind> kind = parseRiskKind(raw.kind);
        if (!kind) {
            collector.add(label, "kind", "unknown risk kind '" + raw.kind + "'");
        }

        const std::optional<DistributionModel> model = parseDistributionModel(raw.distributionModel);
        if (!model) {
            collector.unsupportedModel = true;
            collector.add(label, "distributionModel",
                          raw.distributionModel.empty()
                              ? "distribution model is required"
                              : "unsupported distribution model '" + raw.distributionModel + "'");
        }

        const bool haveP10 = requireFinite(raw.p10, label, "p10", collector);
        const bool haveP50 = requireFinite(raw.p50, label, "p50", collector);
        const bool haveP90 = requireFinite(raw.p90, label, "p90", collector);
        const bool haveProbability = requireFinite(raw.probability, label, "probability", collector);

        if (haveProbability && (*raw.probability < 0.0 || *raw.probability > 1.0)) {
            collector.add(label, "probability", "probability must lie in [0, 1]");
        }

        // Ordering is checked on magnitudes; opportunities may be entered
        // with either sign.
        if (haveP10 && haveP50 && haveP90) {
            const double lo = std::abs(*raw.p10);
            const double mid = std::abs(*raw.p50);
            const double hi = std::abs(*raw.p90);
            if (lo > mid) {
                collector.add(label, "p10", "|p10| must not exceed |p50|");
            }
            if (mid > hi) {
                collector.add(label, "p90", "|p50| must not exceed |p90|");
            }
        }

        if (collector.issues.size() != issuesBefore) {
            continue;
        }

        RiskSpec spec;
        spec.id = id;
        spec.kind = *kind;
        spec.p10 = std::abs(*raw.p10);
        spec.p50 = std::abs(*raw.p50);
        spec.p90 = std::abs(*raw.p90);
        spec.probability = *raw.probability;
        spec.distributionModel = *model;
        spec.riskNumber = trimCopy(raw.riskNumber);
        spec.title = trimCopy(raw.title);
        specs.push_back(std::move(spec));
    }

    if (collector.unsupportedModel) {
        throw UnsupportedDistributionError(std::move(collector.issues));
    }
    if (!collector.issues.empty()) {
        throw ValidationError(std::move(collector.issues));
    }
    return specs;
}
