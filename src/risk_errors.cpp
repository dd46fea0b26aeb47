#include "risk_errors.hpp"

#include <sstream>
#include <utility>

namespace {

std::string summarize(const std::vector<ValidationIssue>& issues) {
    std::ostringstream oss;
    oss << "validation failed";
    if (issues.empty()) {
        return oss.str();
    }
    oss << " (" << issues.size() << (issues.size() == 1 ? " issue): " : " issues): ");
    for (std::size_t i = 0; i < issues.size(); ++i) {
        const auto& issue = issues[i];
        if (i > 0) {
            oss << "; ";
        }
        if (!issue.riskId.empty()) {
            oss << "risk " << issue.riskId << ' ';
        }
        oss << issue.field << ": " << issue.reason;
    }
    return oss.str();
}

}  // namespace

ValidationError::ValidationError(std::vector<ValidationIssue> issues)
    : std::invalid_argument(summarize(issues)), issues_(std::move(issues)) {}

ValidationError::ValidationError(std::string riskId, std::string field, std::string reason)
    : ValidationError(std::vector<ValidationIssue>{
          ValidationIssue{std::move(riskId), std::move(field), std::move(reason)}}) {}

UnsupportedDistributionError::UnsupportedDistributionError(std::vector<ValidationIssue> issues)
    : ValidationError(std::move(issues)) {}

NumericInstabilityError::NumericInstabilityError(std::string riskId, const std::string& message)
    : std::runtime_error(riskId.empty() ? "numeric instability: " + message
                                        : "numeric instability in risk " + riskId + ": " + message),
      riskId_(std::move(riskId)) {}

SimulationCancelledError::SimulationCancelledError(std::size_t completedTrials,
                                                   std::size_t totalTrials)
    : std::runtime_error("simulation cancelled after " + std::to_string(completedTrials) + " of " +
                         std::to_string(totalTrials) + " trials"),
      completedTrials_(completedTrials),
      totalTrials_(totalTrials) {}
