#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

struct ValidationIssue {
    std::string riskId;  // empty for request-level problems
    std::string field;
    std::string reason;
};

// Malformed or out-of-range input. Carries every issue found, not only the
// first, so the caller can fix the whole register in one pass.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(std::vector<ValidationIssue> issues);
    ValidationError(std::string riskId, std::string field, std::string reason);

    [[nodiscard]] const std::vector<ValidationIssue>& issues() const noexcept { return issues_; }

private:
    std::vector<ValidationIssue> issues_;
};

class UnsupportedDistributionError : public ValidationError {
public:
    explicit UnsupportedDistributionError(std::vector<ValidationIssue> issues);
};

// A sample or statistic came out non-finite. Indicates a normalizer bug.
class NumericInstabilityError : public std::runtime_error {
public:
    NumericInstabilityError(std::string riskId, const std::string& message);

    [[nodiscard]] const std::string& riskId() const noexcept { return riskId_; }

private:
    std::string riskId_;
};

class SimulationCancelledError : public std::runtime_error {
public:
    SimulationCancelledError(std::size_t completedTrials, std::size_t totalTrials);

    [[nodiscard]] std::size_t completedTrials() const noexcept { return completedTrials_; }
    [[nodiscard]] std::size_t totalTrials() const noexcept { return totalTrials_; }

private:
    std::size_t completedTrials_;
    std::size_t totalTrials_;
};
