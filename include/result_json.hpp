#pragma once

#include "risk_analysis.hpp"
#include "risk_errors.hpp"
#include "risk_types.hpp"

#include <string>
#include <string_view>
#include <vector>

std::string jsonEscape(std::string_view text);

std::string toJson(const SimulationResult& result);
std::string toJson(const std::vector<ConvergencePoint>& points);

// Structured error document; "issues" is present for validation failures.
std::string errorToJson(const std::string& kind, const std::string& details,
                        const std::vector<ValidationIssue>& issues = {});
