#pragma once

#include "risk_types.hpp"

#include <istream>
#include <string>
#include <vector>

// Reads a risk register exported as CSV. The header row names the columns:
//   id, kind, p10, p50, p90, probability, distribution, riskNumber, title
// kind, riskNumber and title are optional; "distributionModel" is accepted
// for "distribution". Blank lines and lines starting with '#' are skipped.
// Empty numeric cells are left unset for the normalizer to report; cells
// that are present but not numbers fail here with a ValidationError.
[[nodiscard]] std::vector<RawRisk> parseRiskRegisterCsv(std::istream& in);

// Throws std::runtime_error when the file cannot be read.
[[nodiscard]] std::vector<RawRisk> loadRiskRegisterCsv(const std::string& path);

[[nodiscard]] std::vector<std::string> splitCsvLine(const std::string& line);
