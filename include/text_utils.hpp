#pragma once

#include <optional>
#include <string>
#include <string_view>

std::string trimCopy(std::string_view text);
std::string toLowerCopy(std::string_view text);

// Whole-string numeric parse; trailing garbage or an empty cell yields nullopt.
std::optional<double> parseDouble(std::string_view text);
std::optional<long long> parseInteger(std::string_view text);
