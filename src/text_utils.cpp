#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>

std::string trimCopy(std::string_view text) {
    std::size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string toLowerCopy(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<double> parseDouble(std::string_view text) {
    const std::string cleaned = trimCopy(text);
    if (cleaned.empty()) return std::nullopt;
    try {
        std::size_t idx = 0;
        const double value = std::stod(cleaned, &idx);
        if (idx != cleaned.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<long long> parseInteger(std::string_view text) {
    const std::string cleaned = trimCopy(text);
    if (cleaned.empty()) return std::nullopt;
    try {
        std::size_t idx = 0;
        const long long value = std::stoll(cleaned, &idx);
        if (idx != cleaned.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
