#include "risk_register_csv.hpp"

#include "risk_errors.hpp"
#include "text_utils.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace {

enum class Column { Id, Kind, P10, P50, P90, Probability, Distribution, RiskNumber, Title };

std::optional<Column> columnFor(const std::string& header) {
    static const std::unordered_map<std::string, Column> kColumns{
        {"id", Column::Id},
        {"kind", Column::Kind},
        {"riskoropportunity", Column::Kind},
        {"p10", Column::P10},
        {"p50", Column::P50},
        {"p90", Column::P90},
        {"probability", Column::Probability},
        {"distribution", Column::Distribution},
        {"distributionmodel", Column::Distribution},
        {"risknumber", Column::RiskNumber},
        {"title", Column::Title},
    };
    const auto it = kColumns.find(toLowerCopy(trimCopy(header)));
    if (it == kColumns.end()) return std::nullopt;
    return it->second;
}

bool isSkippable(const std::string& line) {
    const std::string trimmed = trimCopy(line);
    return trimmed.empty() || trimmed.front() == '#';
}

}  // namespace

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(cell);
            cell.clear();
        } else if (c != '\r') {
            cell.push_back(c);
        }
    }
    cells.push_back(cell);
    return cells;
}

std::vector<RawRisk> parseRiskRegisterCsv(std::istream& in) {
    std::string header;
    while (std::getline(in, header) && isSkippable(header)) {
    }
    if (isSkippable(header)) {
        throw ValidationError("", "header", "register CSV has no header row");
    }

    std::vector<std::optional<Column>> layout;
    std::unordered_map<int, bool> present;
    for (const std::string& name : splitCsvLine(header)) {
        const std::optional<Column> column = columnFor(name);
        layout.push_back(column);
        if (column) present[static_cast<int>(*column)] = true;
    }

    std::vector<ValidationIssue> issues;
    const std::pair<Column, const char*> required[] = {
        {Column::Id, "id"},       {Column::P10, "p10"},
        {Column::P50, "p50"},     {Column::P90, "p90"},
        {Column::Probability, "probability"}, {Column::Distribution, "distribution"},
    };
    for (const auto& [column, name] : required) {
        if (!present.count(static_cast<int>(column))) {
            issues.push_back({"", "header", std::string("missing column '") + name + "'"});
        }
    }
    if (!issues.empty()) {
        throw ValidationError(std::move(issues));
    }

    std::vector<RawRisk> risks;
    std::string line;
    std::size_t lineNumber = 1;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (isSkippable(line)) continue;

        const std::vector<std::string> cells = splitCsvLine(line);
        RawRisk risk;
        std::vector<std::pair<Column, std::string>> numericCells;
        for (std::size_t i = 0; i < layout.size() && i < cells.size(); ++i) {
            if (!layout[i]) continue;
            const std::string text = trimCopy(cells[i]);
            switch (*layout[i]) {
                case Column::Id:
                    risk.id = text;
                    break;
                case Column::Kind:
                    if (!text.empty()) risk.kind = text;
                    break;
                case Column::Distribution:
                    risk.distributionModel = text;
                    break;
                case Column::RiskNumber:
                    risk.riskNumber = text;
                    break;
                case Column::Title:
                    risk.title = text;
                    break;
                case Column::P10:
                case Column::P50:
                case Column::P90:
                case Column::Probability:
                    if (!text.empty()) numericCells.emplace_back(*layout[i], text);
                    break;
            }
        }

        const std::string label = risk.id.empty() ? "line " + std::to_string(lineNumber) : risk.id;
        for (const auto& [column, text] : numericCells) {
            const std::optional<double> value = parseDouble(text);
            const char* field = column == Column::P10   ? "p10"
                                : column == Column::P50 ? "p50"
                                : column == Column::P90 ? "p90"
                                                        : "probability";
            if (!value) {
                issues.push_back({label, field, "'" + text + "' is not a number"});
                continue;
            }
            switch (column) {
                case Column::P10: risk.p10 = value; break;
                case Column::P50: risk.p50 = value; break;
                case Column::P90: risk.p90 = value; break;
                default: risk.probability = value; break;
            }
        }
        risks.push_back(std::move(risk));
    }

    if (!issues.empty()) {
        throw ValidationError(std::move(issues));
    }
    return risks;
}

std::vector<RawRisk> loadRiskRegisterCsv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open risk register CSV: " + path);
    }
    return parseRiskRegisterCsv(file);
}
