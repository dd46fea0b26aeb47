#include "result_json.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (const char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string toJson(const SimulationResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(10);
    oss << "{\n"
        << "  \"base\": " << result.base << ",\n"
        << "  \"p10\": " << result.p10 << ",\n"
        << "  \"p50\": " << result.p50 << ",\n"
        << "  \"p90\": " << result.p90 << ",\n"
        << "  \"mean\": " << result.mean << ",\n"
        << "  \"stdDev\": " << result.stdDev << ",\n"
        << "  \"targetPercentile\": " << result.targetPercentile << ",\n"
        << "  \"targetValue\": " << result.targetValue << ",\n";

    oss << "  \"percentileTable\": [\n";
    for (std::size_t i = 0; i < result.percentileTable.size(); ++i) {
        const auto& row = result.percentileTable[i];
        oss << "    {\"percentile\": " << row.percentile << ", \"value\": " << row.value
            << ", \"varianceFromBase\": " << row.varianceFromBase << "}"
            << (i + 1 < result.percentileTable.size() ? ",\n" : "\n");
    }
    oss << "  ],\n";

    oss << "  \"distribution\": [\n";
    for (std::size_t i = 0; i < result.distribution.size(); ++i) {
        const auto& bucket = result.distribution[i];
        oss << "    {\"bucketStart\": " << bucket.bucketStart << ", \"bucketEnd\": " << bucket.bucketEnd
            << ", \"count\": " << bucket.count << "}"
            << (i + 1 < result.distribution.size() ? ",\n" : "\n");
    }
    oss << "  ],\n";

    oss << "  \"sensitivityAnalysis\": [\n";
    for (std::size_t i = 0; i < result.sensitivityAnalysis.size(); ++i) {
        const auto& entry = result.sensitivityAnalysis[i];
        oss << "    {\"riskId\": \"" << jsonEscape(entry.riskId) << "\""
            << ", \"riskNumber\": \"" << jsonEscape(entry.riskNumber) << "\""
            << ", \"title\": \"" << jsonEscape(entry.title) << "\""
            << ", \"contribution\": " << entry.contribution
            << ", \"varianceShare\": " << entry.varianceShare
            << ", \"correlation\": " << entry.correlation << "}"
            << (i + 1 < result.sensitivityAnalysis.size() ? ",\n" : "\n");
    }
    oss << "  ],\n";

    oss << "  \"emv\": {\n"
        << "    \"total\": " << result.emv.total << ",\n"
        << "    \"perRisk\": [";
    for (std::size_t i = 0; i < result.emv.perRisk.size(); ++i) {
        const auto& entry = result.emv.perRisk[i];
        oss << (i == 0 ? "\n" : ",\n")
            << "      {\"riskId\": \"" << jsonEscape(entry.riskId) << "\", \"expectedValue\": "
            << entry.expectedValue << "}";
    }
    oss << (result.emv.perRisk.empty() ? "]\n" : "\n    ]\n") << "  },\n";

    if (!result.samples.empty()) {
        oss << "  \"samples\": [";
        for (std::size_t i = 0; i < result.samples.size(); ++i) {
            oss << (i == 0 ? "" : ", ") << result.samples[i];
        }
        oss << "],\n";
    }

    const RunMetadata& meta = result.metadata;
    oss << "  \"metadata\": {\n"
        << "    \"seed\": " << meta.seed << ",\n"
        << "    \"seedProvided\": " << (meta.seedProvided ? "true" : "false") << ",\n"
        << "    \"iterations\": " << meta.iterations << ",\n"
        << "    \"riskCount\": " << meta.riskCount << ",\n"
        << "    \"threads\": " << meta.threads << ",\n"
        << "    \"elapsedSeconds\": " << meta.elapsedSeconds << "\n"
        << "  }\n"
        << "}\n";
    return oss.str();
}

std::string toJson(const std::vector<ConvergencePoint>& points) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(10);
    oss << "[\n";
    for (std::size_t i = 0; i < points.size(); ++i) {
        const auto& point = points[i];
        oss << "  {\n"
            << "    \"iterations\": " << point.iterations << ",\n"
            << "    \"repeats\": " << point.repeats << ",\n"
            << "    \"meanAverage\": " << point.meanAverage << ",\n"
            << "    \"meanSpread\": " << point.meanSpread << ",\n"
            << "    \"p50Average\": " << point.p50Average << ",\n"
            << "    \"p50Spread\": " << point.p50Spread << ",\n"
            << "    \"stdDevAverage\": " << point.stdDevAverage << "\n"
            << "  }" << (i + 1 < points.size() ? ",\n" : "\n");
    }
    oss << "]\n";
    return oss.str();
}

std::string errorToJson(const std::string& kind, const std::string& details,
                        const std::vector<ValidationIssue>& issues) {
    std::ostringstream oss;
    oss << "{\n"
        << "  \"error\": \"" << jsonEscape(kind) << "\",\n"
        << "  \"details\": \"" << jsonEscape(details) << "\"";
    if (!issues.empty()) {
        oss << ",\n  \"issues\": [\n";
        for (std::size_t i = 0; i < issues.size(); ++i) {
            const auto& issue = issues[i];
            oss << "    {\"riskId\": \"" << jsonEscape(issue.riskId) << "\", \"field\": \""
                << jsonEscape(issue.field) << "\", \"reason\": \"" << jsonEscape(issue.reason) << "\"}"
                << (i + 1 < issues.size() ? ",\n" : "\n");
        }
        oss << "  ]";
    }
    oss << "\n}\n";
    return oss.str();
}
