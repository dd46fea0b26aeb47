#include "result_json.hpp"
#include "risk_analysis.hpp"
#include "risk_errors.hpp"
#include "risk_register_csv.hpp"
#include "snapshot_writer.hpp"
#include "text_utils.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

using ArgMap = std::unordered_map<std::string, std::string>;

enum class OutputFormat { Text, Json };

void printUsage(const char* exe) {
    std::cout << "Usage:\n"
              << "  " << exe
              << " <command> --register <file.csv> [options]\n\n"
              << "Commands:\n"
              << "  simulate     Monte Carlo exposure, percentiles and tornado ranking\n"
              << "  convergence  Repeat the run at several iteration counts and report estimate spread\n"
              << "  validate     Check the register without simulating\n\n"
              << "Common Options:\n"
              << "  --register <path>       Risk register CSV (required)\n"
              << "  --iterations <value>    Monte Carlo trials (default: 10000)\n"
              << "  --target <value>        Target percentile in [0,100] (default: 80)\n"
              << "  --seed <value>          RNG seed (default: random, reported in output)\n"
              << "  --block <value>         Trials per block (default: 4096)\n"
              << "  --format <text|json>    Output format (default: text)\n"
              << "  --progress              Log progress to stderr\n\n"
              << "Simulate Command Options:\n"
              << "  --buckets <value>       Target histogram bucket count (default: 40)\n"
              << "  --keep-samples          Include sorted trial totals in JSON output\n"
              << "  --snapshot <path>       Also write a JSON snapshot file\n"
              << "  --project <id>          Project id recorded in the snapshot\n"
              << "  --revision <id>         Register revision id recorded in the snapshot\n\n"
              << "Convergence Command Options:\n"
              << "  --samples <list>        Comma-separated iteration counts\n"
              << "                          (default: 1000,10000,100000)\n"
              << "  --repeats <value>       Seeds per iteration count (default: 8)\n";
}

ArgMap parseArgs(int argc, char** argv, int startIndex) {
    ArgMap args;
    for (int i = startIndex; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected token: " + token);
        }

        token = token.substr(2);
        const auto pos = token.find('=');
        if (pos != std::string::npos) {
            args[token.substr(0, pos)] = token.substr(pos + 1);
        } else {
            std::string value = "true";
            if (i + 1 < argc) {
                std::string potential = argv[i + 1];
                if (potential.rfind("--", 0) != 0) {
                    value = potential;
                    ++i;
                }
            }
            args[token] = value;
        }
    }
    return args;
}

double getDouble(const ArgMap& args, const std::string& name, double defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    const auto value = parseDouble(it->second);
    if (!value) {
        throw std::invalid_argument("Expected a number for --" + name + ": " + it->second);
    }
    return *value;
}

long long getInteger(const ArgMap& args, const std::string& name, long long defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    const auto value = parseInteger(it->second);
    if (!value) {
        throw std::invalid_argument("Expected an integer for --" + name + ": " + it->second);
    }
    return *value;
}

bool getBool(const ArgMap& args, const std::string& name, bool defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    const std::string value = toLowerCopy(it->second);
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    throw std::invalid_argument("Unable to parse boolean flag: " + name + "=" + it->second);
}

std::string getString(const ArgMap& args, const std::string& name, std::string defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    return it->second;
}

std::vector<std::size_t> parseSampleList(const ArgMap& args,
                                         const std::string& name,
                                         const std::vector<std::size_t>& defaults) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaults;
    }
    std::vector<std::size_t> values;
    std::stringstream ss(it->second);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trimCopy(item).empty()) continue;
        const auto value = parseInteger(item);
        if (!value || *value <= 0) {
            throw std::invalid_argument("Invalid iteration count in --" + name + ": " + item);
        }
        values.push_back(static_cast<std::size_t>(*value));
    }
    return values;
}

OutputFormat parseFormat(const ArgMap& args) {
    const std::string fmt = toLowerCopy(getString(args, "format", "text"));
    if (fmt == "json") {
        return OutputFormat::Json;
    }
    if (fmt != "text") {
        throw std::invalid_argument("Unsupported format: " + fmt);
    }
    return OutputFormat::Text;
}

SimulationRequest buildRequest(const ArgMap& args) {
    const std::string path = getString(args, "register", "");
    if (path.empty()) {
        throw std::invalid_argument("--register <file.csv> is required");
    }
    SimulationRequest request;
    request.risks = loadRiskRegisterCsv(path);
    request.iterations = getInteger(args, "iterations", 10000);
    request.targetPercentile = getDouble(args, "target", 80.0);
    if (args.count("seed") != 0) {
        const long long seed = getInteger(args, "seed", 0);
        if (seed < 0) {
            throw std::invalid_argument("--seed must not be negative");
        }
        request.seed = static_cast<std::uint64_t>(seed);
    }
    return request;
}

RunOptions buildOptions(const ArgMap& args) {
    RunOptions options;
    const long long block = getInteger(args, "block", 4096);
    const long long buckets = getInteger(args, "buckets", 40);
    if (block <= 0 || buckets <= 0) {
        throw std::invalid_argument("--block and --buckets must be positive");
    }
    options.blockSize = static_cast<std::size_t>(block);
    options.histogram.targetBuckets = static_cast<std::size_t>(buckets);
    options.keepSamples = getBool(args, "keep-samples", false);
    if (getBool(args, "progress", false)) {
        options.progress = [](std::size_t done, std::size_t total) {
            std::cerr << "[risk_sim] progress " << done << "/" << total << "\n";
        };
    }
    return options;
}

void printResult(const SimulationResult& res) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Base (sum of P50)   : " << res.base << "\n";
    std::cout << "Mean / Std Dev      : " << res.mean << " / " << res.stdDev << "\n";
    std::cout << "P10 / P50 / P90     : " << res.p10 << " / " << res.p50 << " / " << res.p90 << "\n";
    std::cout << "Target P" << std::setprecision(0) << res.targetPercentile << std::setprecision(2)
              << "          : " << res.targetValue << "\n";
    std::cout << "EMV total           : " << res.emv.total << "\n";
    std::cout << "Trials / risks      : " << res.metadata.iterations << " / " << res.metadata.riskCount
              << " (seed " << res.metadata.seed << (res.metadata.seedProvided ? "" : ", generated")
              << ")\n\n";

    std::cout << std::setw(12) << "Percentile" << std::setw(20) << "Value" << std::setw(20)
              << "vs Base" << "\n";
    for (const auto& row : res.percentileTable) {
        std::cout << std::setw(11) << std::setprecision(0) << row.percentile << "%"
                  << std::setprecision(2) << std::setw(20) << row.value << std::setw(20)
                  << row.varianceFromBase << "\n";
    }

    std::cout << "\nSensitivity (leave-one-out variance)\n";
    std::cout << std::setw(16) << "Risk" << std::setw(22) << "Contribution" << std::setw(12)
              << "Share" << std::setw(12) << "Corr" << "\n";
    for (const auto& entry : res.sensitivityAnalysis) {
        std::cout << std::setw(16) << entry.riskId << std::setw(22) << entry.contribution
                  << std::setw(11) << entry.varianceShare * 100.0 << "%" << std::setw(12)
                  << std::setprecision(3) << entry.correlation << std::setprecision(2) << "\n";
    }

    std::cout << "\nDistribution\n";
    for (const auto& bucket : res.distribution) {
        std::cout << "  [" << std::setw(14) << bucket.bucketStart << ", " << std::setw(14)
                  << bucket.bucketEnd << "] " << bucket.count << "\n";
    }
}

void printConvergence(const std::vector<ConvergencePoint>& points) {
    if (points.empty()) {
        std::cout << "No convergence points computed.\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(4);
    std::cout << std::setw(12) << "Iterations" << std::setw(18) << "Mean" << std::setw(18)
              << "Mean spread" << std::setw(18) << "P50" << std::setw(18) << "P50 spread" << "\n";
    for (const auto& point : points) {
        std::cout << std::setw(12) << point.iterations << std::setw(18) << point.meanAverage
                  << std::setw(18) << point.meanSpread << std::setw(18) << point.p50Average
                  << std::setw(18) << point.p50Spread << "\n";
    }
}

void writeSnapshot(const ArgMap& args, const SimulationResult& res) {
    const std::string path = getString(args, "snapshot", "");
    if (path.empty()) {
        return;
    }
    SnapshotMetadata meta;
    meta.projectId = getString(args, "project", "");
    meta.revisionId = getString(args, "revision", "");
    meta.iterations = res.metadata.iterations;
    meta.targetPercentile = res.targetPercentile;
    meta.timestamp = isoTimestamp(std::chrono::system_clock::now());

    JsonFileSnapshotWriter writer(path);
    writer.write(meta, res);
    std::cerr << "[risk_sim] snapshot written to " << path << "\n";
}

void reportError(OutputFormat format, const std::string& kind, const std::string& details,
                 const std::vector<ValidationIssue>& issues = {}) {
    if (format == OutputFormat::Json) {
        std::cout << errorToJson(kind, details, issues);
        return;
    }
    std::cerr << kind << " error: " << details << "\n";
    for (const auto& issue : issues) {
        std::cerr << "  - " << (issue.riskId.empty() ? "(request)" : issue.riskId) << " ["
                  << issue.field << "] " << issue.reason << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];

    ArgMap args;
    try {
        args = parseArgs(argc, argv, 2);
    } catch (const std::exception& ex) {
        std::cerr << "Argument error: " << ex.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    OutputFormat format = OutputFormat::Text;

    try {
        format = parseFormat(args);
        if (command != "simulate" && command != "convergence" && command != "validate") {
            if (format == OutputFormat::Json) {
                std::cout << errorToJson("Unknown command", command);
            } else {
                std::cerr << "Unknown command: " << command << "\n\n";
                printUsage(argv[0]);
            }
            return 1;
        }

        const SimulationRequest request = buildRequest(args);
        const RunOptions options = buildOptions(args);

        if (command == "simulate") {
            std::cerr << "[risk_sim] " << request.risks.size() << " risks, " << request.iterations
                      << " iterations\n";
            const SimulationResult res = runRiskAnalysis(request, options);
            if (format == OutputFormat::Json) {
                std::cout << toJson(res);
            } else {
                printResult(res);
            }
            writeSnapshot(args, res);
        } else if (command == "convergence") {
            const std::vector<std::size_t> defaults{1000, 10000, 100000};
            const std::vector<std::size_t> samples = parseSampleList(args, "samples", defaults);
            const long long repeats = getInteger(args, "repeats", 8);
            if (repeats < 2) {
                throw std::invalid_argument("--repeats must be at least 2");
            }
            const std::vector<ConvergencePoint> points =
                convergenceStudy(request, samples, static_cast<std::size_t>(repeats), options);
            if (format == OutputFormat::Json) {
                std::cout << toJson(points);
            } else {
                std::cout << "Convergence of the simulated mean and P50\n";
                printConvergence(points);
            }
        } else if (command == "validate") {
            const PreparedRun run = prepareRun(request);
            if (format == OutputFormat::Json) {
                std::cout << "{\n  \"valid\": true,\n  \"risks\": " << request.risks.size()
                          << ",\n  \"active\": " << run.risks.size() << "\n}\n";
            } else {
                std::cout << "Register OK: " << request.risks.size() << " risks ("
                          << run.risks.size() << " with non-zero probability)\n";
            }
        }
    } catch (const UnsupportedDistributionError& ex) {
        reportError(format, "UnsupportedDistribution", ex.what(), ex.issues());
        return 1;
    } catch (const ValidationError& ex) {
        reportError(format, "Validation", ex.what(), ex.issues());
        return 1;
    } catch (const NumericInstabilityError& ex) {
        reportError(format, "NumericInstability", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        reportError(format, "Runtime", ex.what());
        return 1;
    }

    return 0;
}
