#include "snapshot_writer.hpp"

#include "result_json.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

JsonFileSnapshotWriter::JsonFileSnapshotWriter(std::string path) : path_(std::move(path)) {}

void JsonFileSnapshotWriter::write(const SnapshotMetadata& metadata, const SimulationResult& result) {
    std::ofstream file(path_, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open snapshot file: " + path_);
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    oss << "{\n"
        << "\"projectId\": \"" << jsonEscape(metadata.projectId) << "\",\n"
        << "\"revisionId\": \"" << jsonEscape(metadata.revisionId) << "\",\n"
        << "\"iterations\": " << metadata.iterations << ",\n"
        << "\"targetPercentile\": " << metadata.targetPercentile << ",\n"
        << "\"timestamp\": \"" << jsonEscape(metadata.timestamp) << "\",\n"
        << "\"result\": " << toJson(result) << "}\n";

    file << oss.str();
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing snapshot file: " + path_);
    }
}
