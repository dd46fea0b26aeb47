#pragma once

#include "risk_types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

struct SnapshotMetadata {
    std::string projectId;
    std::string revisionId;
    std::size_t iterations = 0;
    double targetPercentile = 80.0;
    std::string timestamp;  // ISO-8601 UTC
};

// Persistence boundary for finished runs. The simulation core never calls
// this; callers decide whether and where to store a result.
class SnapshotWriter {
public:
    virtual ~SnapshotWriter() = default;
    virtual void write(const SnapshotMetadata& metadata, const SimulationResult& result) = 0;
};

class JsonFileSnapshotWriter : public SnapshotWriter {
public:
    explicit JsonFileSnapshotWriter(std::string path);

    // Throws std::runtime_error when the file cannot be written.
    void write(const SnapshotMetadata& metadata, const SimulationResult& result) override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

std::string isoTimestamp(std::chrono::system_clock::time_point tp);
