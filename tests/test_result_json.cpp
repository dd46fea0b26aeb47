#include <catch2/catch.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "result_json.hpp"
#include "risk_fixtures.hpp"
#include "snapshot_writer.hpp"

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("JSON strings are escaped", "[json]") {
    REQUIRE(jsonEscape("plain") == "plain");
    REQUIRE(jsonEscape("a\"b") == "a\\\"b");
    REQUIRE(jsonEscape("back\\slash") == "back\\\\slash");
    REQUIRE(jsonEscape("line\nbreak\t") == "line\\nbreak\\t");
    REQUIRE(jsonEscape(std::string(1, '\x01')) == "\\u0001");
}

TEST_CASE("Result document carries every section", "[json]") {
    const SimulationResult result = runRiskAnalysis(twoThreatRequest(2000, 6));
    const std::string json = toJson(result);

    for (const char* key : {"\"base\"", "\"p10\"", "\"p50\"", "\"p90\"", "\"mean\"", "\"stdDev\"",
                            "\"targetPercentile\"", "\"targetValue\"", "\"percentileTable\"",
                            "\"distribution\"", "\"sensitivityAnalysis\"", "\"emv\"",
                            "\"metadata\"", "\"seedProvided\": true"}) {
        REQUIRE(contains(json, key));
    }
    REQUIRE_FALSE(contains(json, "\"samples\""));
    REQUIRE(contains(json, "\"riskId\": \"A\""));
}

TEST_CASE("Samples appear only when kept", "[json]") {
    RunOptions options;
    options.keepSamples = true;
    const SimulationResult result = runRiskAnalysis(twoThreatRequest(10, 6), options);
    REQUIRE(contains(toJson(result), "\"samples\": ["));
}

TEST_CASE("Error document lists validation issues", "[json]") {
    const std::string json = errorToJson("ValidationError", "bad \"input\"",
                                         {{"R1", "p10", "|p10| must not exceed |p50|"}});
    REQUIRE(contains(json, "\"error\": \"ValidationError\""));
    REQUIRE(contains(json, "\"details\": \"bad \\\"input\\\"\""));
    REQUIRE(contains(json, "\"issues\""));
    REQUIRE(contains(json, "\"field\": \"p10\""));

    REQUIRE_FALSE(contains(errorToJson("InternalError", "boom"), "\"issues\""));
}

TEST_CASE("Convergence table serializes each point", "[json]") {
    ConvergencePoint point;
    point.iterations = 1000;
    point.repeats = 4;
    const std::string json = toJson(std::vector<ConvergencePoint>{point, point});
    REQUIRE(contains(json, "\"iterations\": 1000"));
    REQUIRE(contains(json, "\"meanSpread\""));
}

TEST_CASE("Snapshot writer stores metadata with the result", "[snapshot]") {
    const std::string path = "qra_snapshot_test.json";
    const SimulationResult result = runRiskAnalysis(twoThreatRequest(1000, 2));

    SnapshotMetadata metadata;
    metadata.projectId = "P-17";
    metadata.revisionId = "rev-3";
    metadata.iterations = 1000;
    metadata.timestamp = isoTimestamp(std::chrono::system_clock::time_point{});

    JsonFileSnapshotWriter writer(path);
    writer.write(metadata, result);

    std::ifstream in(writer.path());
    std::stringstream contents;
    contents << in.rdbuf();
    const std::string json = contents.str();
    REQUIRE(contains(json, "\"projectId\": \"P-17\""));
    REQUIRE(contains(json, "\"revisionId\": \"rev-3\""));
    REQUIRE(contains(json, "\"timestamp\": \"1970-01-01T00:00:00Z\""));
    REQUIRE(contains(json, "\"sensitivityAnalysis\""));

    in.close();
    std::remove(path.c_str());
}

TEST_CASE("Snapshot writer reports unwritable paths", "[snapshot]") {
    JsonFileSnapshotWriter writer("/nonexistent-dir/snapshot.json");
    REQUIRE_THROWS_AS(writer.write(SnapshotMetadata{}, SimulationResult{}), std::runtime_error);
}
