#include <catch2/catch.hpp>

#include <future>
#include <vector>

#include "risk_errors.hpp"
#include "risk_fixtures.hpp"
#include "simulation_service.hpp"

TEST_CASE("Submitted run matches the synchronous run", "[service]") {
    SimulationService service(2);
    SimulationJob job = service.submit(twoThreatRequest(20000, 31));
    const SimulationResult async = job.get();
    const SimulationResult sync = runRiskAnalysis(twoThreatRequest(20000, 31));

    REQUIRE(async.mean == sync.mean);
    REQUIRE(async.stdDev == sync.stdDev);
    REQUIRE(async.targetValue == sync.targetValue);
    REQUIRE(async.sensitivityAnalysis[0].riskId == sync.sensitivityAnalysis[0].riskId);
}

TEST_CASE("Invalid requests fail on submit", "[service]") {
    SimulationService service(1);
    SimulationRequest request = twoThreatRequest(1000, 1);
    request.risks[0].p10 = 90000.0;
    REQUIRE_THROWS_AS(service.submit(request), ValidationError);
}

TEST_CASE("Cancelling a queued job stops it before any trial", "[service]") {
    SimulationService service(1);
    REQUIRE(service.workers() == 1);

    // Hold the only worker inside the first job until the second is cancelled.
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    RunOptions blocking;
    blocking.progress = [gate](std::size_t, std::size_t) { gate.wait(); };

    SimulationJob first = service.submit(twoThreatRequest(100, 1), blocking);
    SimulationJob second = service.submit(twoThreatRequest(100000, 2));
    second.cancel();
    release.set_value();

    REQUIRE_NOTHROW(first.get());
    try {
        (void)second.get();
        FAIL("expected SimulationCancelledError");
    } catch (const SimulationCancelledError& error) {
        REQUIRE(error.completedTrials() == 0);
        REQUIRE(error.totalTrials() == 100000);
    }
}

TEST_CASE("Concurrent jobs are independent and reproducible", "[service]") {
    SimulationService service(4);
    std::vector<SimulationJob> jobs;
    for (std::uint64_t seed = 0; seed < 8; ++seed) {
        jobs.push_back(service.submit(twoThreatRequest(5000, seed % 4)));
    }

    std::vector<SimulationResult> results;
    for (auto& job : jobs) {
        results.push_back(job.get());
    }
    for (std::size_t i = 0; i < 4; ++i) {
        REQUIRE(results[i].mean == results[i + 4].mean);
        REQUIRE(results[i].targetValue == results[i + 4].targetValue);
    }
    REQUIRE(results[0].mean != results[1].mean);
}
