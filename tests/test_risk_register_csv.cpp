#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

#include "risk_analysis.hpp"
#include "risk_errors.hpp"
#include "risk_register_csv.hpp"

TEST_CASE("Quoted cells keep commas and escaped quotes", "[csv]") {
    const auto cells = splitCsvLine(R"(a,"b, c","say ""hi""",,d)");
    REQUIRE(cells.size() == 5);
    REQUIRE(cells[1] == "b, c");
    REQUIRE(cells[2] == "say \"hi\"");
    REQUIRE(cells[3].empty());
    REQUIRE(cells[4] == "d");
}

TEST_CASE("Register rows parse by header name", "[csv]") {
    std::istringstream in(
        "Distribution,P90,P50,P10,Probability,ID,RiskOrOpportunity\r\n"
        "normal,30,20,10,0.5,X1,opportunity\r\n"
        "uniform,3,2,1,,X2,\r\n");
    const auto risks = parseRiskRegisterCsv(in);

    REQUIRE(risks.size() == 2);
    REQUIRE(risks[0].id == "X1");
    REQUIRE(risks[0].kind == "opportunity");
    REQUIRE(risks[0].distributionModel == "normal");
    REQUIRE(risks[0].p10 == 10.0);
    REQUIRE(risks[0].p90 == 30.0);
    REQUIRE(risks[0].probability == 0.5);

    REQUIRE(risks[1].kind == "threat");
    REQUIRE_FALSE(risks[1].probability.has_value());
}

TEST_CASE("Missing required columns are all reported", "[csv]") {
    std::istringstream in("id,p10,p50\nA,1,2\n");
    try {
        (void)parseRiskRegisterCsv(in);
        FAIL("expected ValidationError");
    } catch (const ValidationError& error) {
        REQUIRE(error.issues().size() == 3);
        for (const auto& issue : error.issues()) {
            REQUIRE(issue.field == "header");
        }
    }
}

TEST_CASE("Non-numeric cells name the risk and field", "[csv]") {
    std::istringstream in(
        "p10,p50,p90,probability,distribution,id\n"
        "1,two,3,0.5,uniform,R9\n"
        "1,2,3,lots,uniform,\n");
    try {
        (void)parseRiskRegisterCsv(in);
        FAIL("expected ValidationError");
    } catch (const ValidationError& error) {
        REQUIRE(error.issues().size() == 2);
        REQUIRE(error.issues()[0].riskId == "R9");
        REQUIRE(error.issues()[0].field == "p50");
        REQUIRE(error.issues()[1].riskId == "line 3");
        REQUIRE(error.issues()[1].field == "probability");
    }
}

TEST_CASE("Header-less input is rejected", "[csv]") {
    std::istringstream in("# only a comment\n\n");
    REQUIRE_THROWS_AS(parseRiskRegisterCsv(in), ValidationError);
}

TEST_CASE("Unreadable register path throws runtime_error", "[csv]") {
    REQUIRE_THROWS_AS(loadRiskRegisterCsv("/nonexistent/register.csv"), std::runtime_error);
}

TEST_CASE("Sample register loads and simulates", "[csv]") {
    const auto risks = loadRiskRegisterCsv(std::string(QRA_TEST_DATA_DIR) + "/sample_register.csv");
    REQUIRE(risks.size() == 6);
    REQUIRE(risks[0].title == "Unforeseen ground conditions, north abutment");
    REQUIRE(risks[4].kind == "opportunity");
    REQUIRE(risks[4].title == "Value engineering: \"precast\" deck");
    REQUIRE(risks[5].riskNumber == "R-005");

    SimulationRequest request;
    request.risks = risks;
    request.iterations = 5000;
    request.seed = 10;
    const SimulationResult result = runRiskAnalysis(request);
    REQUIRE(result.base == Approx(250000.0 + 75000.0 + 50000.0 + 30000.0 - 40000.0 + 10000.0));
    REQUIRE(result.sensitivityAnalysis.size() == 6);
    REQUIRE(result.sensitivityAnalysis.front().riskId == "GEO-1");
    REQUIRE(result.sensitivityAnalysis.front().title == "Unforeseen ground conditions, north abutment");
}
