/*
===============================================================================
TEST CONFIG — Tests for config.h
===============================================================================

OVERVIEW
--------
Validates reading planning requests from JSON: defaults for optional fields,
solver settings, and ConfigError messages that name the offending path.
Value checks (negative costs, duplicate ids) are ModelBuilder's and are not
repeated here beyond confirming they pass through parsing untouched.

TEST ORGANIZATION
-----------------
• Section A: Well-formed requests
• Section B: Structural errors
• Section C: Request files
• Section D: Solver settings

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• nlohmann/json - Request documents
• config.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <capplan/config.h>
#include <capplan/errors.h>

#include <string>

using namespace capplan;

#ifndef CAPPLAN_TEST_DATA_DIR
#define CAPPLAN_TEST_DATA_DIR "examples/data"
#endif

// ============================================================================
// TEST UTILITIES
// ============================================================================

static json minimalRequest() {
    return json::parse(R"({
        "catalog": {
            "on_demand_rate": 0.64,
            "tiers": [ { "id": "heavy", "fixed_cost": 1560, "hourly_cost": 0.128 } ]
        },
        "schedule": {
            "periods": [ { "id": "day", "demand": 4.5, "hours": 24 } ]
        }
    })");
}

/// @brief Message of the ConfigError thrown by fn, or "" if none was thrown
template<typename Fn>
static std::string configErrorOf(Fn&& fn) {
    try {
        fn();
    } catch (const ConfigError& e) {
        return e.what();
    }
    return {};
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ============================================================================
// SECTION A: WELL-FORMED REQUESTS
// ============================================================================

/**
 * @test Parse::MinimalRequestUsesDefaults
 * @brief Omitted term_days, horizon_days and solver section take defaults
 */
TEST_CASE("A1: Parse::MinimalRequestUsesDefaults", "[config][parse]")
{
    PlanningRequest request = parseRequest(minimalRequest());

    REQUIRE(request.catalog.onDemandRate == 0.64);
    REQUIRE(request.catalog.termDays == kDefaultTermDays);
    REQUIRE(request.catalog.tiers.size() == 1);
    REQUIRE(request.catalog.tiers[0].id == "heavy");
    REQUIRE(request.catalog.tiers[0].fixedCost == 1560.0);
    REQUIRE(request.catalog.tiers[0].hourlyCost == 0.128);

    REQUIRE(request.schedule.horizonDays == kDefaultHorizonDays);
    REQUIRE(request.schedule.periods.size() == 1);
    REQUIRE(request.schedule.periods[0].id == "day");
    REQUIRE(request.schedule.periods[0].demand == 4.5);
    REQUIRE(request.schedule.periods[0].hours == 24.0);

    REQUIRE(request.options.timeLimitSeconds == 0.0);
    REQUIRE(request.options.mipGap == 0.0);
    REQUIRE(request.options.quiet);
}

TEST_CASE("A2: Parse::ExplicitHorizonAndTerm", "[config][parse]")
{
    json j = minimalRequest();
    j["catalog"]["term_days"] = 1095;
    j["schedule"]["horizon_days"] = 7;

    PlanningRequest request = parseRequest(j);
    REQUIRE(request.catalog.termDays == 1095.0);
    REQUIRE(request.schedule.horizonDays == 7.0);
}

TEST_CASE("A3: Parse::EmptyListsAreAccepted", "[config][parse]")
{
    json j = minimalRequest();
    j["catalog"]["tiers"] = json::array();
    j["schedule"]["periods"] = json::array();

    PlanningRequest request = parseRequest(j);
    REQUIRE(request.catalog.tiers.empty());
    REQUIRE(request.schedule.periods.empty());
}

TEST_CASE("A4: Parse::ValuesAreNotJudged", "[config][parse]")
{
    json j = minimalRequest();
    j["schedule"]["periods"][0]["demand"] = -3;

    REQUIRE(parseRequest(j).schedule.periods[0].demand == -3.0);
}

// ============================================================================
// SECTION B: STRUCTURAL ERRORS
// ============================================================================

/**
 * @test Errors::PathNamesTheField
 * @brief Missing fields and wrong types are reported with their JSON path
 */
TEST_CASE("B1: Errors::PathNamesTheField", "[config][errors]")
{
    json j = minimalRequest();

    SECTION("Missing catalog")
    {
        j.erase("catalog");
        REQUIRE(contains(configErrorOf([&] { parseRequest(j); }), "catalog: missing"));
    }

    SECTION("Missing tier field")
    {
        j["catalog"]["tiers"][0].erase("hourly_cost");
        REQUIRE(contains(configErrorOf([&] { parseRequest(j); }),
                         "catalog.tiers[0].hourly_cost: missing required field"));
    }

    SECTION("Wrong type")
    {
        j["catalog"]["tiers"].push_back(json{{"id", "light"}, {"fixed_cost", "cheap"}, {"hourly_cost", 0.3}});
        const auto message = configErrorOf([&] { parseRequest(j); });
        REQUIRE(contains(message, "catalog.tiers[1].fixed_cost"));
        REQUIRE(contains(message, "type must be number"));
    }

    SECTION("Periods not an array")
    {
        j["schedule"]["periods"] = json::object();
        REQUIRE(contains(configErrorOf([&] { parseRequest(j); }),
                         "schedule.periods: must be an array"));
    }

    SECTION("Period not an object")
    {
        j["schedule"]["periods"].push_back(3);
        REQUIRE(contains(configErrorOf([&] { parseRequest(j); }),
                         "schedule.periods[1]: must be an object"));
    }

    SECTION("Id of the wrong type")
    {
        j["schedule"]["periods"][0]["id"] = 7;
        REQUIRE(contains(configErrorOf([&] { parseRequest(j); }), "schedule.periods[0].id"));
    }
}

TEST_CASE("B2: Errors::DocumentLevel", "[config][errors]")
{
    REQUIRE(contains(configErrorOf([] { parseRequest(json::array()); }), "must be a JSON object"));
    REQUIRE(contains(configErrorOf([] { parseRequestText("{ not json"); }), "request: "));
    REQUIRE_THROWS_AS(parseRequestText("{}"), std::invalid_argument);
}

// ============================================================================
// SECTION C: REQUEST FILES
// ============================================================================

TEST_CASE("C1: Files::ReferenceRequest", "[config][files]")
{
    PlanningRequest request = loadRequest(std::string(CAPPLAN_TEST_DATA_DIR) + "/reference_request.json");

    REQUIRE(request.schedule.periods.size() == 3);
    REQUIRE(request.schedule.periods[2].id == "evening");
    REQUIRE(request.schedule.periods[2].demand == 53.5);
    REQUIRE(request.catalog.tiers.size() == 3);
    REQUIRE(request.catalog.tiers[1].id == "medium");
    REQUIRE(request.options.timeLimitSeconds == 60.0);
}

TEST_CASE("C2: Files::UnreadableFile", "[config][files]")
{
    const std::string path = "/nonexistent/capplan/request.json";
    const auto message = configErrorOf([&] { loadRequest(path); });

    REQUIRE(contains(message, path));
    REQUIRE(contains(message, "cannot open"));
}

// ============================================================================
// SECTION D: SOLVER SETTINGS
// ============================================================================

TEST_CASE("D1: Solver::SectionOverridesDefaults", "[config][solver]")
{
    json j = minimalRequest();
    j["solver"] = json{{"time_limit", 30}, {"mip_gap", 0.01}, {"threads", 4}, {"quiet", false}};

    const SolveOptions options = parseRequest(j).options;
    REQUIRE(options.timeLimitSeconds == 30.0);
    REQUIRE(options.mipGap == 0.01);
    REQUIRE(options.threads == 4);
    REQUIRE_FALSE(options.quiet);

    const json back = solveOptionsToJson(options);
    REQUIRE(back.at("time_limit") == 30.0);
    REQUIRE(back.at("threads") == 4);
    REQUIRE(back.at("quiet") == false);
}

TEST_CASE("D2: Solver::WrongTypeIsRejected", "[config][solver]")
{
    json j = minimalRequest();
    j["solver"] = json{{"quiet", "yes"}};

    REQUIRE(contains(configErrorOf([&] { parseRequest(j); }), "solver.quiet"));
}

/**
 * @test Solver::OutOfRangeIsRejected
 * @brief Fractional or negative thread counts and negative limits name their field
 */
TEST_CASE("D3: Solver::OutOfRangeIsRejected", "[config][solver]")
{
    json j = minimalRequest();

    SECTION("Fractional threads")
    {
        j["solver"] = json{{"threads", 2.5}};
        const std::string message = configErrorOf([&] { parseRequest(j); });
        REQUIRE(contains(message, "solver.threads"));
        REQUIRE(contains(message, "non-negative integer"));
    }

    SECTION("Negative threads")
    {
        j["solver"] = json{{"threads", -1}};
        REQUIRE(contains(configErrorOf([&] { parseRequest(j); }), "solver.threads"));
    }

    SECTION("Negative mip_gap")
    {
        j["solver"] = json{{"mip_gap", -0.01}};
        const std::string message = configErrorOf([&] { parseRequest(j); });
        REQUIRE(contains(message, "solver.mip_gap"));
        REQUIRE(contains(message, ">= 0"));
    }

    SECTION("Negative time_limit")
    {
        j["solver"] = json{{"time_limit", -5}};
        REQUIRE(contains(configErrorOf([&] { parseRequest(j); }), "solver.time_limit"));
    }

    SECTION("Zero is accepted")
    {
        j["solver"] = json{{"threads", 0}, {"mip_gap", 0}, {"time_limit", 0.0}};
        const SolveOptions options = parseRequest(j).options;
        REQUIRE(options.threads == 0);
        REQUIRE(options.mipGap == 0.0);
        REQUIRE(options.timeLimitSeconds == 0.0);
    }
}
