/*
===============================================================================
TEST MODEL BUILDER — Tests for model_builder.h
===============================================================================

OVERVIEW
--------
Validates model construction from a demand schedule and a pricing catalog:
variable and constraint counts, constraint shapes, objective coefficients,
horizon amortization, input validation, and determinism. No solver involved.

TEST ORGANIZATION
-----------------
• Section A: Model structure (counts, layout)
• Section B: Capacity and reservation-bound constraints
• Section C: Objective coefficients and amortization
• Section D: Input validation
• Section E: Edge cases (no tiers, no periods, zero demand)
• Section F: Determinism

TEST STRATEGY
-------------
• Use the three-period, three-tier reference scenario throughout
• Inspect coefficients through LinearExpression::coefficients()
• Check that validation reports every problem, not only the first

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• model_builder.h - System under test
• model.h, pricing.h, errors.h - Supporting types

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <capplan/errors.h>
#include <capplan/model.h>
#include <capplan/model_builder.h>
#include <capplan/pricing.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace capplan;
using Catch::Approx;

// ============================================================================
// TEST UTILITIES AND FIXTURES
// ============================================================================

static DemandSchedule referenceSchedule() {
    return DemandSchedule{{
        {"night", 12.2, 8.0},
        {"morning", 25.1, 8.0},
        {"evening", 53.5, 8.0}}};
}

static PricingCatalog referenceCatalog() {
    return PricingCatalog{0.64, {
        {"light", 552.0, 0.312},
        {"medium", 1280.0, 0.192},
        {"heavy", 1560.0, 0.128}}};
}

static const Constraint& findConstraint(const Model& model, const std::string& name) {
    for (const auto& c : model.constraints()) {
        if (c.name == name) return c;
    }
    FAIL("constraint not found: " << name);
    throw std::logic_error("unreachable");
}

static bool hasProblemContaining(const std::vector<std::string>& problems, const std::string& text) {
    for (const auto& p : problems) {
        if (p.find(text) != std::string::npos) return true;
    }
    return false;
}

// ============================================================================
// SECTION A: MODEL STRUCTURE
// ============================================================================

/**
 * @test Structure::ReferenceCounts
 * @brief P + K*P + K variables and P + K*P constraints
 *
 * @given 3 periods and 3 tiers
 * @then 15 integer variables, 3 capacity rows and 9 reservation-bound rows
 */
TEST_CASE("A1: Structure::ReferenceCounts", "[model_builder][structure]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    Model model = buildModel(schedule, catalog);

    REQUIRE(model.variableCount() == 15);
    REQUIRE(model.constraintCount() == 12);
    REQUIRE(model.constraints(ConFamily::Capacity).size() == 3);
    REQUIRE(model.constraints(ConFamily::Reservation).size() == 9);

    REQUIRE(model.objective().sense == Sense::Minimize);
}

TEST_CASE("A2: Structure::LayoutFollowsRequestOrder", "[model_builder][structure]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    Model model = buildModel(schedule, catalog);

    REQUIRE(model.layout() == VariableLayout(schedule, catalog));
    REQUIRE(model.layout().periods() == std::vector<std::string>{"night", "morning", "evening"});

    const auto keys = model.layout().keys();
    REQUIRE(keys.size() == model.variables().size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        REQUIRE(model.variables()[i].key == keys[i]);
    }
}

// ============================================================================
// SECTION B: CONSTRAINTS
// ============================================================================

/**
 * @test Constraints::CapacityRow
 * @brief on_demand[p] + sum_k reserved[k,p] >= demand[p]
 */
TEST_CASE("B1: Constraints::CapacityRow", "[model_builder][constraints]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    Model model = buildModel(schedule, catalog);
    const auto& L = model.layout();

    const Constraint& c = findConstraint(model, "capacity[evening]");
    REQUIRE(c.family == ConFamily::Capacity);
    REQUIRE(c.relation == Relation::GreaterEqual);
    REQUIRE(c.bound == Approx(53.5));

    const auto coeffs = c.lhs.coefficients();
    REQUIRE(coeffs.size() == 4);
    REQUIRE(coeffs.at(L.onDemand(2)) == 1.0);
    for (std::size_t k = 0; k < 3; ++k) {
        REQUIRE(coeffs.at(L.reserved(k, 2)) == 1.0);
    }
}

TEST_CASE("B2: Constraints::ReservationBoundRow", "[model_builder][constraints]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    Model model = buildModel(schedule, catalog);
    const auto& L = model.layout();

    const Constraint& c = findConstraint(model, "reservation_bound[heavy,night]");
    REQUIRE(c.family == ConFamily::Reservation);
    REQUIRE(c.bound == 0.0);

    const auto coeffs = c.lhs.coefficients();
    REQUIRE(coeffs.size() == 2);
    REQUIRE(coeffs.at(L.reservation(2)) == 1.0);
    REQUIRE(coeffs.at(L.reserved(2, 0)) == -1.0);
}

/**
 * @test Constraints::SatisfiedByAssignment
 * @brief Constraint::slack and satisfiedBy evaluate rows under an assignment
 */
TEST_CASE("B3: Constraints::SatisfiedByAssignment", "[model_builder][constraints]")
{
    DemandSchedule schedule{{{"only", 2.5, 24.0}}};
    PricingCatalog catalog{1.0, {{"tier", 100.0, 0.5}}};
    Model model = buildModel(schedule, catalog);
    const auto& L = model.layout();

    Assignment values{
        {L.onDemand(0), 1.0},
        {L.reserved(0, 0), 2.0},
        {L.reservation(0), 2.0}};

    for (const auto& c : model.constraints()) {
        REQUIRE(c.satisfiedBy(values));
    }
    REQUIRE(findConstraint(model, "capacity[only]").slack(values) == Approx(0.5));

    values[L.reserved(0, 0)] = 3.0;
    REQUIRE_FALSE(findConstraint(model, "reservation_bound[tier,only]").satisfiedBy(values));
}

// ============================================================================
// SECTION C: OBJECTIVE
// ============================================================================

/**
 * @test Objective::ReferenceCoefficients
 * @brief fixed/cycles per reservation, hourly*hours per running instance
 */
TEST_CASE("C1: Objective::ReferenceCoefficients", "[model_builder][objective]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    Model model = buildModel(schedule, catalog);
    const auto& L = model.layout();

    const auto coeffs = model.objective().expression.coefficients();
    REQUIRE(coeffs.size() == 15);

    REQUIRE(coeffs.at(L.reservation(0)) == Approx(552.0 / 365.0));
    REQUIRE(coeffs.at(L.reservation(1)) == Approx(1280.0 / 365.0));
    REQUIRE(coeffs.at(L.reservation(2)) == Approx(1560.0 / 365.0));

    REQUIRE(coeffs.at(L.reserved(0, 0)) == Approx(0.312 * 8.0));
    REQUIRE(coeffs.at(L.reserved(2, 1)) == Approx(1.024));
    REQUIRE(coeffs.at(L.onDemand(2)) == Approx(5.12));
}

TEST_CASE("C2: Objective::HorizonAmortization", "[model_builder][objective]")
{
    PricingCatalog catalog{0.64, {{"heavy", 1560.0, 0.128}}};

    SECTION("Week-long horizon divides by 365/7")
    {
        DemandSchedule schedule{{{"week", 10.0, 168.0}}, 7.0};
        REQUIRE(horizonCyclesPerTerm(schedule, catalog) == Approx(365.0 / 7.0));

        Model model = buildModel(schedule, catalog);
        const auto coeffs = model.objective().expression.coefficients();
        REQUIRE(coeffs.at(model.layout().reservation(0)) == Approx(1560.0 * 7.0 / 365.0));
        REQUIRE(coeffs.at(model.layout().onDemand(0)) == Approx(0.64 * 168.0));
    }

    SECTION("Three-year term")
    {
        DemandSchedule schedule{{{"day", 10.0, 24.0}}};
        catalog.termDays = 3 * 365.0;

        Model model = buildModel(schedule, catalog);
        const auto coeffs = model.objective().expression.coefficients();
        REQUIRE(coeffs.at(model.layout().reservation(0)) == Approx(1560.0 / 1095.0));
    }
}

// ============================================================================
// SECTION D: VALIDATION
// ============================================================================

TEST_CASE("D1: Validation::ValidInputHasNoProblems", "[model_builder][validation]")
{
    REQUIRE(findInputProblems(referenceSchedule(), referenceCatalog()).empty());
    REQUIRE_NOTHROW(validateInputs(referenceSchedule(), referenceCatalog()));
}

/**
 * @test Validation::RejectsMalformedValues
 * @brief Each malformed field is reported with its owner's id
 */
TEST_CASE("D2: Validation::RejectsMalformedValues", "[model_builder][validation]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    SECTION("Negative demand")
    {
        schedule.periods[1].demand = -1.0;
        auto problems = findInputProblems(schedule, catalog);
        REQUIRE(problems.size() == 1);
        REQUIRE(hasProblemContaining(problems, "period[morning]: demand"));
    }

    SECTION("Zero hours")
    {
        schedule.periods[0].hours = 0.0;
        REQUIRE(hasProblemContaining(findInputProblems(schedule, catalog), "period[night]: hours"));
    }

    SECTION("Duplicate period id")
    {
        schedule.periods[2].id = "night";
        REQUIRE(hasProblemContaining(findInputProblems(schedule, catalog), "period[night]: duplicate id"));
    }

    SECTION("Empty tier id")
    {
        catalog.tiers[0].id = "";
        REQUIRE(hasProblemContaining(findInputProblems(schedule, catalog), "tier: id must not be empty"));
    }

    SECTION("Non-finite costs")
    {
        catalog.tiers[2].fixedCost = nan;
        catalog.tiers[1].hourlyCost = inf;
        catalog.onDemandRate = -0.1;
        auto problems = findInputProblems(schedule, catalog);
        REQUIRE(problems.size() == 3);
        REQUIRE(hasProblemContaining(problems, "on_demand_rate"));
        REQUIRE(hasProblemContaining(problems, "tier[heavy]: fixed_cost"));
        REQUIRE(hasProblemContaining(problems, "tier[medium]: hourly_cost"));
    }

    SECTION("Non-positive horizon and term")
    {
        schedule.horizonDays = 0.0;
        catalog.termDays = -365.0;
        auto problems = findInputProblems(schedule, catalog);
        REQUIRE(hasProblemContaining(problems, "horizon_days"));
        REQUIRE(hasProblemContaining(problems, "term_days"));
    }
}

TEST_CASE("D3: Validation::BuildThrowsConfigErrorWithAllProblems", "[model_builder][validation]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    schedule.periods[0].demand = -5.0;
    catalog.tiers[0].fixedCost = -1.0;

    try {
        (void)buildModel(schedule, catalog);
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        REQUIRE(e.problems().size() == 2);
        REQUIRE(std::string(e.what()).find("invalid planning input") != std::string::npos);
    }

    REQUIRE_THROWS_AS(buildModel(schedule, catalog), std::invalid_argument);
}

// ============================================================================
// SECTION E: EDGE CASES
// ============================================================================

TEST_CASE("E1: EdgeCases::NoTiersIsOnDemandOnly", "[model_builder][edge]")
{
    DemandSchedule schedule = referenceSchedule();
    PricingCatalog catalog{0.64, {}};
    Model model = buildModel(schedule, catalog);

    REQUIRE(model.variableCount() == 3);
    REQUIRE(model.constraintCount() == 3);
    REQUIRE(model.constraints(ConFamily::Reservation).empty());
}

TEST_CASE("E2: EdgeCases::NoPeriods", "[model_builder][edge]")
{
    DemandSchedule schedule;
    PricingCatalog catalog = referenceCatalog();
    Model model = buildModel(schedule, catalog);

    REQUIRE(model.variableCount() == 3);
    REQUIRE(model.constraintCount() == 0);
}

TEST_CASE("E3: EdgeCases::ZeroDemandKeepsRows", "[model_builder][edge]")
{
    DemandSchedule schedule{{{"idle", 0.0, 24.0}}};
    Model model = buildModel(schedule, referenceCatalog());

    REQUIRE(findConstraint(model, "capacity[idle]").bound == 0.0);
    REQUIRE(model.constraintCount() == 1 + 3);
}

/**
 * @test EdgeCases::HoursBeyondHorizonStillBuild
 * @brief Durations are not checked against the horizon length
 *
 * @given Two 16 h periods in a one-day horizon (32 h in total)
 * @then The model builds and fixed costs are still amortized over 365 cycles
 */
TEST_CASE("E4: EdgeCases::HoursBeyondHorizonStillBuild", "[model_builder][edge]")
{
    DemandSchedule schedule{{{"a", 1.0, 16.0}, {"b", 2.0, 16.0}}};
    PricingCatalog catalog = referenceCatalog();

    REQUIRE(schedule.totalHours() > schedule.horizonHours());
    REQUIRE(findInputProblems(schedule, catalog).empty());

    Model model = buildModel(schedule, catalog);
    REQUIRE(model.variableCount() == 2 + 3 * 2 + 3);

    const auto coeffs = model.objective().expression.coefficients();
    REQUIRE(coeffs.at(model.layout().reservation(2)) == Approx(1560.0 / 365.0));
    REQUIRE(coeffs.at(model.layout().onDemand(1)) == Approx(0.64 * 16.0));
}

// ============================================================================
// SECTION F: DETERMINISM
// ============================================================================

/**
 * @test Determinism::IdenticalInputsIdenticalModels
 * @brief Two builds of the same request agree row by row and term by term
 */
TEST_CASE("F1: Determinism::IdenticalInputsIdenticalModels", "[model_builder][determinism]")
{
    auto schedule = referenceSchedule();
    auto catalog = referenceCatalog();
    Model a = buildModel(schedule, catalog);
    Model b = ModelBuilder(schedule, catalog).build();

    REQUIRE(a.layout() == b.layout());
    REQUIRE(a.constraintCount() == b.constraintCount());
    for (std::size_t i = 0; i < a.constraintCount(); ++i) {
        REQUIRE(a.constraints()[i].name == b.constraints()[i].name);
        REQUIRE(a.constraints()[i].bound == b.constraints()[i].bound);
        REQUIRE(a.constraints()[i].lhs.coefficients() == b.constraints()[i].lhs.coefficients());
    }
    REQUIRE(a.objective().expression.coefficients() == b.objective().expression.coefficients());
}
