#pragma once
/*
===============================================================================
CAPPLAN — Unified include header
===============================================================================

OVERVIEW
--------
Single include for the capacity planner: pricing and demand inputs, the
model builder, the solver boundary with its Gurobi adapter, the plan decoder,
the planner facade, diagnostics, configuration and reporting.

QUICK START
-----------
    #include <capplan/capplan.h>

    int main() {
        capplan::DemandSchedule schedule{{
            {"night", 12.2, 8.0}, {"morning", 25.1, 8.0}, {"evening", 53.5, 8.0}}};
        capplan::PricingCatalog catalog{0.64, {
            {"light", 552.0, 0.312}, {"medium", 1280.0, 0.192}, {"heavy", 1560.0, 0.128}}};

        capplan::GurobiSolver solver;
        capplan::Planner planner(solver);
        auto result = planner.plan(schedule, catalog);

        std::cout << capplan::renderReport(result);
        return result.planned() ? 0 : 1;
    }

REQUIREMENTS
------------
• C++20 compiler
• Gurobi Optimizer 10.0+ with C++ API (gurobi_solver.h, callbacks.h only)
• Abseil (logging), nlohmann/json (config.h, report.h)

CONFIGURATION
-------------
• CAPPLAN_DEBUG or _DEBUG: symbolic column/row names inside Gurobi

===============================================================================
*/

// Inputs and shared contracts
#include "enum_utils.h"
#include "naming.h"
#include "errors.h"
#include "pricing.h"
#include "variable_key.h"

// Solver-neutral model
#include "expressions.h"
#include "model.h"
#include "model_builder.h"

// Solving and decoding
#include "solver.h"
#include "callbacks.h"
#include "gurobi_solver.h"
#include "plan_decoder.h"
#include "planner.h"

// Analysis and I/O
#include "diagnostics.h"
#include "config.h"
#include "report.h"
