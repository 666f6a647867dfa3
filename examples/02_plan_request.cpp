/*
================================================================================
EXAMPLE 02: PLAN REQUEST - Command-Line Planner for JSON Requests
================================================================================
Reads a planning request (catalog, schedule, optional solver settings; see
config.h for the format), solves it with Gurobi and prints the plan.

USAGE
-----
    02_plan_request --request=examples/data/reference_request.json
    02_plan_request --request=req.json --format=json --time_limit=30

FLAGS
-----
    --request      Path of the JSON request (required)
    --format       text | json (default text)
    --time_limit   Seconds; overrides solver.time_limit from the request
    --verbose      Show Gurobi's own console output

EXIT STATUS
-----------
    0  a plan was produced
    1  invalid request, infeasible model or solver failure

================================================================================
*/

#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"

#include <capplan/capplan.h>

ABSL_FLAG(std::string, request, "", "Path of the JSON planning request.");
ABSL_FLAG(std::string, format, "text", "Output format: text or json.");
ABSL_FLAG(double, time_limit, -1.0,
          "Solver time limit in seconds; negative keeps the request's value.");
ABSL_FLAG(bool, verbose, false, "Show the solver's console output.");

int main(int argc, char** argv) {
    absl::ParseCommandLine(argc, argv);
    absl::InitializeLog();

    const std::string path = absl::GetFlag(FLAGS_request);
    const std::string format = absl::GetFlag(FLAGS_format);
    if (path.empty()) {
        std::cerr << "Error: --request is required\n";
        return 1;
    }
    if (format != "text" && format != "json") {
        std::cerr << "Error: --format must be text or json, got '" << format << "'\n";
        return 1;
    }

    try {
        capplan::PlanningRequest request = capplan::loadRequest(path);

        if (absl::GetFlag(FLAGS_time_limit) >= 0.0) {
            request.options.timeLimitSeconds = absl::GetFlag(FLAGS_time_limit);
        }
        if (absl::GetFlag(FLAGS_verbose)) {
            request.options.quiet = false;
        }
        LOG(INFO) << "loaded " << path << ": " << request.schedule.periods.size()
                  << " periods, " << request.catalog.tiers.size() << " tiers, solver "
                  << capplan::solveOptionsToJson(request.options).dump();

        capplan::GurobiSolver solver;
        capplan::Planner planner(solver, request.options);
        capplan::PlanResult result = planner.plan(request.schedule, request.catalog);

        if (format == "json") {
            std::cout << capplan::resultToJson(result).dump(2) << "\n";
        } else {
            std::cout << capplan::renderReport(result);
        }
        return result.planned() ? 0 : 1;

    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
