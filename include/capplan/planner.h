#pragma once
/*
===============================================================================
PLANNER — build, solve, decode, classify
===============================================================================

Overview
--------
Planner is the entry point for callers that want a plan and do not care
about the intermediate Model:

    GurobiSolver solver;
    Planner planner(solver);
    PlanResult result = planner.plan(schedule, catalog);

    switch (result.status) {
        case PlanStatus::Planned:      use(*result.plan);            break;
        case PlanStatus::InvalidInput: fix(result.problems);         break;
        case PlanStatus::Infeasible:   investigate(result.message);  break;
        case PlanStatus::SolverError:  maybeRetry(result.message);   break;
    }

Outcome Classification
----------------------
    ConfigError from ModelBuilder  -> InvalidInput (problems listed)
    Solution Optimal               -> Planned (plan decoded and verified)
    Solution Infeasible            -> Infeasible, logged as a warning
    Solution Error                 -> SolverError, no retry
    Solution Unbounded             -> logged, InvariantViolation thrown

With non-negative costs the objective is bounded below by zero, so an
Unbounded answer can only mean the model or the solver is broken; it is not
reported as a normal outcome. Infeasibility cannot arise either (on-demand
capacity is unlimited), but it is reported rather than assumed away.

DecodeError propagates unchanged: it signals a bug in this library.

===============================================================================
*/

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"

#include "diagnostics.h"
#include "enum_utils.h"
#include "errors.h"
#include "model.h"
#include "model_builder.h"
#include "plan_decoder.h"
#include "pricing.h"
#include "solver.h"

namespace capplan {

    CAPPLAN_DECLARE_ENUM_WITH_COUNT(PlanStatus, Planned, InvalidInput, Infeasible, SolverError);

    inline std::string statusString(PlanStatus status) {
        switch (status) {
            case PlanStatus::Planned:      return "PLANNED";
            case PlanStatus::InvalidInput: return "INVALID_INPUT";
            case PlanStatus::Infeasible:   return "INFEASIBLE";
            case PlanStatus::SolverError:  return "SOLVER_ERROR";
            case PlanStatus::COUNT:        break;
        }
        return "UNKNOWN(" + std::to_string(static_cast<int>(status)) + ")";
    }

    struct PlanResult {
        PlanStatus status = PlanStatus::SolverError;
        std::optional<ProvisioningPlan> plan;   ///< Set iff Planned
        std::string message;
        std::vector<std::string> problems;      ///< InvalidInput details

        bool planned() const noexcept { return status == PlanStatus::Planned; }
    };

    class Planner {
    public:
        explicit Planner(SolverAdapter& solver, SolveOptions options = {})
            : solver_(solver), options_(std::move(options))
        {
        }

        const SolveOptions& options() const noexcept { return options_; }
        SolverAdapter& solver() noexcept { return solver_; }

        /**
         * @brief Produce a provisioning plan for one request
         *
         * @throws InvariantViolation if the solver reports an unbounded model
         * @throws DecodeError on a builder/decoder layout mismatch
         */
        PlanResult plan(const DemandSchedule& schedule, const PricingCatalog& catalog) {
            PlanResult result;

            Model model;
            try {
                model = buildModel(schedule, catalog);
            } catch (const ConfigError& e) {
                LOG(WARNING) << "planner: rejected input: " << e.what();
                result.status = PlanStatus::InvalidInput;
                result.message = e.what();
                result.problems = e.problems();
                return result;
            }

            if (schedule.totalHours() > schedule.horizonHours()) {
                LOG(WARNING) << "planner: periods span " << schedule.totalHours()
                             << " h, more than the " << schedule.horizonHours()
                             << " h horizon; fixed costs are still amortized over "
                             << horizonCyclesPerTerm(schedule, catalog) << " cycles";
            }

            LOG(INFO) << "planner: built " << modelSummary(model)
                      << ", solving with " << solver_.name();

            Solution solution = solver_.solve(model, options_);

            switch (solution.status) {
                case SolutionStatus::Optimal: {
                    ProvisioningPlan plan = decodePlan(model, solution);
                    const auto quality = verifyPlan(plan, schedule);
                    if (!quality.feasible()) {
                        LOG(WARNING) << "planner: optimal plan violates invariants beyond tolerance"
                                     << " (shortfall " << quality.maxCapacityShortfall
                                     << ", reservation excess " << quality.maxReservationExcess
                                     << ", integrality " << quality.maxIntViolation << ")";
                    }
                    LOG(INFO) << "planner: optimal, total cost " << plan.totalCost;
                    result.status = PlanStatus::Planned;
                    result.plan = std::move(plan);
                    result.message = solution.message;
                    return result;
                }

                case SolutionStatus::Infeasible:
                    LOG(WARNING) << "planner: " << solver_.name()
                                 << " reports the model infeasible; on-demand capacity should"
                                    " always cover demand, check the model";
                    result.status = PlanStatus::Infeasible;
                    result.message = solution.message.empty() ? "INFEASIBLE" : solution.message;
                    return result;

                case SolutionStatus::Unbounded:
                    LOG(ERROR) << "planner: " << solver_.name()
                               << " reports an unbounded objective with non-negative costs";
                    throw InvariantViolation("planner: solver reported an unbounded objective");

                case SolutionStatus::Error:
                case SolutionStatus::COUNT:
                    break;
            }

            LOG(WARNING) << "planner: " << solver_.name() << " failed: " << solution.message;
            result.status = PlanStatus::SolverError;
            result.message = solution.message;
            return result;
        }

    private:
        SolverAdapter& solver_;
        SolveOptions options_;
    };

} // namespace capplan
