#pragma once
/*
===============================================================================
SOLVER — The boundary between the planning core and a MIP solver
===============================================================================

Overview
--------
The core depends on exactly one operation of a solver:

    Solution SolverAdapter::solve(const Model&, const SolveOptions&)

Request:   minimize, objective terms, >= rows, integer columns (Model)
Response:  status, objective value and assignment (present iff Optimal)

Any correct mixed-integer solver can sit behind this interface. When several
assignments share the optimal objective value, which one is returned is the
solver's choice; callers may rely on the objective value only.

Failure Semantics
-----------------
solve() never throws for solver-side problems. An unavailable solver, a
missing license, an expired time limit or a cancelled run are reported as
SolutionStatus::Error with a human-readable message, so the caller can tell
"no feasible plan" from "solver unavailable" without catching anything.

Cancellation
------------
SolveOptions carries a CancellationToken. Copies of a token share one flag;
trip it from any thread with cancel() and a running solve stops at the
solver's next callback and returns Error.

===============================================================================
*/

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "enum_utils.h"
#include "expressions.h"
#include "model.h"

namespace capplan {

    CAPPLAN_DECLARE_ENUM_WITH_COUNT(SolutionStatus, Optimal, Infeasible, Unbounded, Error);

    /**
     * @brief Human-readable status name ("OPTIMAL", "INFEASIBLE", ...)
     */
    inline std::string statusString(SolutionStatus status) {
        switch (status) {
            case SolutionStatus::Optimal:    return "OPTIMAL";
            case SolutionStatus::Infeasible: return "INFEASIBLE";
            case SolutionStatus::Unbounded:  return "UNBOUNDED";
            case SolutionStatus::Error:      return "ERROR";
            case SolutionStatus::COUNT:      break;
        }
        return "UNKNOWN(" + std::to_string(static_cast<int>(status)) + ")";
    }

    /**
     * @brief Flat solver result
     *
     * @details objectiveValue and assignment are set iff status is Optimal.
     *          message explains Error outcomes and is free-form otherwise.
     */
    struct Solution {
        SolutionStatus status = SolutionStatus::Error;
        std::optional<double> objectiveValue;
        std::optional<Assignment> assignment;
        std::string message;

        bool isOptimal() const noexcept { return status == SolutionStatus::Optimal; }

        static Solution optimal(double objective, Assignment values) {
            Solution s;
            s.status = SolutionStatus::Optimal;
            s.objectiveValue = objective;
            s.assignment = std::move(values);
            return s;
        }

        static Solution withStatus(SolutionStatus status, std::string message = {}) {
            Solution s;
            s.status = status;
            s.message = std::move(message);
            return s;
        }
    };

    /**
     * @brief Shared cancellation flag
     */
    class CancellationToken {
    public:
        CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() const noexcept { flag_->store(true, std::memory_order_relaxed); }

        bool cancelled() const noexcept { return flag_->load(std::memory_order_relaxed); }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    /**
     * @brief Per-solve settings
     *
     * @note mipGap defaults to 0 so that Optimal means proven optimal; raising
     *       it lets the solver call a near-optimal plan Optimal.
     */
    struct SolveOptions {
        double timeLimitSeconds = 0.0;   ///< 0 = no limit
        double mipGap = 0.0;             ///< Relative optimality gap
        int threads = 0;                 ///< 0 = solver default
        bool quiet = true;               ///< Suppress solver console output
        CancellationToken cancellation;
    };

    /**
     * @brief Abstract solver boundary
     */
    class SolverAdapter {
    public:
        virtual ~SolverAdapter() = default;

        /// @brief Solver name for logs and reports
        virtual std::string name() const = 0;

        /**
         * @brief Solve the model; blocks until done, cancelled or timed out
         * @note Must not throw for solver-side failures (see file header)
         */
        virtual Solution solve(const Model& model, const SolveOptions& options) = 0;
    };

} // namespace capplan
