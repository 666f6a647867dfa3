#pragma once
/*
===============================================================================
GUROBI SOLVER — SolverAdapter backed by the Gurobi C++ API
===============================================================================

Overview
--------
GurobiSolver translates a capplan Model into a GRBModel, optimizes it and
translates the outcome back into a Solution:

    solve(model, options) {
        GRBModel grb(environment());     // lazily created, owned GRBEnv
        applyOptions();                  // TimeLimit, MIPGap, Threads, OutputFlag
        addVariables();                  // one column per Variable
        addConstraints();                // one >= row per Constraint
        setObjective();                  // GRB_MINIMIZE
        grb.optimize();                  // with SolveCallback for cancellation
        return translate(status);
    }

Key Features
------------
1. Lazy environment:
       - No GRBEnv is created until the first solve().
       - configureEnvironment() runs once, before env.start(), so derived
         classes can set license or logging parameters.
       - A GurobiSolver may instead borrow an external GRBEnv; it then
         never creates or starts one.

2. Status mapping:
       GRB_OPTIMAL       -> Optimal (objective + full assignment)
       GRB_INFEASIBLE    -> Infeasible
       GRB_UNBOUNDED     -> Unbounded
       GRB_INF_OR_UNBD   -> re-solved with DualReductions=0, then mapped
       anything else     -> Error, message carries the Gurobi status name

3. No exceptions for solver failures:
       Every GRBException (missing license, out of memory, callback error)
       becomes an Error solution with the Gurobi code and message.
       A Model that cannot be translated (duplicate variable, expression
       over an undeclared variable) becomes an Error solution whose
       message starts with "invalid model:".

4. Debug names:
       Columns and rows get symbolic names only when debug naming is
       enabled (CAPPLAN_DEBUG or _DEBUG); see naming.h.

Thread Safety
-------------
One GurobiSolver owns one environment; do not call solve() on the same
instance from two threads at once. Create one solver per thread instead.

===============================================================================
*/

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "callbacks.h"
#include "expressions.h"
#include "model.h"
#include "naming.h"
#include "solver.h"
#include "variable_key.h"

namespace capplan {

    /**
     * @brief Convert a Gurobi status code to its name
     *
     * @example
     *     gurobiStatusString(GRB_TIME_LIMIT);   // "TIME_LIMIT"
     */
    inline std::string gurobiStatusString(int status) {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_CUTOFF:          return "CUTOFF";
            case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            case GRB_INPROGRESS:      return "INPROGRESS";
            case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
            default:                  return "UNKNOWN(" + std::to_string(status) + ")";
        }
    }

    class GurobiSolver : public SolverAdapter {
    public:
        using ColumnMap = std::map<VariableKey, GRBVar>;

        /// @brief Default constructor. No environment is created yet.
        GurobiSolver() = default;

        /**
         * @brief Borrow an external, already started environment
         *
         * The caller keeps ownership; externalEnv must outlive the solver.
         */
        explicit GurobiSolver(GRBEnv& externalEnv)
            : external_env_(&externalEnv)
        {
        }

        ~GurobiSolver() override = default;

        std::string name() const override { return "gurobi"; }

        Solution solve(const Model& model, const SolveOptions& options) override {
            if (options.cancellation.cancelled()) {
                return Solution::withStatus(SolutionStatus::Error, "cancelled before start");
            }

            try {
                GRBModel grb(environment());
                applyOptions(grb, options);

                ColumnMap columns = addVariables(grb, model);
                addConstraints(grb, model, columns);
                setObjective(grb, model, columns);

                SolveCallback callback(options.cancellation);
                grb.setCallback(&callback);
                grb.optimize();

                int status = grb.get(GRB_IntAttr_Status);
                if (status == GRB_INF_OR_UNBD) {
                    // Presolve could not tell which; ask again without dual reductions.
                    grb.set(GRB_IntParam_DualReductions, 0);
                    grb.reset();
                    grb.optimize();
                    status = grb.get(GRB_IntAttr_Status);
                }

                VLOG(1) << "gurobi: " << gurobiStatusString(status) << " after "
                        << grb.get(GRB_DoubleAttr_Runtime) << " s, "
                        << model.variableCount() << " columns, "
                        << model.constraintCount() << " rows";

                return translate(grb, status, columns, callback);
            } catch (const GRBException& e) {
                return Solution::withStatus(SolutionStatus::Error,
                    force_name::concat("Gurobi error ", e.getErrorCode(), ": ", e.getMessage()));
            } catch (const std::invalid_argument& e) {
                return Solution::withStatus(SolutionStatus::Error,
                                            std::string("invalid model: ") + e.what());
            }
        }

    protected:
        /// @brief Configure the owned environment before it is started
        virtual void configureEnvironment(GRBEnv& env) {
            env.set(GRB_IntParam_OutputFlag, 0);
        }

    private:
        GRBEnv& environment() {
            if (external_env_) {
                return *external_env_;
            }
            if (!env_) {
                auto env = std::make_unique<GRBEnv>(true);  // defer license check
                configureEnvironment(*env);
                env->start();
                env_ = std::move(env);
            }
            return *env_;
        }

        static void applyOptions(GRBModel& grb, const SolveOptions& options) {
            grb.set(GRB_IntParam_OutputFlag, options.quiet ? 0 : 1);
            grb.set(GRB_DoubleParam_MIPGap, options.mipGap);
            if (options.timeLimitSeconds > 0.0) {
                grb.set(GRB_DoubleParam_TimeLimit, options.timeLimitSeconds);
            }
            if (options.threads > 0) {
                grb.set(GRB_IntParam_Threads, options.threads);
            }
        }

        static ColumnMap addVariables(GRBModel& grb, const Model& model) {
            ColumnMap columns;
            for (const auto& v : model.variables()) {
                GRBVar column = grb.addVar(0.0, GRB_INFINITY, 0.0, GRB_INTEGER, solverName(v.key));
                if (!columns.emplace(v.key, column).second) {
                    throw std::invalid_argument("gurobi: duplicate variable " + toString(v.key));
                }
            }
            return columns;
        }

        static GRBLinExpr toGurobi(const LinearExpression& expr, const ColumnMap& columns) {
            GRBLinExpr out = 0.0;
            for (const auto& t : expr) {
                auto it = columns.find(t.variable);
                if (it == columns.end()) {
                    throw std::invalid_argument(
                        "gurobi: expression references undeclared variable " + toString(t.variable));
                }
                out += t.coefficient * it->second;
            }
            return out;
        }

        static void addConstraints(GRBModel& grb, const Model& model, const ColumnMap& columns) {
            for (const auto& c : model.constraints()) {
                const std::string rowName = naming_enabled() ? c.name : std::string();
                switch (c.relation) {
                    case Relation::GreaterEqual:
                        grb.addConstr(toGurobi(c.lhs, columns), GRB_GREATER_EQUAL, c.bound, rowName);
                        break;
                }
            }
        }

        static void setObjective(GRBModel& grb, const Model& model, const ColumnMap& columns) {
            switch (model.objective().sense) {
                case Sense::Minimize:
                    grb.setObjective(toGurobi(model.objective().expression, columns), GRB_MINIMIZE);
                    break;
            }
        }

        static Solution translate(GRBModel& grb, int status, const ColumnMap& columns,
                                  const SolveCallback& callback) {
            switch (status) {
                case GRB_OPTIMAL: {
                    Assignment values;
                    for (const auto& [key, column] : columns) {
                        values.emplace(key, column.get(GRB_DoubleAttr_X));
                    }
                    return Solution::optimal(grb.get(GRB_DoubleAttr_ObjVal), std::move(values));
                }
                case GRB_INFEASIBLE:
                    return Solution::withStatus(SolutionStatus::Infeasible, "INFEASIBLE");
                case GRB_UNBOUNDED:
                    return Solution::withStatus(SolutionStatus::Unbounded, "UNBOUNDED");
                case GRB_INTERRUPTED:
                    if (callback.aborted()) {
                        return Solution::withStatus(SolutionStatus::Error,
                            force_name::concat("cancelled after ", callback.lastProgress().runtime,
                                               " s (", callback.lastProgress().solutionCount,
                                               " incumbents)"));
                    }
                    return Solution::withStatus(SolutionStatus::Error, "INTERRUPTED");
                case GRB_TIME_LIMIT:
                    return Solution::withStatus(SolutionStatus::Error,
                        force_name::concat("TIME_LIMIT reached, best bound ",
                                           callback.lastProgress().bestBound, ", gap ",
                                           callback.lastProgress().gap));
                default:
                    return Solution::withStatus(SolutionStatus::Error, gurobiStatusString(status));
            }
        }

        std::unique_ptr<GRBEnv> env_;
        GRBEnv* external_env_ = nullptr;
    };

} // namespace capplan
