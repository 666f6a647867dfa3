#pragma once
/*
===============================================================================
MODEL — Immutable, solver-neutral integer program
===============================================================================

OVERVIEW
--------
A Model is what ModelBuilder produces and what every SolverAdapter consumes:

    direction    minimize
    objective    LinearExpression over VariableKeys
    constraints  (family, name, LinearExpression, >=, bound)
    variables    VariableKeys, all non-negative integer

plus the VariableLayout the keys were drawn from, which PlanDecoder uses to
relabel a flat assignment. A Model has no setters; once built it may be
handed to another thread and solved there.

CONSTRAINT FAMILIES
-------------------
    Capacity      on_demand[p] + sum_k reserved[k,p] >= demand[p]
    Reservation   reservation[k] - reserved[k,p]     >= 0

===============================================================================
*/

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "expressions.h"
#include "variable_key.h"

namespace capplan {

    CAPPLAN_DECLARE_ENUM_WITH_COUNT(ConFamily, Capacity, Reservation);

    enum class Relation { GreaterEqual };
    enum class Sense { Minimize };

    constexpr std::string_view familyName(ConFamily family) noexcept {
        switch (family) {
            case ConFamily::Capacity:    return "capacity";
            case ConFamily::Reservation: return "reservation_bound";
            case ConFamily::COUNT:       break;
        }
        return "unknown";
    }

    /// @brief One decision variable; every variable is a non-negative integer
    struct Variable {
        VariableKey key;
    };

    struct Constraint {
        ConFamily family = ConFamily::Capacity;
        std::string name;
        LinearExpression lhs;
        Relation relation = Relation::GreaterEqual;
        double bound = 0.0;

        Constraint() = default;

        Constraint(ConFamily f, std::string n, Inequality ineq)
            : family(f), name(std::move(n)), lhs(std::move(ineq.lhs)), bound(ineq.bound)
        {
        }

        /// @brief lhs - bound under an assignment (negative means violated)
        double slack(const Assignment& values) const {
            return lhs.evaluate(values) - bound;
        }

        bool satisfiedBy(const Assignment& values, double tolerance = 1e-6) const {
            return slack(values) >= -tolerance;
        }
    };

    struct Objective {
        Sense sense = Sense::Minimize;
        LinearExpression expression;
    };

    /**
     * @brief Immutable bundle of layout, variables, objective and constraints
     */
    class Model {
    public:
        Model() = default;

        Model(VariableLayout layout,
              std::vector<Variable> variables,
              Objective objective,
              std::vector<Constraint> constraints)
            : layout_(std::move(layout)),
              variables_(std::move(variables)),
              objective_(std::move(objective)),
              constraints_(std::move(constraints))
        {
        }

        const VariableLayout& layout() const noexcept { return layout_; }
        const std::vector<Variable>& variables() const noexcept { return variables_; }
        const Objective& objective() const noexcept { return objective_; }
        const std::vector<Constraint>& constraints() const noexcept { return constraints_; }

        std::size_t variableCount() const noexcept { return variables_.size(); }
        std::size_t constraintCount() const noexcept { return constraints_.size(); }

        /// @brief Constraints of one family, in model order
        std::vector<const Constraint*> constraints(ConFamily family) const {
            std::vector<const Constraint*> out;
            for (const auto& c : constraints_) {
                if (c.family == family) out.push_back(&c);
            }
            return out;
        }

    private:
        VariableLayout layout_;
        std::vector<Variable> variables_;
        Objective objective_;
        std::vector<Constraint> constraints_;
    };

} // namespace capplan
