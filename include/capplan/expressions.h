#pragma once
/*
===============================================================================
EXPRESSIONS — Solver-neutral linear expressions over VariableKeys
===============================================================================

OVERVIEW
--------
A LinearExpression is an ordered list of (coefficient, VariableKey) terms.
It is semantically a sum: term order never changes its meaning, only the
order in which a solver adapter sees columns. Duplicate keys are kept as
separate terms; consumers that need one coefficient per key call
coefficients().

The operators mirror the mathematical notation used in model_builder.h:

    Term t = 2.5 * layout.onDemand(p);                  // coefficient * key
    LinearExpression e = layout.reservation(k) - layout.reserved(k, p);
    Inequality cap = sum(tiers, [&](std::size_t k) {
        return 1.0 * layout.reserved(k, p);
    }) + layout.onDemand(p) >= demand;

KEY COMPONENTS
--------------
• Term              (coefficient, key) pair
• LinearExpression  Term sequence with evaluate() against an Assignment
• Inequality        lhs >= bound, produced by operator>=
• sum(range, f)     Accumulates f(i) for every i in range

THREAD SAFETY
-------------
• Value types; no shared state

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <map>
#include <utility>
#include <vector>

#include "variable_key.h"

namespace capplan {

    /// @brief Variable values of a solution, one entry per key
    using Assignment = std::map<VariableKey, double>;

    struct Term {
        double coefficient = 0.0;
        VariableKey variable;
    };

    /**
     * @brief Sum of coefficient * variable terms
     */
    class LinearExpression {
    public:
        using const_iterator = std::vector<Term>::const_iterator;

        LinearExpression() = default;

        LinearExpression(Term t) { terms_.push_back(std::move(t)); }

        LinearExpression(VariableKey key) { terms_.push_back(Term{1.0, std::move(key)}); }

        LinearExpression& add(double coefficient, VariableKey key) {
            terms_.push_back(Term{coefficient, std::move(key)});
            return *this;
        }

        LinearExpression& operator+=(Term t) {
            terms_.push_back(std::move(t));
            return *this;
        }

        LinearExpression& operator+=(const LinearExpression& other) {
            terms_.insert(terms_.end(), other.terms_.begin(), other.terms_.end());
            return *this;
        }

        LinearExpression& operator-=(const LinearExpression& other) {
            terms_.reserve(terms_.size() + other.terms_.size());
            for (const auto& t : other.terms_) {
                terms_.push_back(Term{-t.coefficient, t.variable});
            }
            return *this;
        }

        const std::vector<Term>& terms() const noexcept { return terms_; }
        std::size_t size() const noexcept { return terms_.size(); }
        bool empty() const noexcept { return terms_.empty(); }

        const_iterator begin() const noexcept { return terms_.begin(); }
        const_iterator end() const noexcept { return terms_.end(); }

        /**
         * @brief Value of the expression under an assignment
         * @throws std::out_of_range if a term's key has no value
         */
        double evaluate(const Assignment& values) const {
            double total = 0.0;
            for (const auto& t : terms_) {
                total += t.coefficient * values.at(t.variable);
            }
            return total;
        }

        /// @brief Coefficient per key, merging duplicate terms
        std::map<VariableKey, double> coefficients() const {
            std::map<VariableKey, double> merged;
            for (const auto& t : terms_) merged[t.variable] += t.coefficient;
            return merged;
        }

    private:
        std::vector<Term> terms_;
    };

    /// @brief lhs >= bound, before it is given a family and a name
    struct Inequality {
        LinearExpression lhs;
        double bound = 0.0;
    };

    // ========================================================================
    // OPERATORS
    // ========================================================================

    inline Term operator*(double coefficient, VariableKey key) {
        return Term{coefficient, std::move(key)};
    }

    inline LinearExpression operator+(LinearExpression lhs, const LinearExpression& rhs) {
        lhs += rhs;
        return lhs;
    }

    inline LinearExpression operator-(LinearExpression lhs, const LinearExpression& rhs) {
        lhs -= rhs;
        return lhs;
    }

    inline Inequality operator>=(LinearExpression lhs, double bound) {
        return Inequality{std::move(lhs), bound};
    }

    // ========================================================================
    // SUM
    // ========================================================================

    /**
     * @brief Builds a LinearExpression by summing func(i) over a range
     *
     * @tparam Range Anything iterable
     * @tparam Func  Callable returning a Term, VariableKey or LinearExpression
     *
     * @example
     *     auto usage = sum(periodIndices, [&](std::size_t p) {
     *         return hours[p] * layout.reserved(k, p);
     *     });
     */
    template<typename Range, typename Func>
    LinearExpression sum(const Range& rng, Func&& func) {
        LinearExpression expr;
        for (const auto& idx : rng) {
            expr += LinearExpression(std::invoke(func, idx));
        }
        return expr;
    }

    /// @brief Half-open index range [0, n) for use with sum()
    inline std::vector<std::size_t> indices(std::size_t n) {
        std::vector<std::size_t> out(n);
        for (std::size_t i = 0; i < n; ++i) out[i] = i;
        return out;
    }

} // namespace capplan
