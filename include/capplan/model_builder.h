#pragma once
/*
===============================================================================
MODEL BUILDER — DemandSchedule x PricingCatalog -> Model
===============================================================================

Overview
--------
ModelBuilder turns one planning request into a solver-neutral integer
program. It follows a fixed sequence of steps:

    build() {
        validate();             // ConfigError before anything is built
        layout      = VariableLayout(schedule, catalog);
        variables   = addVariables(layout);
        constraints = addConstraints(layout);
        objective   = addObjective(layout);
        return Model(layout, variables, objective, constraints);
    }

Every step is a const member function that returns an ordinary sequence; the
builder itself never changes after construction, so build() may be called
any number of times, from any thread, and always yields an equal Model.

Mathematical Model
------------------
Sets:
    P                       periods of the schedule
    K                       commitment tiers of the catalog

Parameters:
    demand[p], hours[p]     capacity required in p, length of p
    fixed[k], rate[k]       tier k's term cost and hourly running cost
    od                      on-demand hourly rate
    C = termDays / horizonDays   horizon repetitions per commitment term

Variables (all non-negative integer):
    on_demand[p]            on-demand instances running in p
    reserved[k,p]           reserved instances of tier k running in p
    reservation[k]          reservations of tier k purchased

Objective:
    min  sum_k (fixed[k] / C) * reservation[k]
       + sum_{k,p} rate[k] * hours[p] * reserved[k,p]
       + sum_p od * hours[p] * on_demand[p]

Constraints:
    Capacity[p]:      on_demand[p] + sum_k reserved[k,p] >= demand[p]
    Reservation[k,p]: reservation[k] - reserved[k,p]     >= 0

A reservation is a pool reused by every period, so it bounds the usage of
each period separately rather than the sum over periods.

Typical Usage
-------------
    ModelBuilder builder(schedule, catalog);
    Model model = builder.build();      // throws ConfigError on bad input

    Model same = buildModel(schedule, catalog);

Design Notes
------------
* The builder stores references; schedule and catalog must outlive it.
* Validation reports every problem it finds, not only the first one.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "expressions.h"
#include "model.h"
#include "naming.h"
#include "pricing.h"
#include "variable_key.h"

namespace capplan {

    // =========================================================================
    // INPUT VALIDATION
    // =========================================================================

    namespace builder_detail {

        inline bool finiteNonNegative(double v) {
            return std::isfinite(v) && v >= 0.0;
        }

        inline bool finitePositive(double v) {
            return std::isfinite(v) && v > 0.0;
        }

    } // namespace builder_detail

    /**
     * @brief Every reason the request cannot be modeled, in input order
     *
     * @return Empty when schedule and catalog are valid
     */
    inline std::vector<std::string> findInputProblems(const DemandSchedule& schedule,
                                                      const PricingCatalog& catalog) {
        using builder_detail::finiteNonNegative;
        using builder_detail::finitePositive;

        std::vector<std::string> problems;

        if (!finitePositive(schedule.horizonDays)) {
            problems.push_back(force_name::concat(
                "schedule: horizon_days must be finite and > 0, got ", schedule.horizonDays));
        }

        std::set<std::string> periodIds;
        for (const auto& p : schedule.periods) {
            const std::string label = force_name::math("period", p.id);
            if (p.id.empty()) {
                problems.push_back("period: id must not be empty");
            } else if (!periodIds.insert(p.id).second) {
                problems.push_back(force_name::concat(label, ": duplicate id"));
            }
            if (!finiteNonNegative(p.demand)) {
                problems.push_back(force_name::concat(
                    label, ": demand must be finite and >= 0, got ", p.demand));
            }
            if (!finitePositive(p.hours)) {
                problems.push_back(force_name::concat(
                    label, ": hours must be finite and > 0, got ", p.hours));
            }
        }

        if (!finiteNonNegative(catalog.onDemandRate)) {
            problems.push_back(force_name::concat(
                "catalog: on_demand_rate must be finite and >= 0, got ", catalog.onDemandRate));
        }
        if (!finitePositive(catalog.termDays)) {
            problems.push_back(force_name::concat(
                "catalog: term_days must be finite and > 0, got ", catalog.termDays));
        }

        std::set<std::string> tierIds;
        for (const auto& t : catalog.tiers) {
            const std::string label = force_name::math("tier", t.id);
            if (t.id.empty()) {
                problems.push_back("tier: id must not be empty");
            } else if (!tierIds.insert(t.id).second) {
                problems.push_back(force_name::concat(label, ": duplicate id"));
            }
            if (!finiteNonNegative(t.fixedCost)) {
                problems.push_back(force_name::concat(
                    label, ": fixed_cost must be finite and >= 0, got ", t.fixedCost));
            }
            if (!finiteNonNegative(t.hourlyCost)) {
                problems.push_back(force_name::concat(
                    label, ": hourly_cost must be finite and >= 0, got ", t.hourlyCost));
            }
        }

        return problems;
    }

    /**
     * @brief Throws ConfigError listing every problem, if there is any
     */
    inline void validateInputs(const DemandSchedule& schedule, const PricingCatalog& catalog) {
        auto problems = findInputProblems(schedule, catalog);
        if (!problems.empty()) {
            throw ConfigError(std::move(problems));
        }
    }

    // =========================================================================
    // MODEL BUILDER
    // =========================================================================

    class ModelBuilder {
    public:
        ModelBuilder(const DemandSchedule& schedule, const PricingCatalog& catalog)
            : schedule_(schedule), catalog_(catalog)
        {
        }

        /**
         * @brief Validate the inputs and assemble the Model
         * @throws ConfigError if schedule or catalog is malformed
         */
        Model build() const {
            validateInputs(schedule_, catalog_);

            VariableLayout layout(schedule_, catalog_);
            auto variables = addVariables(layout);
            auto constraints = addConstraints(layout);
            auto objective = addObjective(layout);

            return Model(std::move(layout), std::move(variables),
                         std::move(objective), std::move(constraints));
        }

    private:
        /// @brief One non-negative integer column per declared key
        std::vector<Variable> addVariables(const VariableLayout& layout) const {
            std::vector<Variable> vars;
            vars.reserve(layout.size());
            for (auto& key : layout.keys()) {
                vars.push_back(Variable{std::move(key)});
            }
            return vars;
        }

        std::vector<Constraint> addConstraints(const VariableLayout& layout) const {
            const auto P = indices(layout.periodCount());
            const auto K = indices(layout.tierCount());

            std::vector<Constraint> cons;
            cons.reserve(P.size() * (1 + K.size()));

            // Capacity[p]: on_demand[p] + sum_k reserved[k,p] >= demand[p]
            for (std::size_t p : P) {
                auto running = sum(K, [&](std::size_t k) { return layout.reserved(k, p); });
                cons.emplace_back(ConFamily::Capacity,
                    force_name::math(familyName(ConFamily::Capacity), layout.periods()[p]),
                    layout.onDemand(p) + running >= schedule_.periods[p].demand);
            }

            // Reservation[k,p]: reservation[k] - reserved[k,p] >= 0
            for (std::size_t k : K) {
                for (std::size_t p : P) {
                    cons.emplace_back(ConFamily::Reservation,
                        force_name::math(familyName(ConFamily::Reservation),
                                         layout.tiers()[k], layout.periods()[p]),
                        layout.reservation(k) - layout.reserved(k, p) >= 0.0);
                }
            }

            return cons;
        }

        Objective addObjective(const VariableLayout& layout) const {
            const auto P = indices(layout.periodCount());
            const auto K = indices(layout.tierCount());
            const double cycles = horizonCyclesPerTerm(schedule_, catalog_);

            const auto& periods = schedule_.periods;
            const auto& tiers = catalog_.tiers;

            LinearExpression cost;

            // amortized commitment cost
            cost += sum(K, [&](std::size_t k) {
                return (tiers[k].fixedCost / cycles) * layout.reservation(k);
            });

            // reserved running cost
            for (std::size_t k : K) {
                cost += sum(P, [&](std::size_t p) {
                    return (tiers[k].hourlyCost * periods[p].hours) * layout.reserved(k, p);
                });
            }

            // on-demand running cost
            cost += sum(P, [&](std::size_t p) {
                return (catalog_.onDemandRate * periods[p].hours) * layout.onDemand(p);
            });

            return Objective{Sense::Minimize, std::move(cost)};
        }

        const DemandSchedule& schedule_;
        const PricingCatalog& catalog_;
    };

    /// @brief ModelBuilder(schedule, catalog).build()
    inline Model buildModel(const DemandSchedule& schedule, const PricingCatalog& catalog) {
        return ModelBuilder(schedule, catalog).build();
    }

} // namespace capplan
