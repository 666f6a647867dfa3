#pragma once
/*
===============================================================================
DIAGNOSTICS — Model statistics, cost evaluation and plan verification
===============================================================================

Overview
--------
Free functions for looking at models and plans after the fact:

    * Model statistics (variables and constraints per family, non-zeros)
    * Solution quality against a Model (constraint / bound / integrality)
    * Cost breakdown of a plan recomputed from pricing data
    * Plan verification against the schedule (capacity, reservation pool)

None of these are needed to produce a plan; the Planner uses them for its
log lines and tests use them to check invariants of solver output.

Typical Usage
-------------
    Model model = buildModel(schedule, catalog);
    LOG(INFO) << modelSummary(model);
    // "15 vars (3 on_demand, 9 reserved, 3 reservation), 12 constrs, 30 nz"

    ProvisioningPlan plan = decodePlan(model, solution);
    auto quality = verifyPlan(plan, schedule);
    if (!quality.feasible()) { ... }

    auto cost = evaluateCost(plan, schedule, catalog);
    // cost.total() == plan.totalCost up to solver tolerance

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "enum_utils.h"
#include "expressions.h"
#include "model.h"
#include "naming.h"
#include "plan_decoder.h"
#include "pricing.h"
#include "variable_key.h"

namespace capplan {

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    std::size_t numVars = 0;
    std::size_t numConstrs = 0;
    std::size_t numObjectiveTerms = 0;
    std::size_t numNonZeros = 0;                   ///< Constraint matrix terms
    EnumArray<VarFamily, std::size_t> varsByFamily{};
    EnumArray<ConFamily, std::size_t> constrsByFamily{};
};

inline ModelStatistics computeStatistics(const Model& model) {
    ModelStatistics stats;
    stats.numVars = model.variableCount();
    stats.numConstrs = model.constraintCount();
    stats.numObjectiveTerms = model.objective().expression.size();

    for (const auto& v : model.variables()) {
        stats.varsByFamily[enum_index(family(v.key))] += 1;
    }
    for (const auto& c : model.constraints()) {
        stats.constrsByFamily[enum_index(c.family)] += 1;
        stats.numNonZeros += c.lhs.size();
    }
    return stats;
}

/**
 * @brief One-line model description for logs
 */
inline std::string modelSummary(const Model& model) {
    const auto stats = computeStatistics(model);

    std::string families;
    for_each_enum<VarFamily>([&](VarFamily f) {
        if (!families.empty()) families += ", ";
        families += force_name::concat(stats.varsByFamily[enum_index(f)], " ", familyName(f));
    });

    return force_name::concat(stats.numVars, " vars (", families, "), ",
                              stats.numConstrs, " constrs, ",
                              stats.numNonZeros, " nz");
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

/**
 * @brief Worst violations of an assignment against a Model
 *
 * @note Missing keys count as zero-valued.
 */
struct SolutionQuality {
    double maxConstrViolation = 0.0;   ///< max(bound - lhs, 0) over rows
    double maxBoundViolation = 0.0;    ///< max(-value, 0) over columns
    double maxIntViolation = 0.0;      ///< distance to nearest integer
    std::string worstConstraint;       ///< Name of the most violated row

    bool feasible(double tolerance = 1e-6) const noexcept {
        return maxConstrViolation <= tolerance
            && maxBoundViolation <= tolerance
            && maxIntViolation <= tolerance;
    }
};

inline SolutionQuality computeSolutionQuality(const Model& model, const Assignment& values) {
    auto valueOf = [&](const VariableKey& key) {
        auto it = values.find(key);
        return it == values.end() ? 0.0 : it->second;
    };

    SolutionQuality quality;
    for (const auto& v : model.variables()) {
        const double x = valueOf(v.key);
        quality.maxBoundViolation = std::max(quality.maxBoundViolation, -x);
        quality.maxIntViolation = std::max(quality.maxIntViolation,
                                           std::abs(x - std::round(x)));
    }
    for (const auto& c : model.constraints()) {
        double lhs = 0.0;
        for (const auto& t : c.lhs) lhs += t.coefficient * valueOf(t.variable);
        const double violation = c.bound - lhs;
        if (violation > quality.maxConstrViolation) {
            quality.maxConstrViolation = violation;
            quality.worstConstraint = c.name;
        }
    }
    return quality;
}

// =============================================================================
// COST EVALUATION
// =============================================================================

struct TierCost {
    std::string tier;
    double commitment = 0.0;   ///< Amortized fixed cost for one horizon
    double usage = 0.0;        ///< Hourly cost of reserved running instances
};

struct CostBreakdown {
    std::vector<TierCost> tiers;
    double onDemand = 0.0;

    double total() const {
        double sum = onDemand;
        for (const auto& t : tiers) sum += t.commitment + t.usage;
        return sum;
    }
};

/**
 * @brief Recompute a plan's cost for one horizon from the pricing data
 *
 * @pre plan was decoded from a model of this schedule and catalog
 *      (same period and tier order)
 */
inline CostBreakdown evaluateCost(const ProvisioningPlan& plan,
                                  const DemandSchedule& schedule,
                                  const PricingCatalog& catalog) {
    const double cycles = horizonCyclesPerTerm(schedule, catalog);

    CostBreakdown cost;
    cost.tiers.reserve(catalog.tiers.size());
    for (std::size_t k = 0; k < catalog.tiers.size(); ++k) {
        TierCost tc;
        tc.tier = catalog.tiers[k].id;
        tc.commitment = catalog.tiers[k].fixedCost / cycles * plan.reservations.at(k).count;
        cost.tiers.push_back(tc);
    }

    for (std::size_t p = 0; p < schedule.periods.size(); ++p) {
        const auto& alloc = plan.periods.at(p);
        const double hours = schedule.periods[p].hours;
        cost.onDemand += catalog.onDemandRate * hours * alloc.onDemand;
        for (std::size_t k = 0; k < catalog.tiers.size(); ++k) {
            cost.tiers[k].usage += catalog.tiers[k].hourlyCost * hours * alloc.reserved.at(k);
        }
    }
    return cost;
}

// =============================================================================
// PLAN VERIFICATION
// =============================================================================

/**
 * @brief Worst invariant violations of a decoded plan
 */
struct PlanQuality {
    double maxCapacityShortfall = 0.0;   ///< max(demand - capacity, 0) over periods
    double maxReservationExcess = 0.0;   ///< max(reserved - reservations, 0)
    double maxIntViolation = 0.0;
    double maxNegative = 0.0;            ///< max(-count, 0) over all counts

    bool feasible(double tolerance = 1e-6) const noexcept {
        return maxCapacityShortfall <= tolerance
            && maxReservationExcess <= tolerance
            && maxIntViolation <= tolerance
            && maxNegative <= tolerance;
    }
};

inline PlanQuality verifyPlan(const ProvisioningPlan& plan, const DemandSchedule& schedule) {
    PlanQuality q;
    auto count = [&q](double v) {
        q.maxNegative = std::max(q.maxNegative, -v);
        q.maxIntViolation = std::max(q.maxIntViolation, std::abs(v - std::round(v)));
    };

    for (const auto& r : plan.reservations) count(r.count);

    for (std::size_t p = 0; p < plan.periods.size(); ++p) {
        const auto& alloc = plan.periods[p];
        count(alloc.onDemand);
        q.maxCapacityShortfall = std::max(q.maxCapacityShortfall,
                                          schedule.periods.at(p).demand - alloc.capacity());
        for (std::size_t k = 0; k < alloc.reserved.size(); ++k) {
            count(alloc.reserved[k]);
            q.maxReservationExcess = std::max(q.maxReservationExcess,
                                              alloc.reserved[k] - plan.reservations.at(k).count);
        }
    }
    return q;
}

} // namespace capplan
