#pragma once
/*
===============================================================================
PLAN DECODER — Solution -> ProvisioningPlan
===============================================================================

OVERVIEW
--------
Relabels a solver's flat assignment into a structured plan, using the same
VariableLayout the Model was built from:

    for each period p:   onDemand      = value(on_demand[p])
                         reserved[k]   = value(reserved[k,p])   for each tier k
    for each tier k:     reservations  = value(reservation[k])
    totalCost           = objective value

Values are copied as the solver reported them: no rounding, no clamping.
Integer-valued columns may carry solver tolerance noise (e.g. 2.9999999997);
consumers that need whole counts round them themselves.

ERRORS
------
DecodeError is thrown when:
    * the solution is not Optimal, or lacks an objective value or assignment
    * a variable the layout declares is absent from the assignment

The last one means builder and decoder disagree on the variable layout: an
internal bug, not a condition a solver may legitimately produce.

Keys the layout does not declare are ignored (an adapter may add columns of
its own); they are reported at VLOG(1).

===============================================================================
*/

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"

#include "errors.h"
#include "expressions.h"
#include "model.h"
#include "solver.h"
#include "variable_key.h"

namespace capplan {

    /// @brief Allocation of one period
    struct PeriodAllocation {
        std::string period;
        double onDemand = 0.0;
        std::vector<double> reserved;  ///< Running count per tier, catalog order

        /// @brief onDemand + sum of reserved
        double capacity() const {
            double total = onDemand;
            for (double r : reserved) total += r;
            return total;
        }
    };

    /// @brief Reservations purchased for one tier
    struct TierReservation {
        std::string tier;
        double count = 0.0;
    };

    /**
     * @brief Decoded result of a planning request
     *
     * @details periods follow schedule order, reservations and each
     *          PeriodAllocation::reserved follow catalog order.
     */
    struct ProvisioningPlan {
        std::vector<PeriodAllocation> periods;
        std::vector<TierReservation> reservations;
        double totalCost = 0.0;

        std::vector<std::string> tierIds() const {
            std::vector<std::string> ids;
            ids.reserve(reservations.size());
            for (const auto& r : reservations) ids.push_back(r.tier);
            return ids;
        }
    };

    namespace decoder_detail {

        inline double lookup(const Assignment& values, const VariableKey& key) {
            auto it = values.find(key);
            if (it == values.end()) {
                throw DecodeError("decode: variable " + toString(key) + " missing from assignment");
            }
            return it->second;
        }

        /// @brief Number of assignment entries the layout does not declare
        inline std::size_t countUndeclared(const VariableLayout& layout, const Assignment& values) {
            if (values.size() == layout.size()) {
                return 0;  // every declared key was found, so equal sizes leave no room for extras
            }
            const auto declared = layout.keys();
            const std::set<VariableKey> known(declared.begin(), declared.end());
            std::size_t extra = 0;
            for (const auto& [key, value] : values) {
                if (!known.count(key)) {
                    VLOG(1) << "decode: ignoring undeclared variable " << toString(key) << " = " << value;
                    ++extra;
                }
            }
            return extra;
        }

    } // namespace decoder_detail

    /**
     * @brief Decode an Optimal solution against a layout
     * @throws DecodeError (see file header)
     */
    inline ProvisioningPlan decodePlan(const VariableLayout& layout, const Solution& solution) {
        if (solution.status != SolutionStatus::Optimal) {
            throw DecodeError("decode: solution status is " + statusString(solution.status)
                              + ", expected OPTIMAL");
        }
        if (!solution.objectiveValue) {
            throw DecodeError("decode: optimal solution has no objective value");
        }
        if (!solution.assignment) {
            throw DecodeError("decode: optimal solution has no assignment");
        }

        const Assignment& values = *solution.assignment;
        const std::size_t nP = layout.periodCount();
        const std::size_t nK = layout.tierCount();

        ProvisioningPlan plan;
        plan.totalCost = *solution.objectiveValue;

        plan.periods.reserve(nP);
        for (std::size_t p = 0; p < nP; ++p) {
            PeriodAllocation alloc;
            alloc.period = layout.periods()[p];
            alloc.onDemand = decoder_detail::lookup(values, layout.onDemand(p));
            alloc.reserved.reserve(nK);
            for (std::size_t k = 0; k < nK; ++k) {
                alloc.reserved.push_back(decoder_detail::lookup(values, layout.reserved(k, p)));
            }
            plan.periods.push_back(std::move(alloc));
        }

        plan.reservations.reserve(nK);
        for (std::size_t k = 0; k < nK; ++k) {
            plan.reservations.push_back(TierReservation{
                layout.tiers()[k], decoder_detail::lookup(values, layout.reservation(k))});
        }

        const std::size_t extra = decoder_detail::countUndeclared(layout, values);
        if (extra > 0) {
            VLOG(1) << "decode: " << extra << " undeclared variable(s) ignored";
        }
        return plan;
    }

    /// @brief decodePlan(model.layout(), solution)
    inline ProvisioningPlan decodePlan(const Model& model, const Solution& solution) {
        return decodePlan(model.layout(), solution);
    }

} // namespace capplan
