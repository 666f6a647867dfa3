#pragma once
/*
===============================================================================
REPORT — Text and JSON renderings of a planning result
===============================================================================

OVERVIEW
--------
The text report is for people; its layout is not a contract:

    Status:      PLANNED
    Total cost:  289.92

    Reservations
      light           28
      medium           0
      heavy           26

    Period          on_demand     light    medium     heavy
    ------------------------------------------------------
    night                   0         0         0        13
    ...

The JSON rendering is for programs:

    { "status": "PLANNED", "total_cost": 289.916...,
      "reservations": { "light": 28, "medium": 0, "heavy": 26 },
      "periods": [ { "id": "night", "on_demand": 0,
                     "reserved": { "light": 0, "medium": 0, "heavy": 13 } }, ... ] }

Counts are printed as the solver returned them (see plan_decoder.h); the
text report uses 6 significant digits, which hides integrality noise.

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "diagnostics.h"
#include "plan_decoder.h"
#include "planner.h"

namespace capplan {

    inline nlohmann::json planToJson(const ProvisioningPlan& plan) {
        nlohmann::json out;
        out["total_cost"] = plan.totalCost;

        nlohmann::json reservations = nlohmann::json::object();
        for (const auto& r : plan.reservations) {
            reservations[r.tier] = r.count;
        }
        out["reservations"] = std::move(reservations);

        nlohmann::json periods = nlohmann::json::array();
        for (const auto& alloc : plan.periods) {
            nlohmann::json reserved = nlohmann::json::object();
            for (std::size_t k = 0; k < alloc.reserved.size(); ++k) {
                reserved[plan.reservations.at(k).tier] = alloc.reserved[k];
            }
            periods.push_back(nlohmann::json{
                {"id", alloc.period},
                {"on_demand", alloc.onDemand},
                {"reserved", std::move(reserved)}});
        }
        out["periods"] = std::move(periods);
        return out;
    }

    inline nlohmann::json resultToJson(const PlanResult& result) {
        nlohmann::json out;
        if (result.plan) {
            out = planToJson(*result.plan);
        }
        out["status"] = statusString(result.status);
        if (!result.message.empty()) {
            out["message"] = result.message;
        }
        if (!result.problems.empty()) {
            out["problems"] = result.problems;
        }
        return out;
    }

    inline std::string renderReport(const PlanResult& result) {
        std::ostringstream os;
        os << "Status:      " << statusString(result.status) << "\n";

        if (!result.plan) {
            if (!result.message.empty()) {
                os << "Message:     " << result.message << "\n";
            }
            return os.str();
        }

        const ProvisioningPlan& plan = *result.plan;
        os << "Total cost:  " << std::fixed << std::setprecision(2) << plan.totalCost << "\n";
        os.unsetf(std::ios::floatfield);
        os << std::setprecision(6);

        std::size_t width = 10;
        for (const auto& r : plan.reservations) width = std::max(width, r.tier.size() + 2);
        std::size_t label = 16;
        for (const auto& a : plan.periods) label = std::max(label, a.period.size() + 2);

        if (!plan.reservations.empty()) {
            os << "\nReservations\n";
            for (const auto& r : plan.reservations) {
                os << "  " << std::left << std::setw(static_cast<int>(label - 2)) << r.tier
                   << std::right << std::setw(static_cast<int>(width)) << r.count << "\n";
            }
        }

        os << "\n" << std::left << std::setw(static_cast<int>(label)) << "Period"
           << std::right << std::setw(static_cast<int>(width)) << "on_demand";
        for (const auto& r : plan.reservations) {
            os << std::setw(static_cast<int>(width)) << r.tier;
        }
        os << "\n" << std::string(label + width * (1 + plan.reservations.size()), '-') << "\n";

        for (const auto& alloc : plan.periods) {
            os << std::left << std::setw(static_cast<int>(label)) << alloc.period
               << std::right << std::setw(static_cast<int>(width)) << alloc.onDemand;
            for (double r : alloc.reserved) {
                os << std::setw(static_cast<int>(width)) << r;
            }
            os << "\n";
        }
        return os.str();
    }

    /// @brief Per-tier commitment and usage cost lines
    inline std::string renderCostBreakdown(const CostBreakdown& cost) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(2);
        os << std::left << std::setw(16) << "Cost" << std::right
           << std::setw(12) << "commitment" << std::setw(12) << "usage" << "\n";
        for (const auto& t : cost.tiers) {
            os << std::left << std::setw(16) << t.tier << std::right
               << std::setw(12) << t.commitment << std::setw(12) << t.usage << "\n";
        }
        os << std::left << std::setw(16) << "on_demand" << std::right
           << std::setw(12) << 0.0 << std::setw(12) << cost.onDemand << "\n";
        os << std::left << std::setw(16) << "total" << std::right
           << std::setw(24) << cost.total() << "\n";
        return os.str();
    }

} // namespace capplan
