#pragma once
/*
===============================================================================
PRICING & DEMAND — Plain input records for a planning request
===============================================================================

OVERVIEW
--------
PricingCatalog and DemandSchedule are immutable, per-request values. They do
not validate themselves; ModelBuilder validates them before any model is
built (see model_builder.h) and throws ConfigError on the first pass over
the data.

    DemandSchedule schedule{
        {{"night", 12.2, 8.0}, {"morning", 25.1, 8.0}, {"evening", 53.5, 8.0}}};

    PricingCatalog catalog{
        0.64,
        {{"light", 552.0, 0.312}, {"medium", 1280.0, 0.192}, {"heavy", 1560.0, 0.128}}};

UNITS
-----
• Demand is in capacity units (instances); fractional demand is allowed and
  met by whole instances.
• Durations are hours. Hourly costs are per instance-hour.
• Fixed costs are per commitment term (termDays, one year by default).
• The schedule repeats every horizonDays (one day by default); the fixed
  cost of one reservation is spread over termDays / horizonDays repetitions.
  Periods are expected to fit in the horizon; a schedule that spans more
  hours is still modeled as given (the Planner logs a warning).

===============================================================================
*/

#include <string>
#include <vector>

namespace capplan {

    inline constexpr double kHoursPerDay = 24.0;
    inline constexpr double kDefaultTermDays = 365.0;
    inline constexpr double kDefaultHorizonDays = 1.0;

    /// @brief Non-overlapping time window of the planning horizon
    struct Period {
        std::string id;
        double demand = 0.0;     ///< Required capacity (may be fractional)
        double hours = 0.0;      ///< Window length, strictly positive
    };

    /// @brief Prepaid commitment option
    struct PricingTier {
        std::string id;
        double fixedCost = 0.0;  ///< Upfront cost per commitment term
        double hourlyCost = 0.0; ///< Running cost per instance-hour
    };

    /**
     * @brief Time-windowed demand over one repetition of the planning horizon
     */
    struct DemandSchedule {
        std::vector<Period> periods;
        double horizonDays = kDefaultHorizonDays;

        /// @brief Sum of period durations in hours
        double totalHours() const {
            double total = 0.0;
            for (const auto& p : periods) total += p.hours;
            return total;
        }

        /// @brief Length of the horizon in hours
        double horizonHours() const { return horizonDays * kHoursPerDay; }
    };

    /**
     * @brief On-demand rate plus the commitment tiers that may be purchased
     *
     * @note An empty tier list is valid: the plan then runs on-demand only.
     */
    struct PricingCatalog {
        double onDemandRate = 0.0;
        std::vector<PricingTier> tiers;
        double termDays = kDefaultTermDays;
    };

    /**
     * @brief Repetitions of the planning horizon per commitment term
     *
     * @details A reservation's fixedCost is divided by this to obtain its
     *          cost for one horizon. 365 for the default day/year pairing.
     */
    inline double horizonCyclesPerTerm(const DemandSchedule& schedule,
                                       const PricingCatalog& catalog) {
        return catalog.termDays / schedule.horizonDays;
    }

} // namespace capplan
