#pragma once
/*
===============================================================================
VARIABLE KEYS — Shared naming contract between ModelBuilder and PlanDecoder
===============================================================================

OVERVIEW
--------
Every decision variable of a planning model belongs to one of three families:

    on_demand[p]       instances billed by the hour in period p
    reserved[k,p]      reserved instances of tier k running in period p
    reservation[k]     reservations of tier k purchased for the horizon

A VariableKey is a tagged variant over the three families. Keys compare by
family first, then by their ids, so they can index ordered maps directly;
there is no string encoding to collide or to parse back.

VariableLayout fixes which keys a model declares, and in which order:
period order and tier order are those of the request. ModelBuilder creates
the layout, stores it in the Model, and PlanDecoder reads the same value.

USAGE
-----
    VariableLayout layout(schedule, catalog);

    VariableKey x = layout.onDemand(0);            // on_demand[night]
    VariableKey y = layout.reserved(2, 0);         // reserved[heavy,night]
    std::cout << toString(y) << "\n";

    for (const auto& key : layout.keys()) { ... } // declaration order

===============================================================================
*/

#include <compare>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "enum_utils.h"
#include "naming.h"
#include "pricing.h"

namespace capplan {

    CAPPLAN_DECLARE_ENUM_WITH_COUNT(VarFamily, OnDemand, Reserved, Reservation);

    /// @brief Base name of a family, as used in rendered keys
    constexpr std::string_view familyName(VarFamily family) noexcept {
        switch (family) {
            case VarFamily::OnDemand:    return "on_demand";
            case VarFamily::Reserved:    return "reserved";
            case VarFamily::Reservation: return "reservation";
            case VarFamily::COUNT:       break;
        }
        return "unknown";
    }

    struct OnDemandKey {
        std::string period;
        auto operator<=>(const OnDemandKey&) const = default;
    };

    struct ReservedKey {
        std::string tier;
        std::string period;
        auto operator<=>(const ReservedKey&) const = default;
    };

    struct ReservationKey {
        std::string tier;
        auto operator<=>(const ReservationKey&) const = default;
    };

    /**
     * @brief Identity of one decision variable
     *
     * @note Alternative order matches VarFamily, so index() == family.
     */
    using VariableKey = std::variant<OnDemandKey, ReservedKey, ReservationKey>;

    inline VarFamily family(const VariableKey& key) noexcept {
        return enum_from_value<VarFamily>(key.index());
    }

    /// @brief "on_demand[p]", "reserved[k,p]" or "reservation[k]"
    inline std::string toString(const VariableKey& key) {
        struct Render {
            std::string operator()(const OnDemandKey& k) const {
                return force_name::math(familyName(VarFamily::OnDemand), k.period);
            }
            std::string operator()(const ReservedKey& k) const {
                return force_name::math(familyName(VarFamily::Reserved), k.tier, k.period);
            }
            std::string operator()(const ReservationKey& k) const {
                return force_name::math(familyName(VarFamily::Reservation), k.tier);
            }
        };
        return std::visit(Render{}, key);
    }

    /// @brief Solver-side column name; empty unless debug naming is enabled
    inline std::string solverName(const VariableKey& key) {
        if constexpr (!CAPPLAN_DEBUG_NAMES) {
            return {};
        } else {
            return toString(key);
        }
    }

    inline std::ostream& operator<<(std::ostream& os, const VariableKey& key) {
        return os << toString(key);
    }

    // =========================================================================
    // VARIABLE LAYOUT
    // =========================================================================

    /**
     * @brief Ordered period and tier ids a model is indexed by
     *
     * @details Index-based accessors return the key of the i-th period /
     *          k-th tier in request order. keys() lists every declared key
     *          family by family: on_demand per period, reserved per
     *          (tier, period), reservation per tier.
     */
    class VariableLayout {
    public:
        VariableLayout() = default;

        VariableLayout(std::vector<std::string> periodIds, std::vector<std::string> tierIds)
            : periods_(std::move(periodIds)), tiers_(std::move(tierIds))
        {
        }

        VariableLayout(const DemandSchedule& schedule, const PricingCatalog& catalog) {
            periods_.reserve(schedule.periods.size());
            for (const auto& p : schedule.periods) periods_.push_back(p.id);
            tiers_.reserve(catalog.tiers.size());
            for (const auto& t : catalog.tiers) tiers_.push_back(t.id);
        }

        const std::vector<std::string>& periods() const noexcept { return periods_; }
        const std::vector<std::string>& tiers() const noexcept { return tiers_; }

        std::size_t periodCount() const noexcept { return periods_.size(); }
        std::size_t tierCount() const noexcept { return tiers_.size(); }

        VariableKey onDemand(std::size_t p) const {
            return OnDemandKey{periods_.at(p)};
        }

        VariableKey reserved(std::size_t k, std::size_t p) const {
            return ReservedKey{tiers_.at(k), periods_.at(p)};
        }

        VariableKey reservation(std::size_t k) const {
            return ReservationKey{tiers_.at(k)};
        }

        /// @brief Number of variables the layout declares
        std::size_t size() const noexcept {
            return periods_.size() + tiers_.size() * periods_.size() + tiers_.size();
        }

        /// @brief Every declared key, family by family
        std::vector<VariableKey> keys() const {
            std::vector<VariableKey> out;
            out.reserve(size());
            for (std::size_t p = 0; p < periods_.size(); ++p) {
                out.push_back(onDemand(p));
            }
            for (std::size_t k = 0; k < tiers_.size(); ++k) {
                for (std::size_t p = 0; p < periods_.size(); ++p) {
                    out.push_back(reserved(k, p));
                }
            }
            for (std::size_t k = 0; k < tiers_.size(); ++k) {
                out.push_back(reservation(k));
            }
            return out;
        }

        bool operator==(const VariableLayout&) const = default;

    private:
        std::vector<std::string> periods_;
        std::vector<std::string> tiers_;
    };

} // namespace capplan
