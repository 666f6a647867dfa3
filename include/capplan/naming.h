#pragma once
/*
===============================================================================
NAMING — Symbolic names for model elements
===============================================================================

OVERVIEW
--------
Renders model elements (variables, constraints) as text. Two flavours:

• make_name::   Debug-aware. Returns an empty string unless CAPPLAN_DEBUG or
                _DEBUG is defined. Used for names pushed into the solver,
                where release builds should pay nothing.
• force_name::  Always produces the name. Used for reports, diagnostics,
                logs and constraint labels in the solver-neutral Model.

Conventions
-----------
    math("reserved", "heavy", "night")   ->  "reserved[heavy,night]"
    index("reserved", "heavy", "night")  ->  "reserved_heavy_night"
    concat("cap:", 3, "/", 4)            ->  "cap:3/4"

Ids are period and tier identifiers taken verbatim from the request; they
are not escaped, so these names are for humans and the solver's LP export,
never for lookup. Lookup goes through VariableKey (variable_key.h).

THREAD SAFETY
-------------
• No shared state; all functions may be called concurrently

EXCEPTION SAFETY
----------------
• Throws std::invalid_argument on an empty base name with parts present

===============================================================================
*/

#include <concepts>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#if defined(CAPPLAN_DEBUG) || defined(_DEBUG)
inline constexpr bool CAPPLAN_DEBUG_NAMES = true;
#else
inline constexpr bool CAPPLAN_DEBUG_NAMES = false;
#endif

namespace capplan {

    /// @brief True when solver-side symbolic names are enabled at build time
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return CAPPLAN_DEBUG_NAMES;
    }

    namespace naming_detail {

        template<typename T>
        concept Streamable = requires(std::ostream & os, T && value) {
            { os << std::forward<T>(value) } -> std::same_as<std::ostream&>;
        };

        template<typename T>
        concept NamePart = std::convertible_to<const T&, std::string_view>;

        inline void check_base_name(std::string_view base, bool has_parts) {
            if (has_parts && base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when indices are present");
            }
        }

        template<Streamable... Args>
        inline std::string concat_impl(Args&&... parts) {
            std::ostringstream oss;
            ((oss << std::forward<Args>(parts)), ...);
            return oss.str();
        }

        template<NamePart... Parts>
        inline std::string math_impl(std::string_view base, const Parts&... parts) {
            constexpr std::size_t N = sizeof...(parts);
            check_base_name(base, N > 0);

            std::string result(base);
            if constexpr (N > 0) {
                result.append("[");
                bool first = true;
                ((result.append(first ? (first = false, "") : ",")
                    .append(std::string_view(parts))), ...);
                result.append("]");
            }
            return result;
        }

        template<NamePart... Parts>
        inline std::string index_impl(std::string_view base, const Parts&... parts) {
            constexpr std::size_t N = sizeof...(parts);
            check_base_name(base, N > 0);

            std::string result(base);
            ((result.append("_").append(std::string_view(parts))), ...);
            return result;
        }

    } // namespace naming_detail

    // ------------------------------------------------------------------------
    // Always-on naming
    // ------------------------------------------------------------------------
    namespace force_name {

        template<naming_detail::Streamable... Args>
        inline std::string concat(Args&&... parts) {
            return naming_detail::concat_impl(std::forward<Args>(parts)...);
        }

        template<naming_detail::NamePart... Parts>
        inline std::string math(std::string_view base, const Parts&... parts) {
            return naming_detail::math_impl(base, parts...);
        }

        template<naming_detail::NamePart... Parts>
        inline std::string index(std::string_view base, const Parts&... parts) {
            return naming_detail::index_impl(base, parts...);
        }

    } // namespace force_name

    // ------------------------------------------------------------------------
    // Debug-only naming (empty string in release builds)
    // ------------------------------------------------------------------------
    namespace make_name {

        template<naming_detail::Streamable... Args>
        inline std::string concat(Args&&... parts) {
            if constexpr (!CAPPLAN_DEBUG_NAMES) {
                return {};
            } else {
                return naming_detail::concat_impl(std::forward<Args>(parts)...);
            }
        }

        template<naming_detail::NamePart... Parts>
        inline std::string math(std::string_view base, const Parts&... parts) {
            if constexpr (!CAPPLAN_DEBUG_NAMES) {
                return {};
            } else {
                return naming_detail::math_impl(base, parts...);
            }
        }

        template<naming_detail::NamePart... Parts>
        inline std::string index(std::string_view base, const Parts&... parts) {
            if constexpr (!CAPPLAN_DEBUG_NAMES) {
                return {};
            } else {
                return naming_detail::index_impl(base, parts...);
            }
        }

    } // namespace make_name

} // namespace capplan
