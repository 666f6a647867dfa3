#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration helpers for capplan
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a trailing COUNT sentinel so that
per-family tables (variable families, constraint families, status names) can
be sized and iterated at compile time without hand-maintained counts.

KEY COMPONENTS
--------------
• CAPPLAN_DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• EnumArray<Enum, T>: std::array indexed by an enumeration
• enum_size, is_valid_enum_value, enum_from_value, enum_index
• for_each_enum: visit every enumerator in declaration order

USAGE EXAMPLES
--------------
    CAPPLAN_DECLARE_ENUM_WITH_COUNT(Family, OnDemand, Reserved, Reservation);

    EnumArray<Family, std::size_t> counts{};
    counts[enum_index(Family::Reserved)] += 1;

    for_each_enum<Family>([&](Family f) { report(f, counts[enum_index(f)]); });

THREAD SAFETY
-------------
• Everything here is constexpr or stateless

===============================================================================
*/

#include <array>
#include <cstddef>
#include <utility>

/**
 * @macro CAPPLAN_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with an automatic COUNT sentinel
 *
 * @param Name The name of the enumeration type
 * @param ...  Enumerator identifiers (at least one)
 *
 * @details
 * Expands to `enum class Name { ..., COUNT }` and a constexpr
 * `Name##_COUNT` equal to the number of user enumerators.
 *
 * @warning Do not define COUNT yourself; values are sequential from 0.
 */
#define CAPPLAN_DECLARE_ENUM_WITH_COUNT(Name, ...)                        \
    enum class Name { __VA_ARGS__, COUNT };                               \
    inline constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace capplan {

/**
 * @brief Fixed-size array with one slot per enumerator
 */
template<typename Enum, typename T>
using EnumArray = std::array<T, static_cast<std::size_t>(Enum::COUNT)>;

/**
 * @brief Number of meaningful enumerators (COUNT excluded)
 */
template<typename Enum>
struct enum_size {
    static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
};

/**
 * @brief True if value names a user enumerator (not COUNT, not out of range)
 */
template<typename Enum>
constexpr bool is_valid_enum_value(Enum value) noexcept {
    return static_cast<std::size_t>(value) < static_cast<std::size_t>(Enum::COUNT);
}

/// @brief Array slot of an enumerator
template<typename Enum>
constexpr std::size_t enum_index(Enum value) noexcept {
    return static_cast<std::size_t>(value);
}

/**
 * @brief Convert an integral value to the enumeration
 *
 * @pre value < enum_size<Enum>::value; combine with is_valid_enum_value
 *      for untrusted input.
 */
template<typename Enum>
constexpr Enum enum_from_value(std::size_t value) noexcept {
    return static_cast<Enum>(value);
}

/**
 * @brief Invoke fn once per enumerator, in declaration order
 */
template<typename Enum, typename Fn>
constexpr void for_each_enum(Fn&& fn) {
    for (std::size_t i = 0; i < enum_size<Enum>::value; ++i) {
        fn(enum_from_value<Enum>(i));
    }
}

} // namespace capplan
