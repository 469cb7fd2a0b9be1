#pragma once
/*
===============================================================================
ENUM UTILS — Enumerations with compile-time size for mpkit
===============================================================================

OVERVIEW
--------
Variable kinds, parameter keys, file formats and result statuses are all
closed enumerations whose size is needed at compile time: per-kind counters,
per-parameter value slots and iteration over every key. The macro below
declares such an enum together with its COUNT sentinel, and the helpers turn
that sentinel into fixed-size storage and iteration.

KEY COMPONENTS
--------------
• DECLARE_ENUM_WITH_COUNT : enum class plus trailing COUNT and Name_COUNT
• EnumArray<Enum, T>      : std::array<T, Name_COUNT>, value-semantic
• enum_index()            : enumerator to array slot
• enum_values<Enum>()     : every user enumerator, in declaration order
• is_valid_enum_value()   : bounds check against COUNT

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(VariableKind, BOOL, INT, REAL);

    EnumArray<VariableKind, int> counts{};
    ++counts[enum_index(VariableKind::INT)];

    for (auto kind : enum_values<VariableKind>())
        total += counts[enum_index(kind)];

===============================================================================
*/

#include <array>
#include <cstddef>

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel
 *
 * @details Expands to the enum class and a constant <Name>_COUNT equal to the
 *          number of user enumerators. Enumerators are sequential from 0.
 *
 * @warning Do not declare COUNT yourself; it is appended.
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    inline constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace mpkit {

    /// @brief Number of user enumerators of an enum declared with a COUNT sentinel
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /**
     * @brief Fixed-size array with one slot per enumerator
     *
     * @note Unlike a raw C array this is copyable and comparable, which the
     *       parameter store relies on for its equality.
     */
    template<typename Enum, typename T>
    using EnumArray = std::array<T, enum_size_v<Enum>>;

    /// @brief Array slot of an enumerator
    template<typename Enum>
    constexpr std::size_t enum_index(Enum value) noexcept
    {
        return static_cast<std::size_t>(value);
    }

    /// @brief True iff value is a user enumerator (COUNT excluded)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept
    {
        return enum_index(value) < enum_size_v<Enum>;
    }

    /// @brief All user enumerators in declaration order
    template<typename Enum>
    constexpr std::array<Enum, enum_size_v<Enum>> enum_values() noexcept
    {
        std::array<Enum, enum_size_v<Enum>> values{};
        for (std::size_t i = 0; i < values.size(); ++i)
            values[i] = static_cast<Enum>(i);
        return values;
    }

} // namespace mpkit
