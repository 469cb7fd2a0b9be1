#pragma once
/*
===============================================================================
VARIABLES — Decision variables, their domains, bounds and derived kinds
===============================================================================

OVERVIEW
--------
A Variable is an immutable value identified by a structural description (see
naming.h) and typed by a domain and an interval of admissible values:

    Variable x = Variable::of("x", VariableDomain::INTEGER, Bounds::atLeast(0));
    Variable y = Variable::of("y", VariableDomain::REAL, Bounds::all(), 3, "a");
    // y.description() == "y[3,a]"

The kind of a variable is derived, never stored:

    BOOL  iff domain == INTEGER and bounds == [0,1] exactly
    INT   iff domain == INTEGER otherwise
    REAL  iff domain == REAL

The domain is checked first: a REAL variable over [0,1] is REAL, not BOOL.
Engine adapters rely on this to pick the native variable type.

KEY COMPONENTS
--------------
• VariableDomain : INTEGER, REAL
• VariableKind   : BOOL, INT, REAL
• Bounds         : closed at finite endpoints, open at infinite ones
• kindOf()       : the derivation rule above
• Variable       : immutable value; usable as an unordered container key

EQUALITY
--------
Two variables are equal iff their descriptions, kinds and bounds are equal.
Descriptions are expected to be unique within one problem; the problem
builder enforces it (see mp.h).

EXCEPTION SAFETY
----------------
• Bounds and Variable factories throw InvalidArgument on:
    - NaN endpoints, lower > upper, lower == +inf, upper == -inf
    - finite endpoints equal in magnitude to the reserved huge value
    - an INTEGER domain whose interval contains no integer
• All accessors are noexcept.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <functional>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "errors.h"
#include "naming.h"

namespace mpkit {

    // ========================================================================
    // DOMAIN AND KIND
    // ========================================================================

    DECLARE_ENUM_WITH_COUNT(VariableDomain, INTEGER, REAL);
    DECLARE_ENUM_WITH_COUNT(VariableKind, BOOL, INT, REAL);

    inline std::string toString(VariableDomain domain)
    {
        switch (domain) {
            case VariableDomain::INTEGER: return "INTEGER";
            case VariableDomain::REAL:    return "REAL";
            case VariableDomain::COUNT:   break;
        }
        return "UNKNOWN";
    }

    inline std::string toString(VariableKind kind)
    {
        switch (kind) {
            case VariableKind::BOOL:  return "BOOL";
            case VariableKind::INT:   return "INT";
            case VariableKind::REAL:  return "REAL";
            case VariableKind::COUNT: break;
        }
        return "UNKNOWN";
    }

    /// @brief True for the kinds that require integral values
    constexpr bool isInteger(VariableKind kind) noexcept
    {
        return kind == VariableKind::BOOL || kind == VariableKind::INT;
    }

    /**
     * @brief Finite value reserved by engines to encode an infinite bound
     *
     * @note Endpoints equal in magnitude to this value are rejected so that an
     *       explicit "huge" bound can never be mistaken for an absent one.
     */
    inline constexpr double kHuge = std::numeric_limits<double>::max();

    inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

    // ========================================================================
    // BOUNDS
    // ========================================================================

    /**
     * @class Bounds
     * @brief Interval of admissible values, closed at finite endpoints
     *
     * @details -inf as lower (resp. +inf as upper) means unbounded below
     *          (resp. above). Negative zero endpoints are stored as zero.
     */
    class Bounds {
        double lower_ = -kInfinity;
        double upper_ = kInfinity;

        Bounds(double lower, double upper) noexcept
            : lower_(lower == 0.0 ? 0.0 : lower),
              upper_(upper == 0.0 ? 0.0 : upper)
        {
        }

        static void checkEndpoint(double value, const char* which)
        {
            if (std::isnan(value))
                throw InvalidArgument(std::format("bounds: {} endpoint is NaN", which));
            if (std::isfinite(value) && std::fabs(value) == kHuge)
                throw InvalidArgument(std::format(
                    "bounds: {} endpoint {} equals the reserved huge value; use an infinite bound instead",
                    which, value));
        }

    public:
        /**
         * @brief Interval [lower, upper] with infinite endpoints treated as open
         *
         * @throws InvalidArgument on NaN, huge sentinel, reversed or empty interval
         */
        static Bounds of(double lower, double upper)
        {
            checkEndpoint(lower, "lower");
            checkEndpoint(upper, "upper");
            if (lower == kInfinity)
                throw InvalidArgument("bounds: lower endpoint cannot be +inf");
            if (upper == -kInfinity)
                throw InvalidArgument("bounds: upper endpoint cannot be -inf");
            if (lower > upper)
                throw InvalidArgument(std::format("bounds: lower {} exceeds upper {}", lower, upper));
            return Bounds(lower, upper);
        }

        static Bounds all() noexcept { return Bounds(-kInfinity, kInfinity); }
        static Bounds atLeast(double lower) { return of(lower, kInfinity); }
        static Bounds atMost(double upper) { return of(-kInfinity, upper); }
        static Bounds closed(double lower, double upper)
        {
            if (!std::isfinite(lower) || !std::isfinite(upper))
                throw InvalidArgument(std::format("bounds: closed({}, {}) needs finite endpoints", lower, upper));
            return of(lower, upper);
        }
        static Bounds nonNegative() noexcept { return Bounds(0.0, kInfinity); }
        static Bounds zeroOne() noexcept { return Bounds(0.0, 1.0); }

        double lower() const noexcept { return lower_; }
        double upper() const noexcept { return upper_; }

        bool hasLower() const noexcept { return std::isfinite(lower_); }
        bool hasUpper() const noexcept { return std::isfinite(upper_); }

        bool isZeroOne() const noexcept { return lower_ == 0.0 && upper_ == 1.0; }

        bool contains(double value) const noexcept { return value >= lower_ && value <= upper_; }

        /// @brief True iff at least one integer lies in the interval
        bool containsInteger() const noexcept
        {
            return std::ceil(lower_) <= std::floor(upper_);
        }

        /// @brief Interval notation: "[0..1]", "[0..+∞)", "(−∞..5]", "(−∞..+∞)"
        std::string toString() const
        {
            std::string out = hasLower() ? std::format("[{}", lower_) : std::string("(−∞");
            out += "..";
            out += hasUpper() ? std::format("{}]", upper_) : std::string("+∞)");
            return out;
        }

        friend bool operator==(const Bounds& a, const Bounds& b) noexcept
        {
            return a.lower_ == b.lower_ && a.upper_ == b.upper_;
        }
    };

    /**
     * @brief Effective kind of a variable
     *
     * @example
     *     kindOf(VariableDomain::INTEGER, Bounds::zeroOne())     // BOOL
     *     kindOf(VariableDomain::INTEGER, Bounds::closed(-1, 1)) // INT
     *     kindOf(VariableDomain::REAL, Bounds::zeroOne())        // REAL
     */
    inline VariableKind kindOf(VariableDomain domain, const Bounds& bounds) noexcept
    {
        if (domain == VariableDomain::REAL)
            return VariableKind::REAL;
        return bounds.isZeroOne() ? VariableKind::BOOL : VariableKind::INT;
    }

    // ========================================================================
    // VARIABLE
    // ========================================================================

    /**
     * @class Variable
     * @brief Immutable decision variable
     *
     * @details Identity is the description built from the name and the
     *          textual references. The description is computed once, at
     *          construction, and never changes; solutions use variables as
     *          hash keys.
     */
    class Variable {
        std::string name_;
        std::vector<std::string> refs_;
        std::string description_;
        VariableDomain domain_ = VariableDomain::REAL;
        Bounds bounds_ = Bounds::all();

        Variable(std::string name, std::vector<std::string> refs, VariableDomain domain, Bounds bounds)
            : name_(std::move(name)),
              refs_(std::move(refs)),
              description_(describe(name_, refs_)),
              domain_(domain),
              bounds_(bounds)
        {
            if (!is_valid_enum_value(domain_))
                throw InvalidArgument(std::format("variable {}: invalid domain", description_));
            if (domain_ == VariableDomain::INTEGER && !bounds_.containsInteger())
                throw InvalidArgument(std::format(
                    "variable {}: integer domain with bounds {} admits no integer value",
                    description_, bounds_.toString()));
        }

    public:
        /**
         * @brief Variable with explicit textual references
         *
         * @throws InvalidArgument if the integer domain admits no value
         */
        static Variable of(std::string name, VariableDomain domain, Bounds bounds,
                           std::vector<std::string> refs)
        {
            return Variable(std::move(name), std::move(refs), domain, bounds);
        }

        /**
         * @brief Variable whose references are any streamable values
         *
         * @example
         *     auto x = Variable::of("x", VariableDomain::INTEGER, Bounds::nonNegative(), i, j);
         */
        template<naming_detail::Streamable... Refs>
        static Variable of(std::string name, VariableDomain domain, Bounds bounds, Refs&&... refs)
        {
            return Variable(std::move(name), references(std::forward<Refs>(refs)...), domain, bounds);
        }

        /// @brief Unbounded real variable
        template<naming_detail::Streamable... Refs>
        static Variable real(std::string name, Refs&&... refs)
        {
            return of(std::move(name), VariableDomain::REAL, Bounds::all(), std::forward<Refs>(refs)...);
        }

        /// @brief Unbounded integer variable
        template<naming_detail::Streamable... Refs>
        static Variable integer(std::string name, Refs&&... refs)
        {
            return of(std::move(name), VariableDomain::INTEGER, Bounds::all(), std::forward<Refs>(refs)...);
        }

        /// @brief Integer variable over [0,1]
        template<naming_detail::Streamable... Refs>
        static Variable boolean(std::string name, Refs&&... refs)
        {
            return of(std::move(name), VariableDomain::INTEGER, Bounds::zeroOne(), std::forward<Refs>(refs)...);
        }

        const std::string& name() const noexcept { return name_; }
        const std::vector<std::string>& refs() const noexcept { return refs_; }
        const std::string& description() const noexcept { return description_; }
        VariableDomain domain() const noexcept { return domain_; }
        const Bounds& bounds() const noexcept { return bounds_; }
        VariableKind kind() const noexcept { return kindOf(domain_, bounds_); }

        const std::string& toString() const noexcept { return description_; }

        friend bool operator==(const Variable& a, const Variable& b) noexcept
        {
            return a.description_ == b.description_ && a.kind() == b.kind() && a.bounds_ == b.bounds_;
        }

        friend std::ostream& operator<<(std::ostream& os, const Variable& v)
        {
            return os << v.description_;
        }
    };

    namespace detail {

        inline void hash_combine(std::size_t& seed, std::size_t value) noexcept
        {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }

    } // namespace detail

} // namespace mpkit

template<>
struct std::hash<mpkit::Bounds> {
    std::size_t operator()(const mpkit::Bounds& b) const noexcept
    {
        std::size_t seed = std::hash<double>{}(b.lower());
        mpkit::detail::hash_combine(seed, std::hash<double>{}(b.upper()));
        return seed;
    }
};

template<>
struct std::hash<mpkit::Variable> {
    std::size_t operator()(const mpkit::Variable& v) const noexcept
    {
        std::size_t seed = std::hash<std::string>{}(v.description());
        mpkit::detail::hash_combine(seed, static_cast<std::size_t>(v.kind()));
        mpkit::detail::hash_combine(seed, std::hash<mpkit::Bounds>{}(v.bounds()));
        return seed;
    }
};
