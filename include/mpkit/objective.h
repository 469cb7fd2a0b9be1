#pragma once
/*
===============================================================================
OBJECTIVE — Objective function and optimization sense
===============================================================================

OVERVIEW
--------
An Objective pairs a linear function (possibly empty) with a sense. The empty
function means "no objective": any feasible point is acceptable. That case
has exactly one representation, the zero sentinel (empty, MAX). Every factory
normalizes the sense to MAX when the function is empty, so

    Objective::of({}, Sense::MIN) == Objective::of({}, Sense::MAX) == Objective::zero()

A non-zero objective is complete: it has both a function and a sense.
Engines that report "optimal" for a zero objective have merely found a
feasible point; result canonicalization uses isComplete() to tell the two
apart.

USAGE EXAMPLES
--------------
    auto obj = Objective::max(143 * x + 60 * y);
    obj.isZero();       // false
    obj.toString();     // "MAX 143×x + 60×y"

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include "enum_utils.h"
#include "errors.h"
#include "expressions.h"

namespace mpkit {

    DECLARE_ENUM_WITH_COUNT(Sense, MAX, MIN);

    inline std::string toString(Sense sense)
    {
        switch (sense) {
            case Sense::MAX:   return "MAX";
            case Sense::MIN:   return "MIN";
            case Sense::COUNT: break;
        }
        return "UNKNOWN";
    }

    /**
     * @class Objective
     * @brief Immutable (function, sense) pair with a canonical zero
     */
    class Objective {
        SumTerms function_;
        Sense sense_ = Sense::MAX;

        Objective(SumTerms function, Sense sense)
            : function_(std::move(function)),
              sense_(function_.empty() ? Sense::MAX : sense)
        {
            if (!is_valid_enum_value(sense))
                throw InvalidArgument("objective: invalid sense");
        }

    public:
        /// @brief The zero objective (empty, MAX)
        Objective() = default;

        static Objective zero() { return Objective(); }

        /// @brief Objective with the given sense; sense is MAX when function is empty
        static Objective of(SumTerms function, Sense sense) { return Objective(std::move(function), sense); }
        static Objective max(SumTerms function) { return Objective(std::move(function), Sense::MAX); }
        static Objective min(SumTerms function) { return Objective(std::move(function), Sense::MIN); }

        const SumTerms& function() const noexcept { return function_; }
        Sense sense() const noexcept { return sense_; }

        bool isZero() const noexcept { return function_.empty(); }
        bool isComplete() const noexcept { return !isZero(); }

        std::string toString() const
        {
            if (isZero())
                return "ZERO";
            return mpkit::toString(sense_) + " " + function_.toString();
        }

        friend bool operator==(const Objective& a, const Objective& b) noexcept
        {
            return a.sense_ == b.sense_ && a.function_ == b.function_;
        }
    };

} // namespace mpkit

template<>
struct std::hash<mpkit::Objective> {
    std::size_t operator()(const mpkit::Objective& o) const noexcept
    {
        std::size_t seed = static_cast<std::size_t>(o.sense());
        mpkit::detail::hash_combine(seed, std::hash<mpkit::SumTerms>{}(o.function()));
        return seed;
    }
};
