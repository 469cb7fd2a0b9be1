#pragma once
/*
===============================================================================
CONSTRAINTS — Linear constraints lhs (≤ | = | ≥) rhs
===============================================================================

OVERVIEW
--------
A Constraint is an immutable value made of a description, a non-empty linear
left-hand side, a comparison operator and a finite right-hand side.

The description takes part in equality: two structurally identical
inequalities with different labels are different constraints. Keeping
descriptions unique within one problem is recommended, so that constraints
can be looked up by label, but it is not enforced.

KEY COMPONENTS
--------------
• ComparisonOperator : LE, EQ, GE ("≤", "=", "≥"; ASCII "<=", "=", ">=")
• Constraint         : (description, lhs, operator, rhs)
• le/eq/ge helpers   : labelled or unlabelled construction

USAGE EXAMPLES
--------------
    auto c1 = Constraint::le("c1", 120 * x + 210 * y, 15000);
    auto c2 = Constraint::of(x + y, ComparisonOperator::LE, 75);

    c1.toString();  // "c1: 120×x + 210×y ≤ 15000"

EXCEPTION SAFETY
----------------
• Construction throws InvalidArgument for an empty lhs or a non-finite rhs.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <functional>
#include <string>
#include <utility>

#include "enum_utils.h"
#include "errors.h"
#include "expressions.h"

namespace mpkit {

    DECLARE_ENUM_WITH_COUNT(ComparisonOperator, LE, EQ, GE);

    /// @brief Mathematical rendering: "≤", "=", "≥"
    inline std::string toString(ComparisonOperator op)
    {
        switch (op) {
            case ComparisonOperator::LE:    return "≤";
            case ComparisonOperator::EQ:    return "=";
            case ComparisonOperator::GE:    return "≥";
            case ComparisonOperator::COUNT: break;
        }
        return "?";
    }

    /// @brief ASCII rendering used by text formats: "<=", "=", ">="
    inline std::string toAsciiString(ComparisonOperator op)
    {
        switch (op) {
            case ComparisonOperator::LE:    return "<=";
            case ComparisonOperator::EQ:    return "=";
            case ComparisonOperator::GE:    return ">=";
            case ComparisonOperator::COUNT: break;
        }
        return "?";
    }

    /**
     * @class Constraint
     * @brief Immutable linear constraint
     */
    class Constraint {
        std::string description_;
        SumTerms lhs_;
        ComparisonOperator op_;
        double rhs_;

    public:
        /**
         * @throws InvalidArgument if lhs is empty, op is not a valid operator,
         *         or rhs is not finite
         */
        Constraint(std::string description, SumTerms lhs, ComparisonOperator op, double rhs)
            : description_(std::move(description)), lhs_(std::move(lhs)), op_(op), rhs_(rhs)
        {
            if (lhs_.empty())
                throw InvalidArgument(std::format("constraint '{}': left-hand side is empty", description_));
            if (!is_valid_enum_value(op_))
                throw InvalidArgument(std::format("constraint '{}': invalid comparison operator", description_));
            if (!std::isfinite(rhs_))
                throw InvalidArgument(std::format(
                    "constraint '{}': right-hand side {} is not finite", description_, rhs_));
            if (rhs_ == 0.0)
                rhs_ = 0.0;
        }

        static Constraint of(std::string description, SumTerms lhs, ComparisonOperator op, double rhs)
        {
            return Constraint(std::move(description), std::move(lhs), op, rhs);
        }

        static Constraint of(SumTerms lhs, ComparisonOperator op, double rhs)
        {
            return Constraint("", std::move(lhs), op, rhs);
        }

        static Constraint le(std::string description, SumTerms lhs, double rhs)
        {
            return Constraint(std::move(description), std::move(lhs), ComparisonOperator::LE, rhs);
        }

        static Constraint eq(std::string description, SumTerms lhs, double rhs)
        {
            return Constraint(std::move(description), std::move(lhs), ComparisonOperator::EQ, rhs);
        }

        static Constraint ge(std::string description, SumTerms lhs, double rhs)
        {
            return Constraint(std::move(description), std::move(lhs), ComparisonOperator::GE, rhs);
        }

        const std::string& description() const noexcept { return description_; }
        const SumTerms& lhs() const noexcept { return lhs_; }
        ComparisonOperator op() const noexcept { return op_; }
        double rhs() const noexcept { return rhs_; }

        /// @brief True iff the assignment satisfies the constraint within tolerance
        template<typename F>
        bool isSatisfied(F&& valueOf, double tolerance = 1e-6) const
        {
            const double value = lhs_.evaluate(std::forward<F>(valueOf));
            switch (op_) {
                case ComparisonOperator::LE: return value <= rhs_ + tolerance;
                case ComparisonOperator::GE: return value >= rhs_ - tolerance;
                case ComparisonOperator::EQ: return std::fabs(value - rhs_) <= tolerance;
                case ComparisonOperator::COUNT: break;
            }
            return false;
        }

        /// @brief "c1: 2×x + y ≤ 4", or "2×x + y ≤ 4" without description
        std::string toString() const
        {
            std::string expr = std::format("{} {} {}", lhs_.toString(), mpkit::toString(op_), rhs_);
            if (description_.empty())
                return expr;
            return description_ + ": " + expr;
        }

        friend bool operator==(const Constraint& a, const Constraint& b) noexcept
        {
            return a.description_ == b.description_ && a.lhs_ == b.lhs_ && a.op_ == b.op_ && a.rhs_ == b.rhs_;
        }
    };

} // namespace mpkit

template<>
struct std::hash<mpkit::Constraint> {
    std::size_t operator()(const mpkit::Constraint& c) const noexcept
    {
        std::size_t seed = std::hash<std::string>{}(c.description());
        mpkit::detail::hash_combine(seed, std::hash<mpkit::SumTerms>{}(c.lhs()));
        mpkit::detail::hash_combine(seed, static_cast<std::size_t>(c.op()));
        mpkit::detail::hash_combine(seed, std::hash<double>{}(c.rhs()));
        return seed;
    }
};
