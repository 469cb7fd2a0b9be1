#pragma once
/*
===============================================================================
EXPRESSIONS — Terms and linear sums over mpkit variables
===============================================================================

OVERVIEW
--------
A Term is coefficient × variable. A SumTerms is an ordered, possibly empty
sequence of terms: a linear expression. Both are immutable values.

Duplicate variables are kept as separate additive contributions; nothing is
merged. Equality of sums is order-sensitive list equality:

    2x + 3y  !=  3y + 2x
    x + x    !=  2x

KEY COMPONENTS
--------------
• Term            : finite coefficient and variable
• SumTerms        : immutable ordered list of terms
• SumTermsBuilder : mutable accumulator producing a SumTerms
• operators       : 3.0 * x -> Term, t1 + t2 -> SumTerms, s + t -> SumTerms
• sum(Range, Func): sum_{i in I} f(i), f returning a Term or a SumTerms

USAGE EXAMPLES
--------------
    auto x = Variable::integer("x");
    auto y = Variable::integer("y");

    SumTerms f = 143 * x + 60 * y;

    std::vector<int> I{0, 1, 2};
    SumTerms total = sum(I, [&](int i) { return cost[i] * X[i]; });

    f.toString();   // "143×x + 60×y"

EXCEPTION SAFETY
----------------
• Term construction throws InvalidArgument for NaN or infinite coefficients.
• Everything else offers the strong guarantee.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <functional>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.h"
#include "variables.h"

namespace mpkit {

    // ========================================================================
    // TERM
    // ========================================================================

    /**
     * @class Term
     * @brief Finite coefficient times a variable
     */
    class Term {
        double coefficient_;
        Variable variable_;

    public:
        /// @throws InvalidArgument if coefficient is NaN or infinite
        Term(double coefficient, Variable variable)
            : coefficient_(coefficient), variable_(std::move(variable))
        {
            if (!std::isfinite(coefficient_))
                throw InvalidArgument(std::format(
                    "term: coefficient {} of {} is not finite", coefficient_, variable_.description()));
        }

        double coefficient() const noexcept { return coefficient_; }
        const Variable& variable() const noexcept { return variable_; }

        /// @brief "x" for 1, "−x" for -1, "c×x" otherwise
        std::string toString() const
        {
            if (coefficient_ == 1.0)
                return variable_.description();
            if (coefficient_ == -1.0)
                return "−" + variable_.description();
            return std::format("{}×{}", coefficient_, variable_.description());
        }

        friend bool operator==(const Term& a, const Term& b) noexcept
        {
            return a.coefficient_ == b.coefficient_ && a.variable_ == b.variable_;
        }
    };

    // ========================================================================
    // SUM OF TERMS
    // ========================================================================

    /**
     * @class SumTerms
     * @brief Immutable ordered sequence of terms
     */
    class SumTerms {
        std::vector<Term> terms_;

    public:
        SumTerms() = default;

        explicit SumTerms(std::vector<Term> terms) : terms_(std::move(terms)) {}

        SumTerms(std::initializer_list<Term> terms) : terms_(terms) {}

        /// @brief Single-term sum
        SumTerms(Term term) : terms_{std::move(term)} {}

        static SumTerms of() { return SumTerms(); }

        template<typename... Terms>
            requires (std::is_convertible_v<Terms, Term> && ...)
        static SumTerms of(Terms&&... terms)
        {
            std::vector<Term> v;
            v.reserve(sizeof...(terms));
            (v.emplace_back(std::forward<Terms>(terms)), ...);
            return SumTerms(std::move(v));
        }

        bool empty() const noexcept { return terms_.empty(); }
        std::size_t size() const noexcept { return terms_.size(); }

        const Term& operator[](std::size_t i) const { return terms_.at(i); }

        auto begin() const noexcept { return terms_.cbegin(); }
        auto end() const noexcept { return terms_.cend(); }

        const std::vector<Term>& terms() const noexcept { return terms_; }

        /// @brief Term variables in term order, duplicates included
        std::vector<Variable> variables() const
        {
            std::vector<Variable> out;
            out.reserve(terms_.size());
            for (const auto& t : terms_)
                out.push_back(t.variable());
            return out;
        }

        /**
         * @brief Value of the expression under an assignment
         *
         * @param valueOf Callable mapping a Variable to its value
         */
        template<typename F>
        double evaluate(F&& valueOf) const
        {
            double total = 0.0;
            for (const auto& t : terms_)
                total += t.coefficient() * std::invoke(valueOf, t.variable());
            return total;
        }

        /// @brief Terms joined with " + "; "" when empty
        std::string toString() const
        {
            std::string out;
            for (std::size_t i = 0; i < terms_.size(); ++i) {
                if (i > 0)
                    out += " + ";
                out += terms_[i].toString();
            }
            return out;
        }

        friend bool operator==(const SumTerms& a, const SumTerms& b) noexcept
        {
            return a.terms_ == b.terms_;
        }
    };

    /**
     * @class SumTermsBuilder
     * @brief Mutable accumulator for SumTerms
     *
     * @example
     *     SumTermsBuilder b;
     *     b.add(2, x).add(3, y);
     *     SumTerms s = b.build();
     */
    class SumTermsBuilder {
        std::vector<Term> terms_;

    public:
        SumTermsBuilder& add(Term term)
        {
            terms_.push_back(std::move(term));
            return *this;
        }

        SumTermsBuilder& add(double coefficient, const Variable& variable)
        {
            return add(Term(coefficient, variable));
        }

        SumTermsBuilder& addAll(const SumTerms& sum)
        {
            terms_.insert(terms_.end(), sum.begin(), sum.end());
            return *this;
        }

        bool empty() const noexcept { return terms_.empty(); }

        SumTerms build() const { return SumTerms(terms_); }
    };

    // ========================================================================
    // OPERATORS
    // ========================================================================

    inline Term operator*(double coefficient, const Variable& v) { return Term(coefficient, v); }
    inline Term operator*(const Variable& v, double coefficient) { return Term(coefficient, v); }
    inline Term operator-(const Variable& v) { return Term(-1.0, v); }

    inline SumTerms operator+(const Term& a, const Term& b) { return SumTerms{a, b}; }

    inline SumTerms operator+(const SumTerms& s, const Term& t)
    {
        return SumTermsBuilder().addAll(s).add(t).build();
    }

    inline SumTerms operator+(const SumTerms& a, const SumTerms& b)
    {
        return SumTermsBuilder().addAll(a).addAll(b).build();
    }

    inline SumTerms operator+(const Term& t, const Variable& v) { return SumTerms{t, Term(1.0, v)}; }
    inline SumTerms operator+(const Variable& v, const Term& t) { return SumTerms{Term(1.0, v), t}; }
    inline SumTerms operator+(const Variable& a, const Variable& b) { return SumTerms{Term(1.0, a), Term(1.0, b)}; }
    inline SumTerms operator+(const SumTerms& s, const Variable& v) { return s + Term(1.0, v); }

    // ========================================================================
    // SUM FUNCTIONS
    // ========================================================================

    namespace expr_detail {

        inline void add_term(SumTermsBuilder& b, const Term& t) { b.add(t); }
        inline void add_term(SumTermsBuilder& b, const SumTerms& s) { b.addAll(s); }
        inline void add_term(SumTermsBuilder& b, const Variable& v) { b.add(1.0, v); }

    } // namespace expr_detail

    /**
     * @brief Builds a SumTerms by concatenating lambda results over a range
     *
     * @details Semantically implements sum_{i in rng} func(i). The lambda may
     *          return a Term, a SumTerms or a Variable (coefficient 1). Terms
     *          keep the iteration order of the range.
     *
     * @throws Propagates any exception thrown by func
     */
    template<typename Range, typename Func>
    SumTerms sum(const Range& rng, Func&& func)
    {
        SumTermsBuilder b;
        for (const auto& idx : rng)
            expr_detail::add_term(b, std::invoke(func, idx));
        return b.build();
    }

    /// @brief Sum of variables with coefficient 1
    inline SumTerms sum(const std::vector<Variable>& variables)
    {
        SumTermsBuilder b;
        for (const auto& v : variables)
            b.add(1.0, v);
        return b.build();
    }

} // namespace mpkit

template<>
struct std::hash<mpkit::Term> {
    std::size_t operator()(const mpkit::Term& t) const noexcept
    {
        std::size_t seed = std::hash<double>{}(t.coefficient() == 0.0 ? 0.0 : t.coefficient());
        mpkit::detail::hash_combine(seed, std::hash<mpkit::Variable>{}(t.variable()));
        return seed;
    }
};

template<>
struct std::hash<mpkit::SumTerms> {
    std::size_t operator()(const mpkit::SumTerms& s) const noexcept
    {
        std::size_t seed = s.size();
        for (const auto& t : s)
            mpkit::detail::hash_combine(seed, std::hash<mpkit::Term>{}(t));
        return seed;
    }
};
