/*
===============================================================================
TEST EXPRESSIONS — Tests for expressions.h
===============================================================================

OVERVIEW
--------
Validates terms, linear sums and the expression-building helpers.

TEST ORGANIZATION
-----------------
• Section A: Term construction and rendering
• Section B: SumTerms construction, order and equality
• Section C: Operators and SumTermsBuilder
• Section D: sum() over ranges
• Section E: Evaluation and hashing

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• expressions.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <mpkit/expressions.h>

#include <limits>
#include <map>
#include <vector>

using namespace mpkit;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {
    const Variable x = Variable::real("x");
    const Variable y = Variable::real("y");
    const Variable z = Variable::integer("z");
}

// ============================================================================
// SECTION A: TERM CONSTRUCTION AND RENDERING
// ============================================================================

/**
 * @test Term::RejectsNonFiniteCoefficients
 * @brief NaN and infinite coefficients throw InvalidArgument
 */
TEST_CASE("A1: Term::RejectsNonFiniteCoefficients", "[expressions][term]")
{
    REQUIRE_THROWS_AS(Term(std::numeric_limits<double>::quiet_NaN(), x), InvalidArgument);
    REQUIRE_THROWS_AS(Term(std::numeric_limits<double>::infinity(), x), InvalidArgument);
    REQUIRE_THROWS_AS(Term(-std::numeric_limits<double>::infinity(), x), InvalidArgument);
    REQUIRE_NOTHROW(Term(0.0, x));
}

TEST_CASE("A2: Term::ToString", "[expressions][term][format]")
{
    REQUIRE(Term(1, x).toString() == "x");
    REQUIRE(Term(-1, x).toString() == "−x");
    REQUIRE(Term(3, x).toString() == "3×x");
    REQUIRE(Term(2.5, y).toString() == "2.5×y");
}

TEST_CASE("A3: Term::Accessors", "[expressions][term]")
{
    const Term t(4, z);
    REQUIRE(t.coefficient() == 4);
    REQUIRE(t.variable() == z);
    REQUIRE(t == Term(4, z));
    REQUIRE_FALSE(t == Term(5, z));
}

// ============================================================================
// SECTION B: SUMTERMS CONSTRUCTION, ORDER AND EQUALITY
// ============================================================================

TEST_CASE("B1: SumTerms::EmptySum", "[expressions][sum]")
{
    const SumTerms s;
    REQUIRE(s.empty());
    REQUIRE(s.size() == 0);
    REQUIRE(s.toString().empty());
    REQUIRE(s == SumTerms::of());
}

/**
 * @test SumTerms::OrderSensitiveEquality
 * @brief Sums compare as ordered lists; duplicates are not merged
 *
 * @scenario 2x + 3y against 3y + 2x, and x + x against 2x
 * @then Neither pair is equal
 */
TEST_CASE("B2: SumTerms::OrderSensitiveEquality", "[expressions][sum]")
{
    REQUIRE(2 * x + 3 * y == SumTerms{Term(2, x), Term(3, y)});
    REQUIRE_FALSE(2 * x + 3 * y == 3 * y + 2 * x);

    const SumTerms twice = x + x;
    REQUIRE(twice.size() == 2);
    REQUIRE_FALSE(twice == SumTerms(2 * x));
}

TEST_CASE("B3: SumTerms::Indexing", "[expressions][sum]")
{
    const SumTerms s = SumTerms::of(Term(1, x), Term(2, y), Term(3, z));
    REQUIRE(s.size() == 3);
    REQUIRE(s[1] == Term(2, y));
    REQUIRE_THROWS_AS(s[3], std::out_of_range);
    REQUIRE(s.variables() == std::vector<Variable>{x, y, z});
}

TEST_CASE("B4: SumTerms::ToString", "[expressions][sum][format]")
{
    REQUIRE((143 * x + 60 * y).toString() == "143×x + 60×y");
    REQUIRE((x + (-y)).toString() == "x + −y");
}

// ============================================================================
// SECTION C: OPERATORS AND SUMTERMSBUILDER
// ============================================================================

TEST_CASE("C1: Operators::BuildTermsAndSums", "[expressions][operators]")
{
    REQUIRE(3 * x == Term(3, x));
    REQUIRE(x * 3 == Term(3, x));
    REQUIRE(-x == Term(-1, x));

    const SumTerms s = 2 * x + 3 * y + z;
    REQUIRE(s == SumTerms{Term(2, x), Term(3, y), Term(1, z)});

    const SumTerms joined = (x + y) + (2 * z + x);
    REQUIRE(joined.size() == 4);
    REQUIRE(joined[3] == Term(1, x));
}

/**
 * @test SumTermsBuilder::Accumulates
 * @brief Terms keep insertion order, sums are appended whole
 */
TEST_CASE("C2: SumTermsBuilder::Accumulates", "[expressions][builder]")
{
    SumTermsBuilder b;
    REQUIRE(b.empty());
    b.add(2, x).add(Term(3, y)).addAll(x + z);
    REQUIRE_FALSE(b.empty());

    const SumTerms s = b.build();
    REQUIRE(s == SumTerms{Term(2, x), Term(3, y), Term(1, x), Term(1, z)});
}

// ============================================================================
// SECTION D: SUM() OVER RANGES
// ============================================================================

/**
 * @test Sum::OverRange
 * @brief sum(range, f) concatenates f(i) in range order
 */
TEST_CASE("D1: Sum::OverRange", "[expressions][sum_fn]")
{
    std::vector<Variable> X;
    for (int i = 0; i < 3; ++i)
        X.push_back(Variable::of("X", VariableDomain::REAL, Bounds::nonNegative(), i));
    const std::vector<double> cost{5, 6, 7};
    const std::vector<int> I{0, 1, 2};

    const SumTerms s = sum(I, [&](int i) { return cost[i] * X[i]; });
    REQUIRE(s.size() == 3);
    REQUIRE(s[0] == Term(5, X[0]));
    REQUIRE(s[2] == Term(7, X[2]));

    REQUIRE(sum(X) == SumTerms{Term(1, X[0]), Term(1, X[1]), Term(1, X[2])});
}

TEST_CASE("D2: Sum::LambdaReturningSums", "[expressions][sum_fn]")
{
    const std::vector<int> I{1, 2};
    const SumTerms s = sum(I, [&](int i) { return i * x + y; });
    REQUIRE(s == SumTerms{Term(1, x), Term(1, y), Term(2, x), Term(1, y)});
}

TEST_CASE("D3: Sum::EmptyRange", "[expressions][sum_fn]")
{
    const std::vector<int> none;
    REQUIRE(sum(none, [&](int) { return x; }).empty());
}

// ============================================================================
// SECTION E: EVALUATION AND HASHING
// ============================================================================

TEST_CASE("E1: SumTerms::Evaluate", "[expressions][evaluate]")
{
    const std::map<std::string, double> values{{"x", 2}, {"y", -1}, {"z", 4}};
    auto valueOf = [&](const Variable& v) { return values.at(v.description()); };

    REQUIRE((3 * x + 2 * y + z).evaluate(valueOf) == Catch::Approx(8.0));
    REQUIRE(SumTerms().evaluate(valueOf) == 0.0);
}

TEST_CASE("E2: SumTerms::HashConsistentWithEquality", "[expressions][hash]")
{
    REQUIRE(std::hash<SumTerms>{}(2 * x + y) == std::hash<SumTerms>{}(SumTerms{Term(2, x), Term(1, y)}));
    REQUIRE(std::hash<Term>{}(Term(0.0, x)) == std::hash<Term>{}(Term(-0.0, x)));
}
