/*
===============================================================================
TEST OBJECTIVE — Tests for objective.h
===============================================================================

TEST ORGANIZATION
-----------------
• Section A: The zero objective
• Section B: Complete objectives

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <mpkit/objective.h>

using namespace mpkit;

namespace {
    const Variable x = Variable::integer("x");
    const Variable y = Variable::integer("y");
}

// ============================================================================
// SECTION A: THE ZERO OBJECTIVE
// ============================================================================

/**
 * @test Objective::ZeroIsCanonical
 * @brief Every empty objective equals (empty, MAX), whatever the sense given
 */
TEST_CASE("A1: Objective::ZeroIsCanonical", "[objective][zero]")
{
    REQUIRE(Objective::of({}, Sense::MIN) == Objective::zero());
    REQUIRE(Objective::of({}, Sense::MAX) == Objective::zero());
    REQUIRE(Objective::min(SumTerms()) == Objective::zero());
    REQUIRE(Objective() == Objective::zero());

    REQUIRE(Objective::min(SumTerms()).sense() == Sense::MAX);
    REQUIRE(std::hash<Objective>{}(Objective::min(SumTerms())) == std::hash<Objective>{}(Objective::zero()));
}

TEST_CASE("A2: Objective::ZeroQueries", "[objective][zero]")
{
    const Objective zero = Objective::zero();
    REQUIRE(zero.isZero());
    REQUIRE_FALSE(zero.isComplete());
    REQUIRE(zero.function().empty());
    REQUIRE(zero.toString() == "ZERO");
}

// ============================================================================
// SECTION B: COMPLETE OBJECTIVES
// ============================================================================

TEST_CASE("B1: Objective::Complete", "[objective]")
{
    const auto obj = Objective::max(143 * x + 60 * y);
    REQUIRE(obj.isComplete());
    REQUIRE_FALSE(obj.isZero());
    REQUIRE(obj.sense() == Sense::MAX);
    REQUIRE(obj.function() == 143 * x + 60 * y);
    REQUIRE(obj.toString() == "MAX 143×x + 60×y");
}

TEST_CASE("B2: Objective::SenseMatters", "[objective]")
{
    REQUIRE_FALSE(Objective::max(x + y) == Objective::min(x + y));
    REQUIRE(Objective::of(x + y, Sense::MIN) == Objective::min(x + y));
    REQUIRE(Objective::min(x + y).toString() == "MIN x + y");
}

TEST_CASE("B3: Objective::InvalidSenseRejected", "[objective]")
{
    REQUIRE_THROWS_AS(Objective::of(x + y, Sense::COUNT), InvalidArgument);
}
