/*
===============================================================================
TEST PARAMETERS — Tests for parameters.h
===============================================================================

OVERVIEW
--------
Validates the parameter store: defaults, validation, change reporting, bulk
operations, namer slots and the resolution of the timing type.

TEST ORGANIZATION
-----------------
• Section A: Defaults and explicit values
• Section B: Validation
• Section C: Namers
• Section D: Bulk operations and equality
• Section E: Timing resolution

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• parameters.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <mpkit/parameters.h>

#include <limits>
#include <optional>
#include <string>

using namespace mpkit;

namespace {
    VariableNamer prefixed(const std::string& prefix)
    {
        return VariableNamer([prefix](const Variable& v) -> std::optional<std::string> {
            return prefix + v.description();
        });
    }
}

// ============================================================================
// SECTION A: DEFAULTS AND EXPLICIT VALUES
// ============================================================================

/**
 * @test Parameters::Defaults
 * @brief Only DETERMINISTIC has a default (0); nothing is explicitly set
 */
TEST_CASE("A1: Parameters::Defaults", "[parameters][defaults]")
{
    const Parameters p;
    REQUIRE_FALSE(p.value(DoubleParameter::MAX_WALL_SECONDS).has_value());
    REQUIRE_FALSE(p.value(IntParameter::MAX_THREADS).has_value());
    REQUIRE(p.value(IntParameter::DETERMINISTIC) == 0);
    REQUIRE_FALSE(p.isSet(IntParameter::DETERMINISTIC));
    REQUIRE_FALSE(p.value(StringParameter::WORK_DIR).has_value());
    REQUIRE(p.toString() == "{}");
}

TEST_CASE("A2: Parameters::SetAndClear", "[parameters]")
{
    Parameters p;
    REQUIRE(p.set(DoubleParameter::MAX_WALL_SECONDS, 60.0));
    REQUIRE_FALSE(p.set(DoubleParameter::MAX_WALL_SECONDS, 60.0));
    REQUIRE(p.value(DoubleParameter::MAX_WALL_SECONDS) == 60.0);
    REQUIRE(p.isSet(DoubleParameter::MAX_WALL_SECONDS));

    REQUIRE(p.set(IntParameter::MAX_THREADS, 4));
    REQUIRE(p.set(StringParameter::WORK_DIR, "/tmp/nodes"));
    REQUIRE(p.value(StringParameter::WORK_DIR) == "/tmp/nodes");

    REQUIRE(p.set(DoubleParameter::MAX_WALL_SECONDS, std::nullopt));
    REQUIRE_FALSE(p.set(DoubleParameter::MAX_WALL_SECONDS, std::nullopt));
    REQUIRE_FALSE(p.value(DoubleParameter::MAX_WALL_SECONDS).has_value());
}

/**
 * @test Parameters::DefaultValueIsNotStored
 * @brief Setting a key to its default is the same as clearing it
 */
TEST_CASE("A3: Parameters::DefaultValueIsNotStored", "[parameters][defaults]")
{
    Parameters p;
    REQUIRE_FALSE(p.set(IntParameter::DETERMINISTIC, 0));
    REQUIRE_FALSE(p.isSet(IntParameter::DETERMINISTIC));
    REQUIRE(p == Parameters());

    REQUIRE(p.set(IntParameter::DETERMINISTIC, 1));
    REQUIRE(p.isSet(IntParameter::DETERMINISTIC));
    REQUIRE(p.set(IntParameter::DETERMINISTIC, 0));
    REQUIRE(p == Parameters());
}

TEST_CASE("A4: Parameters::ToString", "[parameters][format]")
{
    Parameters p;
    p.set(DoubleParameter::MAX_WALL_SECONDS, 60.0);
    p.set(IntParameter::MAX_THREADS, 4);
    REQUIRE(p.toString() == "{MAX_WALL_SECONDS=60, MAX_THREADS=4}");

    p.setVariablesNamer(FileFormat::MPS, prefixed("v"));
    REQUIRE(p.toString() == "{MAX_WALL_SECONDS=60, MAX_THREADS=4, VARIABLES_NAMER[MPS]}");
}

// ============================================================================
// SECTION B: VALIDATION
// ============================================================================

/**
 * @test Parameters::RejectsInvalidValues
 * @brief Invalid values throw InvalidArgument and leave the store unchanged
 */
TEST_CASE("B1: Parameters::RejectsInvalidValues", "[parameters][validation]")
{
    Parameters p;
    p.set(DoubleParameter::MAX_MEMORY_MB, 512.0);

    REQUIRE_THROWS_AS(p.set(DoubleParameter::MAX_MEMORY_MB, 0.0), InvalidArgument);
    REQUIRE_THROWS_AS(p.set(DoubleParameter::MAX_MEMORY_MB, -1.0), InvalidArgument);
    REQUIRE_THROWS_AS(p.set(DoubleParameter::MAX_CPU_SECONDS, std::numeric_limits<double>::quiet_NaN()),
                      InvalidArgument);
    REQUIRE_THROWS_AS(p.set(IntParameter::MAX_THREADS, 0), InvalidArgument);
    REQUIRE_THROWS_AS(p.set(IntParameter::DETERMINISTIC, 2), InvalidArgument);
    REQUIRE_THROWS_AS(p.set(StringParameter::WORK_DIR, ""), InvalidArgument);

    REQUIRE(p.value(DoubleParameter::MAX_MEMORY_MB) == 512.0);
    REQUIRE_FALSE(p.isSet(DoubleParameter::MAX_CPU_SECONDS));
}

TEST_CASE("B2: Parameters::TreeSizeAndThreads", "[parameters][validation]")
{
    Parameters p;
    REQUIRE(p.set(DoubleParameter::MAX_TREE_SIZE_MB, 2048.0));
    REQUIRE(p.set(IntParameter::MAX_THREADS, 1));
    REQUIRE(p.value(DoubleParameter::MAX_TREE_SIZE_MB) == 2048.0);
}

// ============================================================================
// SECTION C: NAMERS
// ============================================================================

/**
 * @test Parameters::GlobalNamers
 * @brief Namer slots report changes by identity; an empty namer unsets
 */
TEST_CASE("C1: Parameters::GlobalNamers", "[parameters][namers]")
{
    Parameters p;
    const VariableNamer namer = prefixed("v_");

    REQUIRE(p.setVariablesNamer(namer));
    REQUIRE_FALSE(p.setVariablesNamer(namer));
    REQUIRE(p.variablesNamer() == namer);
    REQUIRE(p.setVariablesNamer(prefixed("v_")));

    REQUIRE(p.setVariablesNamer(VariableNamer()));
    REQUIRE_FALSE(static_cast<bool>(p.variablesNamer()));

    REQUIRE(p.setConstraintsNamer(ConstraintNamer([](const Constraint&) -> std::optional<std::string> {
        return std::nullopt;
    })));
    REQUIRE(static_cast<bool>(p.constraintsNamer()));
}

TEST_CASE("C2: Parameters::PerFormatNamers", "[parameters][namers]")
{
    Parameters p;
    const VariableNamer mps = prefixed("m_");

    REQUIRE(p.setVariablesNamer(FileFormat::MPS, mps));
    REQUIRE_FALSE(p.setVariablesNamer(FileFormat::MPS, mps));
    REQUIRE(p.variablesNamersByFormat().size() == 1);
    REQUIRE(p.variablesNamersByFormat().at(FileFormat::MPS) == mps);

    REQUIRE(p.setVariablesNamer(FileFormat::MPS, VariableNamer()));
    REQUIRE(p.variablesNamersByFormat().empty());

    NamersByFormat<Variable> table{{FileFormat::LP, mps}, {FileFormat::CPLEX_LP, VariableNamer()}};
    REQUIRE(p.setVariablesNamersByFormat(table));
    REQUIRE(p.variablesNamersByFormat().size() == 1);
    REQUIRE(p.variablesNamersByFormat().contains(FileFormat::LP));
}

// ============================================================================
// SECTION D: BULK OPERATIONS AND EQUALITY
// ============================================================================

/**
 * @test Parameters::SetAll
 * @brief setAll replaces every entry and reports whether anything changed
 */
TEST_CASE("D1: Parameters::SetAll", "[parameters][bulk]")
{
    Parameters source;
    source.set(DoubleParameter::MAX_WALL_SECONDS, 5.0);
    source.set(IntParameter::DETERMINISTIC, 1);

    Parameters target;
    target.set(IntParameter::MAX_THREADS, 8);

    REQUIRE(target.setAll(source));
    REQUIRE(target == source);
    REQUIRE_FALSE(target.isSet(IntParameter::MAX_THREADS));
    REQUIRE_FALSE(target.setAll(source));
}

TEST_CASE("D2: Parameters::Reset", "[parameters][bulk]")
{
    Parameters p;
    p.set(IntParameter::MAX_THREADS, 8);
    p.setVariablesNamer(prefixed("v"));
    p.reset();
    REQUIRE(p == Parameters());
}

TEST_CASE("D3: Parameters::EqualityIncludesNamers", "[parameters][equality]")
{
    const VariableNamer namer = prefixed("v");
    Parameters a;
    Parameters b;
    a.setVariablesNamer(namer);
    REQUIRE_FALSE(a == b);
    b.setVariablesNamer(namer);
    REQUIRE(a == b);
}

// ============================================================================
// SECTION E: TIMING RESOLUTION
// ============================================================================

/**
 * @test Timing::PreferredType
 * @brief Explicit limits decide; otherwise CPU when supported, else wall
 */
TEST_CASE("E1: Timing::PreferredType", "[parameters][timing]")
{
    Parameters none;
    REQUIRE(preferredTimingType(none, true) == TimingType::CPU);
    REQUIRE(preferredTimingType(none, false) == TimingType::WALL);

    Parameters wall;
    wall.set(DoubleParameter::MAX_WALL_SECONDS, 10.0);
    REQUIRE(preferredTimingType(wall, true) == TimingType::WALL);
    REQUIRE(timeLimit(wall, TimingType::WALL) == 10.0);
    REQUIRE_FALSE(timeLimit(wall, TimingType::CPU).has_value());

    Parameters cpu;
    cpu.set(DoubleParameter::MAX_CPU_SECONDS, 3.0);
    REQUIRE(preferredTimingType(cpu, true) == TimingType::CPU);
    REQUIRE(timeLimit(cpu, TimingType::CPU) == 3.0);
}

/**
 * @test Timing::Conflicts
 * @brief Both limits conflict; a CPU limit without CPU timing is unsupported
 */
TEST_CASE("E2: Timing::Conflicts", "[parameters][timing]")
{
    Parameters both;
    both.set(DoubleParameter::MAX_WALL_SECONDS, 10.0);
    both.set(DoubleParameter::MAX_CPU_SECONDS, 10.0);
    REQUIRE_THROWS_AS(preferredTimingType(both, true), ConfigurationConflict);
    REQUIRE_THROWS_AS(preferredTimingType(both, false), ConfigurationConflict);

    Parameters cpu;
    cpu.set(DoubleParameter::MAX_CPU_SECONDS, 3.0);
    REQUIRE_THROWS_AS(preferredTimingType(cpu, false), UnsupportedFeature);
}
