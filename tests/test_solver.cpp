/*
===============================================================================
TEST SOLVER — Tests for solver.h
===============================================================================

OVERVIEW
--------
Validates the engine-independent solve workflow with a scripted engine: the
preconditions, status canonicalization, result assembly, timing resolution,
name resolution and the freeze after the engine is handed over.

TEST ORGANIZATION
-----------------
• Section A: Preconditions
• Section B: Statuses and results
• Section C: Problem and parameter snapshots
• Section D: Timing
• Section E: Names
• Section F: Engine hand-over

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• solver.h, examples.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <mpkit/examples.h>
#include <mpkit/solver.h>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

using namespace mpkit;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    constexpr int kOptimal = 1;
    constexpr int kFeasible = 2;
    constexpr int kInfeasible = 3;
    constexpr int kTimeLimit = 6;

    /**
     * @brief Engine whose runs are scripted by the test
     */
    class FakeSolver : public Solver {
    public:
        std::function<RawOutcome(const IMP&)> script;
        bool cpu = false;
        int runs = 0;
        int problemChanges = 0;

        std::string engineName() const override { return "fake"; }
        bool cpuTimingSupported() const override { return cpu; }

        /// Stand-in for an adapter's underlyingEngine()
        void handOver()
        {
            problem();
            markHandedOver();
        }

    protected:
        const StatusTable& statusTable() const override
        {
            static const StatusTable table{
                {kOptimal,     EngineOutcome::SOLVED_OPTIMAL},
                {kFeasible,    EngineOutcome::SOLVED_FEASIBLE},
                {kInfeasible,  EngineOutcome::INFEASIBLE},
                {kTimeLimit,   EngineOutcome::TIME_LIMIT},
            };
            return table;
        }

        RawOutcome solveUnderlying() override
        {
            ++runs;
            return script(problem());
        }

        void problemChanged() override { ++problemChanges; }
    };

    /// Outcome carrying the optimal OneFourThree point
    RawOutcome optimal(const IMP& mp, int code = kOptimal)
    {
        RawOutcome out;
        out.code = code;
        out.solution = Solution::of(mp, 6266, {{mp.variable("x"), 22}, {mp.variable("y"), 52}});
        return out;
    }

    RawOutcome bare(int code)
    {
        RawOutcome out;
        out.code = code;
        return out;
    }

} // namespace

// ============================================================================
// SECTION A: PRECONDITIONS
// ============================================================================

/**
 * @test Solver::NeedsAProblem
 * @brief solve(), problem() and names raise StatePrecondition before setProblem
 */
TEST_CASE("A1: Solver::NeedsAProblem", "[solver][preconditions]")
{
    FakeSolver solver;
    solver.script = [](const IMP&) { return bare(kInfeasible); };

    REQUIRE_FALSE(solver.hasProblem());
    REQUIRE_THROWS_AS(solver.problem(), StatePrecondition);
    REQUIRE_THROWS_AS(solver.solve(), StatePrecondition);
    REQUIRE_THROWS_AS(solver.variableName(Variable::real("x")), StatePrecondition);
    REQUIRE(solver.runs == 0);
}

TEST_CASE("A2: Solver::ResultBeforeSolve", "[solver][preconditions]")
{
    FakeSolver solver;
    solver.setProblem(examples::oneFourThree());
    REQUIRE(solver.hasProblem());
    REQUIRE_FALSE(solver.hasResult());
    REQUIRE_THROWS_AS(solver.result(), StatePrecondition);
}

// ============================================================================
// SECTION B: STATUSES AND RESULTS
// ============================================================================

/**
 * @test Solver::OptimalRun
 * @brief The result carries status, solution, parameters and duration
 */
TEST_CASE("B1: Solver::OptimalRun", "[solver][result]")
{
    FakeSolver solver;
    solver.script = [](const IMP& mp) {
        RawOutcome out = optimal(mp);
        out.solverWall = 0.5;
        return out;
    };
    Parameters p;
    p.set(IntParameter::MAX_THREADS, 2);
    solver.setParameters(p);
    solver.setProblem(examples::oneFourThree());

    REQUIRE(solver.solve() == ResultStatus::OPTIMAL);
    REQUIRE(solver.hasResult());

    const Result result = solver.result();
    REQUIRE(result.status() == ResultStatus::OPTIMAL);
    REQUIRE(result.hasSolution());
    REQUIRE(*result.solution() == examples::oneFourThreeSolution());
    REQUIRE(result.parameters() == p);
    REQUIRE(result.duration().solverWall() == 0.5);
    REQUIRE(result.duration().wall() >= 0.0);
}

/**
 * @test Solver::ZeroObjectiveOptimalIsFeasible
 * @brief An engine "optimal" on a feasibility problem becomes FEASIBLE
 */
TEST_CASE("B2: Solver::ZeroObjectiveOptimalIsFeasible", "[solver][result]")
{
    MPBuilder mp("feasibility");
    const auto x = Variable::real("x");
    mp.add(Constraint::ge("c", SumTerms(1 * x), 1));

    FakeSolver solver;
    solver.script = [](const IMP& m) {
        RawOutcome out;
        out.code = kOptimal;
        out.solution = Solution::of(m, 0, {{m.variable("x"), 1}});
        return out;
    };
    solver.setProblem(mp);

    REQUIRE(solver.solve() == ResultStatus::FEASIBLE);
    REQUIRE(solver.result().solution()->value(x) == 1);
}

TEST_CASE("B3: Solver::InfeasibleRun", "[solver][result]")
{
    FakeSolver solver;
    solver.script = [](const IMP&) { return bare(kInfeasible); };
    solver.setProblem(examples::oneFourThree());

    REQUIRE(solver.solve() == ResultStatus::INFEASIBLE);
    REQUIRE_FALSE(solver.result().hasSolution());
}

TEST_CASE("B4: Solver::TimeLimit", "[solver][result]")
{
    FakeSolver solver;
    solver.setProblem(examples::oneFourThree());

    solver.script = [](const IMP& mp) { return optimal(mp, kTimeLimit); };
    REQUIRE(solver.solve() == ResultStatus::TIME_LIMIT_REACHED_WITH_SOLUTION);
    REQUIRE(solver.result().hasSolution());

    solver.script = [](const IMP&) { return bare(kTimeLimit); };
    REQUIRE(solver.solve() == ResultStatus::TIME_LIMIT_REACHED_NO_SOLUTION);
    REQUIRE_FALSE(solver.result().hasSolution());
    REQUIRE(solver.runs == 2);
}

TEST_CASE("B5: Solver::UnknownCode", "[solver][result]")
{
    FakeSolver solver;
    solver.setProblem(examples::oneFourThree());

    solver.script = [](const IMP& mp) { return optimal(mp, 42); };
    REQUIRE(solver.solve() == ResultStatus::ERROR_WITH_SOLUTION);

    solver.script = [](const IMP&) { return bare(42); };
    REQUIRE(solver.solve() == ResultStatus::ERROR_NO_SOLUTION);
}

/**
 * @test Solver::SolutionDroppedForInfeasibleStatus
 * @brief A solution reported along a non-feasible status is not kept
 */
TEST_CASE("B6: Solver::SolutionDroppedForInfeasibleStatus", "[solver][result]")
{
    FakeSolver solver;
    solver.setProblem(examples::oneFourThree());
    solver.script = [](const IMP& mp) { return optimal(mp, kInfeasible); };

    REQUIRE(solver.solve() == ResultStatus::INFEASIBLE);
    REQUIRE_FALSE(solver.result().hasSolution());
}

/**
 * @test Solver::FeasibleStatusWithoutSolution
 * @brief An engine claiming a solution it does not return is an internal error
 */
TEST_CASE("B7: Solver::FeasibleStatusWithoutSolution", "[solver][result]")
{
    FakeSolver solver;
    solver.setProblem(examples::oneFourThree());
    solver.script = [](const IMP&) { return bare(kFeasible); };

    REQUIRE(solver.solve() == ResultStatus::FEASIBLE);
    REQUIRE_THROWS_AS(solver.result(), std::logic_error);
}

// ============================================================================
// SECTION C: PROBLEM AND PARAMETER SNAPSHOTS
// ============================================================================

/**
 * @test Solver::ProblemIsCopied
 * @brief Later changes to the caller's program do not reach the solver
 */
TEST_CASE("C1: Solver::ProblemIsCopied", "[solver][snapshot]")
{
    MPBuilder mp = examples::oneFourThree();
    FakeSolver solver;
    solver.setProblem(mp);

    mp.add(Constraint::le("low x", SumTerms(1 * mp.variable("x")), 16));
    REQUIRE(solver.problem().constraints().size() == 3);
    REQUIRE(solver.problem() == examples::oneFourThree());
}

TEST_CASE("C2: Solver::SetProblemDiscardsResult", "[solver][snapshot]")
{
    FakeSolver solver;
    solver.script = [](const IMP& mp) { return optimal(mp); };
    solver.setProblem(examples::oneFourThree());
    solver.solve();
    REQUIRE(solver.hasResult());

    solver.setProblem(examples::oneFourThreeLowX());
    REQUIRE_FALSE(solver.hasResult());
    REQUIRE_THROWS_AS(solver.result(), StatePrecondition);
}

/**
 * @test Solver::SetProblemNotifiesAdapter
 * @brief Every setProblem() reaches the adapter, even after a solve
 */
TEST_CASE("C4: Solver::SetProblemNotifiesAdapter", "[solver][snapshot]")
{
    FakeSolver solver;
    solver.script = [](const IMP& mp) { return optimal(mp); };
    REQUIRE(solver.problemChanges == 0);

    solver.setProblem(examples::oneFourThree());
    REQUIRE(solver.problemChanges == 1);
    solver.solve();

    solver.setProblem(examples::oneFourThreeLowX());
    REQUIRE(solver.problemChanges == 2);

    solver.handOver();
    REQUIRE_THROWS_AS(solver.setProblem(examples::oneFourThree()), StatePrecondition);
    REQUIRE(solver.problemChanges == 2);
}

/**
 * @test Solver::ResultKeepsSolveTimeParameters
 * @brief The result reports the parameters in force when solve() ran
 */
TEST_CASE("C3: Solver::ResultKeepsSolveTimeParameters", "[solver][snapshot]")
{
    FakeSolver solver;
    solver.script = [](const IMP&) { return bare(kInfeasible); };
    solver.setProblem(examples::oneFourThree());

    Parameters first;
    first.set(IntParameter::MAX_THREADS, 1);
    REQUIRE(solver.setParameters(first));
    REQUIRE_FALSE(solver.setParameters(first));
    solver.solve();

    Parameters second;
    second.set(IntParameter::MAX_THREADS, 4);
    solver.setParameters(second);

    REQUIRE(solver.result().parameters() == first);
    REQUIRE(solver.parameters() == second);
}

// ============================================================================
// SECTION D: TIMING
// ============================================================================

/**
 * @test Solver::TimingConflicts
 * @brief Timing conflicts are raised before the engine runs
 */
TEST_CASE("D1: Solver::TimingConflicts", "[solver][timing]")
{
    FakeSolver solver;
    solver.script = [](const IMP&) { return bare(kInfeasible); };
    solver.setProblem(examples::oneFourThree());

    Parameters both;
    both.set(DoubleParameter::MAX_WALL_SECONDS, 5.0);
    both.set(DoubleParameter::MAX_CPU_SECONDS, 5.0);
    solver.setParameters(both);
    REQUIRE_THROWS_AS(solver.solve(), ConfigurationConflict);

    Parameters cpu;
    cpu.set(DoubleParameter::MAX_CPU_SECONDS, 5.0);
    solver.setParameters(cpu);
    REQUIRE_THROWS_AS(solver.solve(), UnsupportedFeature);

    REQUIRE(solver.runs == 0);
    REQUIRE_FALSE(solver.hasResult());
}

TEST_CASE("D2: Solver::TimeLimitOfPreferredType", "[solver][timing]")
{
    FakeSolver solver;
    REQUIRE(solver.preferredTimingType() == TimingType::WALL);
    REQUIRE_FALSE(solver.timeLimit().has_value());

    solver.cpu = true;
    REQUIRE(solver.preferredTimingType() == TimingType::CPU);

    Parameters p;
    p.set(DoubleParameter::MAX_WALL_SECONDS, 7.5);
    solver.setParameters(p);
    REQUIRE(solver.preferredTimingType() == TimingType::WALL);
    REQUIRE(solver.timeLimit() == 7.5);
    REQUIRE_FALSE(solver.timeLimit(TimingType::CPU).has_value());
}

// ============================================================================
// SECTION E: NAMES
// ============================================================================

/**
 * @test Solver::NameResolution
 * @brief Per-format namer, then global namer, then the problem's namer
 *
 * @scenario Problem namer "p_", global namer "g_", MPS namer "m_"
 */
TEST_CASE("E1: Solver::NameResolution", "[solver][names]")
{
    auto prefixed = [](std::string prefix) {
        return VariableNamer([prefix](const Variable& v) -> std::optional<std::string> {
            return prefix + v.description();
        });
    };

    MPBuilder mp = examples::oneFourThree();
    mp.setVariablesNamer(prefixed("p_"));
    const Variable x = mp.variable("x");
    const Constraint c1 = mp.constraints()[0];

    FakeSolver solver;
    solver.setProblem(mp);
    REQUIRE(solver.variableName(x) == "p_x");
    REQUIRE(solver.variableName(x, FileFormat::MPS) == "p_x");
    REQUIRE(solver.constraintName(c1) == "c1");

    Parameters p;
    p.setVariablesNamer(prefixed("g_"));
    p.setVariablesNamer(FileFormat::MPS, prefixed("m_"));
    p.setConstraintsNamer(FileFormat::LP, ConstraintNamer([](const Constraint&) -> std::optional<std::string> {
        return std::nullopt;
    }));
    solver.setParameters(p);

    REQUIRE(solver.variableName(x) == "g_x");
    REQUIRE(solver.variableName(x, FileFormat::MPS) == "m_x");
    REQUIRE(solver.variableName(x, FileFormat::LP) == "g_x");
    REQUIRE(solver.constraintName(c1, FileFormat::LP) == "");
    REQUIRE(solver.constraintName(c1, FileFormat::MPS) == "c1");
}

TEST_CASE("E2: Solver::FreeResolvers", "[solver][names]")
{
    const MPBuilder mp = examples::oneFourThree();
    const Variable y = mp.variable("y");

    Parameters p;
    REQUIRE(resolveVariableName(y, FileFormat::GUROBI_LP, p, mp) == "y");
    REQUIRE(resolveConstraintName(mp.constraints()[2], std::nullopt, p, mp) == "c3");

    p.setVariablesNamer(FileFormat::GUROBI_LP, VariableNamer([](const Variable&) -> std::optional<std::string> {
        return std::nullopt;
    }));
    REQUIRE(resolveVariableName(y, FileFormat::GUROBI_LP, p, mp) == "");
    REQUIRE(resolveVariableName(y, FileFormat::MPS, p, mp) == "y");
}

// ============================================================================
// SECTION F: ENGINE HAND-OVER
// ============================================================================

/**
 * @test Solver::HandOverFreezesConfiguration
 * @brief After hand-over setProblem and setParameters fail; solve still runs
 */
TEST_CASE("F1: Solver::HandOverFreezesConfiguration", "[solver][handover]")
{
    FakeSolver solver;
    REQUIRE_THROWS_AS(solver.handOver(), StatePrecondition);

    solver.script = [](const IMP& mp) { return optimal(mp); };
    solver.setProblem(examples::oneFourThree());
    solver.handOver();

    REQUIRE_THROWS_AS(solver.setProblem(examples::oneFourThreeLowX()), StatePrecondition);
    REQUIRE_THROWS_AS(solver.setParameters(Parameters()), StatePrecondition);
    REQUIRE(solver.problem() == examples::oneFourThree());

    REQUIRE(solver.solve() == ResultStatus::OPTIMAL);
    REQUIRE(solver.result().solution()->objectiveValue() == 6266);
}
