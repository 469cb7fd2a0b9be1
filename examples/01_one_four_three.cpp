/*
================================================================================
EXAMPLE 01: ONE FOUR THREE - Integer Programming Basics
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Integer Programming (IP)

PROBLEM DESCRIPTION
-------------------
Two integer activities x and y share three resources. The program maximizes
the total return; it is small enough to check by hand and is used throughout
mpkit as a reference. The second part adds the bound x <= 16 and solves again
with the same solver.

MATHEMATICAL MODEL
------------------
Variables:
    x, y integer (unbounded)

Objective:
    max  143 x + 60 y

Constraints:
    c1:  120 x + 210 y <= 15000
    c2:  110 x +  30 y <=  4000
    c3:      x +     y <=    75

Optimum: x = 22, y = 52, objective 6266. With x <= 16: 5828.

FEATURES DEMONSTRATED
---------------------
- examples::oneFourThree()        Reference programs
- problemToString(), modelSummary() Text dumps
- Parameters                      Wall-clock limit, threads
- GurobiSolver::solve()           Canonical status
- Result, Duration                Solution and timings
- setLogLevel()                   Library logging

================================================================================
*/

#include <exception>
#include <iostream>

#include <mpkit/mpkit.h>
#include <mpkit/gurobi_solver.h>

using namespace mpkit;

namespace {

    void report(GurobiSolver& solver)
    {
        const ResultStatus status = solver.solve();
        const Result result = solver.result();

        std::cout << "Status: " << toString(status) << "\n";
        std::cout << "Time:   " << result.duration().toString() << "\n";
        if (result.hasSolution()) {
            std::cout << solutionToString(*result.solution()) << "\n";
        }
        std::cout << "\n";
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main()
{
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: OneFourThree\n";
    std::cout << "================================================================\n\n";

    try {
        setLogLevel(spdlog::level::info);

        const MPBuilder mp = examples::oneFourThree();
        std::cout << "PROBLEM\n";
        std::cout << "-------\n";
        std::cout << problemToString(mp) << "\n";
        std::cout << modelSummary(mp) << "\n\n";

        Parameters params;
        params.set(DoubleParameter::MAX_WALL_SECONDS, 30.0);
        params.set(IntParameter::MAX_THREADS, 1);

        GurobiSolver solver;
        solver.setParameters(params);

        std::cout << "SOLVING\n";
        std::cout << "-------\n";
        solver.setProblem(mp);
        report(solver);

        std::cout << "SOLVING WITH x <= 16\n";
        std::cout << "--------------------\n";
        solver.setProblem(examples::oneFourThreeLowX());
        report(solver);

    } catch (const EngineFailure& e) {
        std::cerr << "Gurobi error " << e.code() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
