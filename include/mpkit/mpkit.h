#pragma once
/*
===============================================================================
MPKIT — Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header for the engine-independent part of mpkit: the value
model, the program builder and its views, parameters, results and the solver
facade. Engine adapters are included separately, so that this header never
pulls in an engine SDK:

    #include <mpkit/mpkit.h>
    #include <mpkit/gurobi_solver.h>      // requires Gurobi

WHAT'S INCLUDED
---------------
• errors.h       — Exception hierarchy
• logging.h      — spdlog-backed library logger
• enum_utils.h   — Compile-time enum helpers (DECLARE_ENUM_WITH_COUNT)
• naming.h       — Descriptions, namers, file formats
• variables.h    — Variable, Bounds, domains and kinds
• expressions.h  — Term, SumTerms, sum()
• constraints.h  — Constraint, ComparisonOperator
• objective.h    — Objective, Sense
• mp.h           — IMP, IMutableMP, MPBuilder, MPDimension
• views.h        — MPForwarder, MPReadView, ImmutableMP, MPWithTransformedBoolsView
• parameters.h   — Parameters, timing resolution
• result.h       — ResultStatus, canonicalize(), Duration, Solution, Result
• timing.h       — TimingHelper
• solver.h       — Solver facade
• diagnostics.h  — Statistics, solution quality, text dumps
• examples.h     — OneFourThree

QUICK START
-----------
    #include <mpkit/mpkit.h>
    #include <mpkit/gurobi_solver.h>

    int main() {
        using namespace mpkit;

        MPBuilder mp("OneFourThree");
        auto x = Variable::integer("x");
        auto y = Variable::integer("y");
        mp.setObjective(Objective::max(143 * x + 60 * y));
        mp.add(Constraint::le("c1", 120 * x + 210 * y, 15000));
        mp.add(Constraint::le("c2", 110 * x + 30 * y, 4000));
        mp.add(Constraint::le("c3", x + y, 75));

        GurobiSolver solver;
        solver.setProblem(mp);
        if (foundFeasible(solver.solve()))
            std::cout << solutionToString(*solver.result().solution()) << "\n";
        return 0;
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) with <format>
• spdlog
• Gurobi Optimizer 10.0+ with C++ API, for the Gurobi adapter only

NAMESPACE
---------
All components are in the `mpkit::` namespace; example programs are in
`mpkit::examples::`.

CONFIGURATION
-------------
• MPKIT_LOG_LEVEL (spdlog level number) selects the initial log level;
  warn by default.

===============================================================================
*/

// ============================================================================
// CORE COMPONENTS (order matters for dependencies)
// ============================================================================

// Errors and logging (no dependencies)
#include "errors.h"
#include "logging.h"

// Enum utilities (no dependencies, used by every enum-keyed table)
#include "enum_utils.h"

// Naming (descriptions, namers)
#include "naming.h"

// Value model
#include "variables.h"
#include "expressions.h"
#include "constraints.h"
#include "objective.h"

// ============================================================================
// PROGRAMS
// ============================================================================

#include "mp.h"
#include "views.h"

// ============================================================================
// SOLVER PROTOCOL
// ============================================================================

#include "parameters.h"
#include "result.h"
#include "timing.h"
#include "solver.h"

// ============================================================================
// UTILITIES
// ============================================================================

#include "diagnostics.h"
#include "examples.h"
