#pragma once
/*
===============================================================================
DIAGNOSTICS — Program analysis and human-readable dumps
===============================================================================

Overview
--------
Utilities for looking at programs and solutions, independent of any engine:

    * Program statistics (variable counts by kind, constraints, non-zeros)
    * Solution quality metrics (constraint, bound and integrality violations)
    * Compact text dumps of programs and solutions for manual inspection

Design Philosophy
-----------------
1. Free functions over IMP and Solution, usable with any engine adapter
2. Lightweight result structs for returning diagnostic data
3. Kinds and bounds are read through variableKind()/variableBounds(), so views
   are reported the way engines see them

Typical Usage
-------------
    MPBuilder mp = examples::oneFourThree();

    std::cout << mpkit::modelSummary(mp) << "\n";
    // 'OneFourThree': 2 vars (2 int), 3 constrs

    GurobiSolver solver;
    solver.setProblem(mp);
    if (foundFeasible(solver.solve())) {
        const Solution& s = *solver.result().solution();
        std::cout << mpkit::solutionToString(s) << "\n";
        // x ∈ (−∞..+∞) ∩ ℕ: 22
        // y ∈ (−∞..+∞) ∩ ℕ: 52
        // Objective value: 6266

        auto quality = mpkit::computeSolutionQuality(s);
        if (quality.maxConstrViolation > 1e-6)
            std::cout << "constraint violation detected\n";
    }

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <string>

#include "constraints.h"
#include "mp.h"
#include "result.h"
#include "variables.h"

namespace mpkit {

// =============================================================================
// MODEL STATISTICS
// =============================================================================

/**
 * @brief Snapshot of program size and composition
 */
struct ModelStatistics {
    std::size_t numVars = 0;        ///< Total number of variables
    std::size_t numConstrs = 0;     ///< Total number of constraints
    std::size_t numBinary = 0;      ///< Number of BOOL variables
    std::size_t numInteger = 0;     ///< Number of INT variables
    std::size_t numContinuous = 0;  ///< Number of REAL variables
    std::size_t numNonZeros = 0;    ///< Number of terms over all constraint left-hand sides
};

/**
 * @brief Compute statistics for a program
 *
 * @example
 *     auto stats = computeStatistics(mp);
 *     std::cout << "Vars: " << stats.numVars
 *               << ", Binary: " << stats.numBinary << "\n";
 */
inline ModelStatistics computeStatistics(const IMP& mp) {
    ModelStatistics stats;

    stats.numVars = mp.variables().size();
    stats.numConstrs = mp.constraints().size();
    for (const auto& v : mp.variables()) {
        switch (mp.variableKind(v)) {
            case VariableKind::BOOL:  ++stats.numBinary; break;
            case VariableKind::INT:   ++stats.numInteger; break;
            case VariableKind::REAL:  ++stats.numContinuous; break;
            case VariableKind::COUNT: break;
        }
    }
    for (const auto& c : mp.constraints())
        stats.numNonZeros += c.lhs().size();

    return stats;
}

/// @brief True if the program has no BOOL or INT variable
inline bool isLP(const IMP& mp) {
    auto stats = computeStatistics(mp);
    return stats.numBinary == 0 && stats.numInteger == 0;
}

/// @brief True if the program has a BOOL or INT variable
inline bool isMIP(const IMP& mp) {
    return !isLP(mp);
}

/**
 * @brief Brief summary of a program
 * @return Summary string like "'knapsack': 100 vars (50 bin, 10 int), 200 constrs"
 */
inline std::string modelSummary(const IMP& mp) {
    auto stats = computeStatistics(mp);
    MPDimension dimension(stats.numBinary, stats.numInteger, stats.numContinuous, stats.numConstrs);
    return std::format("'{}': {}", mp.name(), dimension.toString());
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

/**
 * @brief Violation metrics of a solution against its own program
 *
 * @details Useful to validate solutions after time-limited solves or when
 *          engine tolerances are loose.
 */
struct SolutionQuality {
    double maxConstrViolation = 0.0;  ///< Maximum constraint violation
    double sumConstrViolation = 0.0;  ///< Sum of all constraint violations
    double maxBoundViolation = 0.0;   ///< Maximum variable bound violation
    double maxIntViolation = 0.0;     ///< Maximum distance to the nearest integer
};

/**
 * @brief Compute solution quality metrics
 *
 * @example
 *     auto quality = computeSolutionQuality(solution);
 *     if (quality.maxIntViolation > 1e-6) { ... }
 */
inline SolutionQuality computeSolutionQuality(const Solution& solution) {
    SolutionQuality quality;
    const IMP& mp = solution.mp();
    auto valueOf = [&solution](const Variable& v) { return solution.value(v); };

    for (const auto& c : mp.constraints()) {
        const double lhs = c.lhs().evaluate(valueOf);
        double violation = 0.0;
        switch (c.op()) {
            case ComparisonOperator::LE:    violation = std::max(0.0, lhs - c.rhs()); break;
            case ComparisonOperator::GE:    violation = std::max(0.0, c.rhs() - lhs); break;
            case ComparisonOperator::EQ:    violation = std::fabs(lhs - c.rhs()); break;
            case ComparisonOperator::COUNT: break;
        }
        quality.maxConstrViolation = std::max(quality.maxConstrViolation, violation);
        quality.sumConstrViolation += violation;
    }

    for (const auto& v : mp.variables()) {
        const double x = solution.value(v);
        const Bounds bounds = mp.variableBounds(v);
        const double boundViolation = std::max({0.0, bounds.lower() - x, x - bounds.upper()});
        quality.maxBoundViolation = std::max(quality.maxBoundViolation, boundViolation);
        if (isInteger(mp.variableKind(v)))
            quality.maxIntViolation = std::max(quality.maxIntViolation, std::fabs(x - std::round(x)));
    }

    return quality;
}

// =============================================================================
// TEXT DUMPS
// =============================================================================

/**
 * @brief One line per variable with its range and value, then the objective value
 *
 * @details Lines are '\n' separated, in program order; the result does not end
 *          with '\n':
 *
 *              b BOOL: 1
 *              x ∈ (−∞..+∞) ∩ ℕ: 22
 *              z ∈ (−∞..+∞): 3.5
 *              Objective value: 6266
 */
inline std::string solutionToString(const Solution& solution) {
    std::string out;
    for (const auto& v : solution.mp().variables()) {
        const double x = solution.value(v);
        switch (v.kind()) {
            case VariableKind::BOOL:
                out += std::format("{} BOOL: {}\n", v.description(), x);
                break;
            case VariableKind::INT:
                out += std::format("{} ∈ {} ∩ ℕ: {}\n", v.description(), v.bounds().toString(), x);
                break;
            case VariableKind::REAL:
            case VariableKind::COUNT:
                out += std::format("{} ∈ {}: {}\n", v.description(), v.bounds().toString(), x);
                break;
        }
    }
    out += std::format("Objective value: {}", solution.objectiveValue());
    return out;
}

/**
 * @brief Program in reading order: name, objective, constraints, variables
 *
 * @example
 *     OneFourThree
 *     MAX 143×x + 60×y
 *     c1: 120×x + 210×y ≤ 15000
 *     ...
 *     x ∈ (−∞..+∞) ∩ ℕ
 */
inline std::string problemToString(const IMP& mp) {
    std::string out = mp.name() + "\n" + mp.objective().toString() + "\n";
    for (const auto& c : mp.constraints())
        out += c.toString() + "\n";
    for (const auto& v : mp.variables()) {
        switch (mp.variableKind(v)) {
            case VariableKind::BOOL:
                out += std::format("{} BOOL\n", v.description());
                break;
            case VariableKind::INT:
                out += std::format("{} ∈ {} ∩ ℕ\n", v.description(), mp.variableBounds(v).toString());
                break;
            case VariableKind::REAL:
            case VariableKind::COUNT:
                out += std::format("{} ∈ {}\n", v.description(), mp.variableBounds(v).toString());
                break;
        }
    }
    return out;
}

} // namespace mpkit
