/*
================================================================================
EXAMPLE 02: PRODUCTION PLANNING - Linear Programming and Duals
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Linear Programming (LP)

PROBLEM DESCRIPTION
-------------------
A factory produces 3 products using 2 machines. Each product requires
different processing hours on each machine. The factory maximizes total
profit subject to machine capacity constraints, then reads the shadow price
of each machine hour.

MATHEMATICAL MODEL
------------------
Sets:
    P = {0, 1, 2}       Products
    M = {0, 1}          Machines

Variables:
    make[p] >= 0        Units of product p (continuous)

Objective:
    max  sum_{p in P} profit[p] * make[p]

Constraints:
    capacity[m]:  sum_{p in P} hours[m,p] * make[p] <= capacity[m]   for all m

FEATURES DEMONSTRATED
---------------------
- Variable::of(name, domain, bounds, refs...)  Indexed variables
- sum(range, lambda)                           Summation notation
- Solution::dual()                             Constraint duals
- GurobiSolver hooks                           Engine-specific parameters
- computeSolutionQuality()                     Feasibility check

================================================================================
*/

#include <exception>
#include <iomanip>
#include <iostream>
#include <ranges>
#include <string>
#include <vector>

#include <mpkit/mpkit.h>
#include <mpkit/gurobi_solver.h>

using namespace mpkit;

// ============================================================================
// SOLVER WITH ENGINE-SPECIFIC TUNING
// ============================================================================
class TightLpSolver : public GurobiSolver {
protected:
    void addParameters() override
    {
        GurobiSolver::addParameters();
        model().set(GRB_DoubleParam_OptimalityTol, 1e-9);
        model().set(GRB_IntParam_Method, GRB_METHOD_DUAL);
    }
};

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main()
{
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Production Planning LP\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        const std::vector<std::string> productNames = {"Product A", "Product B", "Product C"};
        const std::vector<double> profit = {30.0, 50.0, 40.0};

        //                                     Prod A  Prod B  Prod C
        const std::vector<std::vector<double>> hours = {
            {1.0, 2.0, 3.0},   // Machine 0 (Cutting)
            {2.0, 1.0, 3.0}    // Machine 1 (Assembly)
        };
        const std::vector<double> capacity = {100.0, 80.0};
        const std::vector<std::string> machineNames = {"Cutting", "Assembly"};

        const int nProducts = static_cast<int>(profit.size());
        const int nMachines = static_cast<int>(capacity.size());
        const auto P = std::views::iota(0, nProducts);
        const auto M = std::views::iota(0, nMachines);

        // ====================================================================
        // BUILD PROGRAM
        // ====================================================================
        MPBuilder mp("production");

        std::vector<Variable> make;
        for (int p : P)
            make.push_back(Variable::of("make", VariableDomain::REAL, Bounds::nonNegative(), p));

        mp.setObjective(Objective::max(sum(P, [&](int p) { return profit[p] * make[p]; })));

        std::vector<Constraint> capacityConstrs;
        for (int m : M) {
            capacityConstrs.push_back(Constraint::le(
                describe("capacity", m),
                sum(P, [&](int p) { return hours[m][p] * make[p]; }),
                capacity[m]));
            mp.add(capacityConstrs.back());
        }

        std::cout << modelSummary(mp) << "\n\n";

        // ====================================================================
        // SOLVE
        // ====================================================================
        TightLpSolver solver;
        solver.setProblem(mp);
        const ResultStatus status = solver.solve();
        std::cout << "Status: " << toString(status) << "\n";

        const Result result = solver.result();
        if (!result.hasSolution())
            return 1;
        const Solution& solution = *result.solution();

        // ====================================================================
        // DISPLAY RESULTS
        // ====================================================================
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "\nOPTIMAL SOLUTION\n";
        std::cout << "----------------\n";
        std::cout << "Maximum Profit: $" << solution.objectiveValue() << "\n";
        std::cout << "Runtime: " << result.duration().preferred() << " seconds\n\n";

        std::cout << "Production Plan:\n";
        for (int p : P) {
            const double units = solution.value(make[p]);
            std::cout << "  " << std::setw(12) << productNames[p]
                      << ": " << std::setw(8) << units << " units"
                      << " (contributes $" << profit[p] * units << ")\n";
        }

        std::cout << "\nMachine Hour Prices:\n";
        for (int m : M) {
            const auto price = solution.dual(capacityConstrs[m]);
            std::cout << "  " << std::setw(12) << machineNames[m] << ": ";
            if (price)
                std::cout << "$" << *price << " per hour\n";
            else
                std::cout << "n/a\n";
        }

        const auto quality = computeSolutionQuality(solution);
        std::cout << "\nMax constraint violation: " << quality.maxConstrViolation << "\n";

    } catch (const EngineFailure& e) {
        std::cerr << "Gurobi error " << e.code() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
