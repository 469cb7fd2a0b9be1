/*
================================================================================
EXAMPLE 03: KNAPSACK - Views, Names and Engine Hand-over
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: Binary Integer Programming

PROBLEM DESCRIPTION
-------------------
A hiker selects items to pack. Each item has a value and a weight; the pack
carries at most 15 kg. The program is solved twice: once as built, and once
through MPWithTransformedBoolsView, which presents the booleans to Gurobi as
integers over [0,1]. The second solver hands its native model over, which is
exported to an LP file with engine names chosen by a GUROBI_LP namer.

MATHEMATICAL MODEL
------------------
Variables:
    take[i] in {0,1}     Whether item i is packed

Objective:
    max  sum_i value[i] * take[i]

Constraints:
    capacity:  sum_i weight[i] * take[i] <= 15

FEATURES DEMONSTRATED
---------------------
- Variable::boolean()                   Binary variables
- MPWithTransformedBoolsView            Engine-facing view of a program
- Parameters::setVariablesNamer()       Per-format naming
- GurobiSolver::underlyingEngine()      Native model access
- computeStatistics()                   Program statistics

================================================================================
*/

#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <mpkit/mpkit.h>
#include <mpkit/gurobi_solver.h>

using namespace mpkit;

int main()
{
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 03: Knapsack\n";
    std::cout << "================================================================\n\n";

    try {
        const std::vector<std::string> items = {"tent", "stove", "camera", "book", "rope", "food"};
        const std::vector<double> value = {10, 7, 5, 2, 4, 9};
        const std::vector<double> weight = {6, 3, 2, 1, 2, 5};

        MPBuilder mp("knapsack");
        std::vector<Variable> take;
        for (const auto& item : items)
            take.push_back(Variable::boolean("take", item));

        SumTermsBuilder total;
        SumTermsBuilder load;
        for (std::size_t i = 0; i < items.size(); ++i) {
            total.add(value[i], take[i]);
            load.add(weight[i], take[i]);
        }
        mp.setObjective(Objective::max(total.build()));
        mp.add(Constraint::le("capacity", load.build(), 15));

        // ====================================================================
        // PLAIN SOLVE
        // ====================================================================
        GurobiSolver solver;
        solver.setProblem(mp);
        std::cout << "As built:       " << toString(solver.solve()) << "\n";

        const auto stats = computeStatistics(mp);
        std::cout << "  " << stats.numBinary << " binary, " << stats.numInteger << " integer\n";

        // ====================================================================
        // SOLVE THROUGH THE VIEW
        // ====================================================================
        const MPWithTransformedBoolsView view(mp);
        const auto viewStats = computeStatistics(view);

        Parameters params;
        params.setVariablesNamer(FileFormat::GUROBI_LP, VariableNamer([](const Variable& v) -> std::optional<std::string> {
            return "pack_" + v.refs().front();
        }));

        GurobiSolver viewSolver;
        viewSolver.setParameters(params);
        viewSolver.setProblem(view);
        std::cout << "Through view:   " << toString(viewSolver.solve()) << "\n";
        std::cout << "  " << viewStats.numBinary << " binary, " << viewStats.numInteger << " integer\n\n";

        const Result result = viewSolver.result();
        if (!result.hasSolution())
            return 1;
        const Solution& solution = *result.solution();

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "Packed (value " << solution.objectiveValue() << "):\n";
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (solution.booleanValue(take[i]))
                std::cout << "  " << std::setw(8) << items[i] << "  " << weight[i] << " kg\n";
        }

        // ====================================================================
        // HAND-OVER
        // ====================================================================
        GRBModel& model = viewSolver.underlyingEngine();
        model.write("knapsack.lp");
        std::cout << "\nWrote knapsack.lp\n";

    } catch (const EngineFailure& e) {
        std::cerr << "Gurobi error " << e.code() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
