#pragma once
/*
===============================================================================
RESULT — Canonical statuses, durations, solutions and solve results
===============================================================================

OVERVIEW
--------
Engines report outcomes in their own vocabularies. Each engine adapter
declares a StatusTable mapping its native codes to a small set of
EngineOutcome values; canonicalize() then turns (outcome, solution presence,
objective completeness) into one ResultStatus.

    SOLVED_OPTIMAL   -> OPTIMAL, or FEASIBLE under the zero objective
    SOLVED_FEASIBLE  -> FEASIBLE
    INFEASIBLE, INFEASIBLE_OR_UNBOUNDED, UNBOUNDED -> same name
    TIME_LIMIT       -> TIME_LIMIT_REACHED_{WITH,NO}_SOLUTION
    MEMORY_LIMIT     -> MEMORY_LIMIT_REACHED_{WITH,NO}_SOLUTION
    unknown code     -> ERROR_{WITH,NO}_SOLUTION

An engine claiming optimality for the zero objective has only found a
feasible point, hence the downgrade.

KEY COMPONENTS
--------------
• ResultStatus / foundFeasible()  : canonical statuses
• EngineOutcome / StatusTable     : per-engine status vocabulary
• canonicalize()                  : the mapping above
• Duration                        : wall, thread CPU and engine-reported times
• Solution                        : values of every variable of one program
• Result                          : status, duration, parameters, solution

INVARIANTS
----------
• A Solution carries a value for every variable of its program and for no
  other variable.
• A Result carries a solution iff foundFeasible(status).

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "errors.h"
#include "mp.h"
#include "parameters.h"
#include "views.h"

namespace mpkit {

    // ========================================================================
    // STATUS
    // ========================================================================

    DECLARE_ENUM_WITH_COUNT(ResultStatus,
        OPTIMAL,
        FEASIBLE,
        INFEASIBLE,
        INFEASIBLE_OR_UNBOUNDED,
        UNBOUNDED,
        TIME_LIMIT_REACHED_WITH_SOLUTION,
        TIME_LIMIT_REACHED_NO_SOLUTION,
        MEMORY_LIMIT_REACHED_WITH_SOLUTION,
        MEMORY_LIMIT_REACHED_NO_SOLUTION,
        ERROR_WITH_SOLUTION,
        ERROR_NO_SOLUTION);

    inline std::string toString(ResultStatus status)
    {
        switch (status) {
            case ResultStatus::OPTIMAL:                            return "OPTIMAL";
            case ResultStatus::FEASIBLE:                           return "FEASIBLE";
            case ResultStatus::INFEASIBLE:                         return "INFEASIBLE";
            case ResultStatus::INFEASIBLE_OR_UNBOUNDED:            return "INFEASIBLE_OR_UNBOUNDED";
            case ResultStatus::UNBOUNDED:                          return "UNBOUNDED";
            case ResultStatus::TIME_LIMIT_REACHED_WITH_SOLUTION:   return "TIME_LIMIT_REACHED_WITH_SOLUTION";
            case ResultStatus::TIME_LIMIT_REACHED_NO_SOLUTION:     return "TIME_LIMIT_REACHED_NO_SOLUTION";
            case ResultStatus::MEMORY_LIMIT_REACHED_WITH_SOLUTION: return "MEMORY_LIMIT_REACHED_WITH_SOLUTION";
            case ResultStatus::MEMORY_LIMIT_REACHED_NO_SOLUTION:   return "MEMORY_LIMIT_REACHED_NO_SOLUTION";
            case ResultStatus::ERROR_WITH_SOLUTION:                return "ERROR_WITH_SOLUTION";
            case ResultStatus::ERROR_NO_SOLUTION:                  return "ERROR_NO_SOLUTION";
            case ResultStatus::COUNT:                              break;
        }
        return "UNKNOWN";
    }

    /// @brief True iff the status comes with a feasible solution
    constexpr bool foundFeasible(ResultStatus status) noexcept
    {
        switch (status) {
            case ResultStatus::OPTIMAL:
            case ResultStatus::FEASIBLE:
            case ResultStatus::TIME_LIMIT_REACHED_WITH_SOLUTION:
            case ResultStatus::MEMORY_LIMIT_REACHED_WITH_SOLUTION:
            case ResultStatus::ERROR_WITH_SOLUTION:
                return true;
            default:
                return false;
        }
    }

    // ========================================================================
    // CANONICALIZATION
    // ========================================================================

    DECLARE_ENUM_WITH_COUNT(EngineOutcome,
        SOLVED_OPTIMAL,
        SOLVED_FEASIBLE,
        INFEASIBLE,
        INFEASIBLE_OR_UNBOUNDED,
        UNBOUNDED,
        TIME_LIMIT,
        MEMORY_LIMIT);

    /// @brief Native engine status code to outcome
    using StatusTable = std::map<int, EngineOutcome>;

    /**
     * @brief Canonical status of an engine run
     *
     * @param table             The engine's status table
     * @param code              Native status code reported by the engine
     * @param hasSolution       Whether the engine produced a solution
     * @param objectiveComplete Whether the program has a non-zero objective
     */
    inline ResultStatus canonicalize(const StatusTable& table, int code, bool hasSolution, bool objectiveComplete)
    {
        auto it = table.find(code);
        if (it == table.end())
            return hasSolution ? ResultStatus::ERROR_WITH_SOLUTION : ResultStatus::ERROR_NO_SOLUTION;

        switch (it->second) {
            case EngineOutcome::SOLVED_OPTIMAL:
                return objectiveComplete ? ResultStatus::OPTIMAL : ResultStatus::FEASIBLE;
            case EngineOutcome::SOLVED_FEASIBLE:
                return ResultStatus::FEASIBLE;
            case EngineOutcome::INFEASIBLE:
                return ResultStatus::INFEASIBLE;
            case EngineOutcome::INFEASIBLE_OR_UNBOUNDED:
                return ResultStatus::INFEASIBLE_OR_UNBOUNDED;
            case EngineOutcome::UNBOUNDED:
                return ResultStatus::UNBOUNDED;
            case EngineOutcome::TIME_LIMIT:
                return hasSolution ? ResultStatus::TIME_LIMIT_REACHED_WITH_SOLUTION
                                   : ResultStatus::TIME_LIMIT_REACHED_NO_SOLUTION;
            case EngineOutcome::MEMORY_LIMIT:
                return hasSolution ? ResultStatus::MEMORY_LIMIT_REACHED_WITH_SOLUTION
                                   : ResultStatus::MEMORY_LIMIT_REACHED_NO_SOLUTION;
            case EngineOutcome::COUNT:
                break;
        }
        return hasSolution ? ResultStatus::ERROR_WITH_SOLUTION : ResultStatus::ERROR_NO_SOLUTION;
    }

    // ========================================================================
    // DURATION
    // ========================================================================

    /**
     * @class Duration
     * @brief Time spent in one solve, in seconds
     *
     * @details wall is measured around the whole solve; threadCpu is the CPU
     *          time of the calling thread; solverWall and solverCpu are the
     *          times the engine itself reports, when it does.
     */
    class Duration {
        double wall_ = 0.0;
        std::optional<double> threadCpu_;
        std::optional<double> solverWall_;
        std::optional<double> solverCpu_;

        static void check(const char* which, double value)
        {
            if (!std::isfinite(value) || value < 0.0)
                throw InvalidArgument(std::format("duration: {} time {} must be finite and >= 0", which, value));
        }

        static void check(const char* which, const std::optional<double>& value)
        {
            if (value)
                check(which, *value);
        }

    public:
        Duration() = default;

        /// @throws InvalidArgument on a negative or non-finite time
        explicit Duration(double wall,
                          std::optional<double> threadCpu = std::nullopt,
                          std::optional<double> solverWall = std::nullopt,
                          std::optional<double> solverCpu = std::nullopt)
            : wall_(wall), threadCpu_(threadCpu), solverWall_(solverWall), solverCpu_(solverCpu)
        {
            check("wall", wall_);
            check("thread CPU", threadCpu_);
            check("solver wall", solverWall_);
            check("solver CPU", solverCpu_);
        }

        double wall() const noexcept { return wall_; }
        const std::optional<double>& threadCpu() const noexcept { return threadCpu_; }
        const std::optional<double>& solverWall() const noexcept { return solverWall_; }
        const std::optional<double>& solverCpu() const noexcept { return solverCpu_; }

        /// @brief Solver CPU, else solver wall, else wall
        double preferred() const noexcept
        {
            if (solverCpu_)
                return *solverCpu_;
            if (solverWall_)
                return *solverWall_;
            return wall_;
        }

        std::string toString() const
        {
            std::string out = std::format("wall {:.3f}s", wall_);
            if (threadCpu_)
                out += std::format(", cpu {:.3f}s", *threadCpu_);
            if (solverWall_)
                out += std::format(", solver wall {:.3f}s", *solverWall_);
            if (solverCpu_)
                out += std::format(", solver cpu {:.3f}s", *solverCpu_);
            return out;
        }

        friend bool operator==(const Duration&, const Duration&) = default;
    };

    // ========================================================================
    // SOLUTION
    // ========================================================================

    /**
     * @class Solution
     * @brief Objective value and variable values for one program
     *
     * @details Keeps an immutable copy of the program it solves, shared
     *          between copies of the solution.
     */
    class Solution {
        std::shared_ptr<const ImmutableMP> mp_;
        double objectiveValue_ = 0.0;
        std::unordered_map<Variable, double> values_;
        std::unordered_map<Constraint, double> duals_;

        Solution(std::shared_ptr<const ImmutableMP> mp,
                 double objectiveValue,
                 std::unordered_map<Variable, double> values,
                 std::unordered_map<Constraint, double> duals)
            : mp_(std::move(mp)),
              objectiveValue_(objectiveValue == 0.0 ? 0.0 : objectiveValue),
              values_(std::move(values)),
              duals_(std::move(duals))
        {
        }

    public:
        /**
         * @brief Solution of mp
         *
         * @param mp             Program solved; copied
         * @param objectiveValue Objective value reported by the engine
         * @param values         One finite value per variable of mp
         * @param duals          Optional dual values, keyed by constraints of mp
         *
         * @throws InvalidArgument if the objective value is not finite, is not
         *         0 under the zero objective, if values miss or add variables,
         *         if duals name foreign constraints, or on a non-finite value
         */
        static Solution of(const IMP& mp,
                           double objectiveValue,
                           std::unordered_map<Variable, double> values,
                           std::unordered_map<Constraint, double> duals = {})
        {
            if (!std::isfinite(objectiveValue))
                throw InvalidArgument(std::format("solution: objective value {} is not finite", objectiveValue));
            if (mp.objective().isZero() && objectiveValue != 0.0)
                throw InvalidArgument(std::format(
                    "solution: objective value {} under the zero objective must be 0", objectiveValue));

            std::vector<std::string> extra;
            for (const auto& [v, value] : values) {
                if (!mp.containsVariable(v))
                    extra.push_back(v.description());
                else if (!std::isfinite(value))
                    throw InvalidArgument(std::format("solution: value {} of {} is not finite",
                                                      value, v.description()));
            }
            std::vector<std::string> missing;
            for (const auto& v : mp.variables()) {
                if (!values.contains(v))
                    missing.push_back(v.description());
            }
            if (!extra.empty() || !missing.empty()) {
                auto join = [](const std::vector<std::string>& items) {
                    std::string out;
                    for (const auto& item : items) {
                        if (!out.empty())
                            out += ", ";
                        out += item;
                    }
                    return out;
                };
                throw InvalidArgument(std::format(
                    "solution: values do not match the variables of '{}'; extra: [{}], missing: [{}]",
                    mp.name(), join(extra), join(missing)));
            }

            for (const auto& [c, value] : duals) {
                if (!mp.containsConstraint(c))
                    throw InvalidArgument(std::format("solution: dual value for foreign constraint {}",
                                                      c.toString()));
                if (!std::isfinite(value))
                    throw InvalidArgument(std::format("solution: dual value {} of {} is not finite",
                                                      value, c.toString()));
            }

            return Solution(std::make_shared<const ImmutableMP>(mp), objectiveValue,
                            std::move(values), std::move(duals));
        }

        const IMP& mp() const noexcept { return *mp_; }
        double objectiveValue() const noexcept { return objectiveValue_; }
        const std::unordered_map<Variable, double>& values() const noexcept { return values_; }
        const std::unordered_map<Constraint, double>& duals() const noexcept { return duals_; }

        /// @throws UnknownEntity if v is not a variable of the program
        double value(const Variable& v) const
        {
            auto it = values_.find(v);
            if (it == values_.end())
                throw UnknownEntity(std::format("solution: no value for variable {}", v.description()));
            return it->second;
        }

        /**
         * @brief Value of a BOOL variable as a boolean
         *
         * @throws UnknownEntity if v is not a variable of the program
         * @throws InvalidArgument if v is not BOOL or its value is not within
         *         1e-6 of 0 or 1
         */
        bool booleanValue(const Variable& v) const
        {
            const double x = value(v);
            if (v.kind() != VariableKind::BOOL)
                throw InvalidArgument(std::format("solution: {} is {}, not BOOL",
                                                  v.description(), mpkit::toString(v.kind())));
            if (std::fabs(x) < 1e-6)
                return false;
            if (std::fabs(x - 1.0) < 1e-6)
                return true;
            throw InvalidArgument(std::format("solution: {} has non-boolean value {}", v.description(), x));
        }

        /// @brief Dual value of a constraint, when the engine reported one
        std::optional<double> dual(const Constraint& c) const
        {
            auto it = duals_.find(c);
            if (it == duals_.end())
                return std::nullopt;
            return it->second;
        }

        /// @brief Objective function evaluated on the values; 0 under the zero objective
        double computedObjectiveValue() const
        {
            return mp_->objective().function().evaluate([this](const Variable& v) { return value(v); });
        }

        friend bool operator==(const Solution& a, const Solution& b)
        {
            return a.objectiveValue_ == b.objectiveValue_ && a.values_ == b.values_ && a.duals_ == b.duals_ &&
                   a.mp() == b.mp();
        }
    };

    // ========================================================================
    // RESULT
    // ========================================================================

    /**
     * @class Result
     * @brief Outcome of one solve: status, duration, parameters, solution
     */
    class Result {
        ResultStatus status_;
        Duration duration_;
        Parameters parameters_;
        std::optional<Solution> solution_;

        Result(ResultStatus status, Duration duration, Parameters parameters, std::optional<Solution> solution)
            : status_(status),
              duration_(std::move(duration)),
              parameters_(std::move(parameters)),
              solution_(std::move(solution))
        {
        }

    public:
        /// @throws InvalidArgument if foundFeasible(status)
        static Result noSolution(ResultStatus status, Duration duration, Parameters parameters)
        {
            if (foundFeasible(status))
                throw InvalidArgument(std::format("result: status {} requires a solution", toString(status)));
            return Result(status, std::move(duration), std::move(parameters), std::nullopt);
        }

        /// @throws InvalidArgument unless foundFeasible(status)
        static Result withSolution(ResultStatus status, Duration duration, Parameters parameters, Solution solution)
        {
            if (!foundFeasible(status))
                throw InvalidArgument(std::format("result: status {} cannot carry a solution", toString(status)));
            return Result(status, std::move(duration), std::move(parameters), std::move(solution));
        }

        ResultStatus status() const noexcept { return status_; }
        const Duration& duration() const noexcept { return duration_; }
        const Parameters& parameters() const noexcept { return parameters_; }
        const std::optional<Solution>& solution() const noexcept { return solution_; }

        /// @brief Present iff foundFeasible(status())
        bool hasSolution() const noexcept { return solution_.has_value(); }
    };

} // namespace mpkit
