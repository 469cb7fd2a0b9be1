#pragma once
/*
===============================================================================
SOLVER — Engine-independent solve workflow
===============================================================================

Overview
--------
Solver is the abstract facade every engine adapter derives from. It owns the
parameters and an immutable snapshot of the problem, and implements the
"template method" pattern:

    solve() {
        check a problem is set
        resolve the timing type        (may raise ConfigurationConflict)
        start timing
        raw = solveUnderlying();       (adapter hook)
        stop timing
        status = canonicalize(statusTable(), raw.code, ...)
    }

Adapters implement two hooks:

    statusTable()       native status code -> EngineOutcome
    solveUnderlying()   build, optimize and read back; returns a RawOutcome

and wrap their engine's exceptions into EngineFailure.

Name resolution
---------------
variableName(v, format) and constraintName(c, format) resolve through

    1. the per-format namer of the parameters, when format is given
    2. the global namer of the parameters
    3. the problem's own namer

and return "" when the namer yields no name.

Handing over the engine
-----------------------
Adapters expose their native engine object through a one-way operation
(underlyingEngine() in GurobiSolver). Once handed over, the parameters and
the problem are frozen: setParameters() and setProblem() raise
StatePrecondition. Further solves re-run the engine object as the caller
left it.

Typical Usage
-------------
    GurobiSolver solver;
    solver.setProblem(mp);
    Parameters p;
    p.set(DoubleParameter::MAX_WALL_SECONDS, 10.0);
    solver.setParameters(p);

    if (foundFeasible(solver.solve())) {
        const Result result = solver.result();
        double z = result.solution()->objectiveValue();
    }

===============================================================================
*/

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "errors.h"
#include "logging.h"
#include "mp.h"
#include "naming.h"
#include "parameters.h"
#include "result.h"
#include "timing.h"
#include "views.h"

namespace mpkit {

    /**
     * @brief What an engine adapter reports for one run
     *
     * @details solution is set iff the engine holds a solution after the run.
     *          Solver times are the engine's own measurements, in seconds.
     */
    struct RawOutcome {
        int code = 0;
        std::optional<Solution> solution;
        std::optional<double> solverWall;
        std::optional<double> solverCpu;
    };

    /**
     * @brief Name of a variable as an engine sees it
     *
     * @details Per-format namer of params (when format is given), else the
     *          global namer of params, else the namer of mp. Absent names
     *          become "".
     */
    inline std::string resolveVariableName(const Variable& v, std::optional<FileFormat> format,
                                           const Parameters& params, const IMP& mp)
    {
        return resolveName(v, format, params.variablesNamersByFormat(),
                           params.variablesNamer(), mp.variablesNamer());
    }

    /// @brief Constraint counterpart of resolveVariableName()
    inline std::string resolveConstraintName(const Constraint& c, std::optional<FileFormat> format,
                                             const Parameters& params, const IMP& mp)
    {
        return resolveName(c, format, params.constraintsNamersByFormat(),
                           params.constraintsNamer(), mp.constraintsNamer());
    }

    /*
    ===============================================================================
    SOLVER BASE
    ===============================================================================
    */
    class Solver {
        Parameters parameters_;
        std::unique_ptr<const ImmutableMP> problem_;

        std::optional<ResultStatus> status_;
        Duration duration_;
        Parameters solvedWith_;
        std::optional<Solution> solution_;

        bool handedOver_ = false;

        void checkNotHandedOver(const char* operation) const
        {
            if (handedOver_)
                throw StatePrecondition(std::format(
                    "{}: {} is not allowed after the engine was handed over", engineName(), operation));
        }

    public:
        Solver() = default;
        Solver(const Solver&) = delete;
        Solver& operator=(const Solver&) = delete;
        virtual ~Solver() = default;

        /// @brief Display name of the engine, used in messages
        virtual std::string engineName() const = 0;

        /// @brief Whether the engine can measure and limit CPU time
        virtual bool cpuTimingSupported() const { return TimingHelper::isCpuTimingSupported(); }

        // -------------------------------------------------------------------------
        // Problem and parameters
        // -------------------------------------------------------------------------

        /**
         * @brief Problem to solve; an immutable copy is kept
         *
         * @details Discards the result of any previous solve.
         * @throws StatePrecondition after the engine was handed over
         */
        void setProblem(const IMP& mp)
        {
            checkNotHandedOver("setProblem");
            problem_ = std::make_unique<const ImmutableMP>(mp);
            status_.reset();
            solution_.reset();
            problemChanged();
            logger()->debug("{}: problem '{}' set ({})", engineName(), mp.name(), mp.dimension().toString());
        }

        bool hasProblem() const noexcept { return problem_ != nullptr; }

        /// @throws StatePrecondition if no problem was set
        const IMP& problem() const
        {
            if (!problem_)
                throw StatePrecondition(std::format("{}: no problem set", engineName()));
            return *problem_;
        }

        const Parameters& parameters() const noexcept { return parameters_; }

        /**
         * @brief Replace every parameter
         *
         * @return true iff the parameters changed
         * @throws StatePrecondition after the engine was handed over
         */
        bool setParameters(const Parameters& parameters)
        {
            checkNotHandedOver("setParameters");
            return parameters_.setAll(parameters);
        }

        // -------------------------------------------------------------------------
        // Timing
        // -------------------------------------------------------------------------

        /// @see mpkit::preferredTimingType
        TimingType preferredTimingType() const
        {
            return mpkit::preferredTimingType(parameters_, cpuTimingSupported());
        }

        std::optional<double> timeLimit(TimingType type) const { return mpkit::timeLimit(parameters_, type); }

        /// @brief Limit for the preferred timing type
        std::optional<double> timeLimit() const { return timeLimit(preferredTimingType()); }

        // -------------------------------------------------------------------------
        // Names
        // -------------------------------------------------------------------------

        /// @throws StatePrecondition if no problem was set
        std::string variableName(const Variable& v, std::optional<FileFormat> format = std::nullopt) const
        {
            return resolveVariableName(v, format, parameters_, problem());
        }

        /// @throws StatePrecondition if no problem was set
        std::string constraintName(const Constraint& c, std::optional<FileFormat> format = std::nullopt) const
        {
            return resolveConstraintName(c, format, parameters_, problem());
        }

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Solve the current problem with the current parameters
         *
         * @return The canonical status
         * @throws StatePrecondition if no problem was set
         * @throws ConfigurationConflict, UnsupportedFeature from timing resolution
         * @throws EngineFailure when the engine fails
         */
        ResultStatus solve()
        {
            const IMP& mp = problem();
            const TimingType timing = preferredTimingType();
            logger()->debug("{}: solving '{}' with {} timing, parameters {}",
                            engineName(), mp.name(), toString(timing), parameters_.toString());

            status_.reset();
            solution_.reset();

            TimingHelper timer;
            timer.start();
            RawOutcome raw = solveUnderlying();
            timer.stop();
            if (raw.solverWall)
                timer.setSolverWall(*raw.solverWall);
            if (raw.solverCpu)
                timer.setSolverCpu(*raw.solverCpu);

            const ResultStatus status =
                canonicalize(statusTable(), raw.code, raw.solution.has_value(), mp.objective().isComplete());

            duration_ = timer.duration();
            solvedWith_ = parameters_;
            if (foundFeasible(status))
                solution_ = std::move(raw.solution);
            status_ = status;

            logger()->debug("{}: '{}' ({}) -> {} [native {}] in {}",
                            engineName(), mp.name(), mp.dimension().toString(),
                            toString(status), raw.code, duration_.toString());
            return status;
        }

        bool hasResult() const noexcept { return status_.has_value(); }

        /**
         * @brief Outcome of the last solve
         *
         * @throws StatePrecondition if no solve completed since the problem was set
         * @throws std::logic_error if a feasible status came without a solution
         */
        Result result() const
        {
            if (!status_)
                throw StatePrecondition(std::format("{}: no result, solve() has not been called", engineName()));
            if (!foundFeasible(*status_))
                return Result::noSolution(*status_, duration_, solvedWith_);
            detail::ensure(solution_.has_value(), "feasible status reported without a solution");
            return Result::withSolution(*status_, duration_, solvedWith_, *solution_);
        }

    protected:
        // -------------------------------------------------------------------------
        // Adapter hooks
        // -------------------------------------------------------------------------

        /// @brief Native status code to outcome; codes missing map to ERROR_*
        virtual const StatusTable& statusTable() const = 0;

        /// @brief Build, optimize and read back the problem()
        virtual RawOutcome solveUnderlying() = 0;

        /// @brief Called by setProblem(); adapters drop engine state built for the previous problem
        virtual void problemChanged() {}

        /// @brief Freeze parameters and problem; called by the adapter's hand-over
        void markHandedOver() noexcept { handedOver_ = true; }

        bool handedOver() const noexcept { return handedOver_; }
    };

} // namespace mpkit
