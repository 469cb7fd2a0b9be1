#pragma once
/*
===============================================================================
GUROBI SOLVER — Gurobi engine adapter
===============================================================================

Overview
--------
GurobiSolver binds the Solver workflow of solver.h to the Gurobi C++ API.
Each solve runs the same sequence of virtual hooks on a fresh GRBModel:

    initialize()                   (environment, once)
    solveUnderlying() {
        addVariables();
        addConstraints();
        addObjective();
        addParameters();
        beforeOptimize();
        model.optimize();
        afterOptimize();
        read status, solution, duals, runtime
    }

Derived adapters override the hooks to add engine-specific behavior (warm
starts, callbacks, extra parameters) without touching the workflow.

Mapping
-------
    variableKind BOOL / INT / REAL  ->  GRB_BINARY / GRB_INTEGER / GRB_CONTINUOUS
    infinite bound                  ->  -GRB_INFINITY / GRB_INFINITY
    names                           ->  variableName(v, FileFormat::GUROBI_LP)
    MAX / MIN                       ->  GRB_MAXIMIZE / GRB_MINIMIZE

    MAX_WALL_SECONDS  -> TimeLimit
    MAX_CPU_SECONDS   -> unsupported; Gurobi only limits wall-clock time
    MAX_THREADS       -> Threads
    MAX_MEMORY_MB     -> SoftMemLimit (GB)
    MAX_TREE_SIZE_MB  -> NodefileStart (GB)
    WORK_DIR          -> NodefileDir
    DETERMINISTIC     -> nothing; Gurobi runs are deterministic

A new setProblem() discards the model built for the previous problem, so
underlyingEngine() always hands over a model of the current problem.

Kinds and bounds are read from the problem's variableKind()/variableBounds(),
so an MPWithTransformedBoolsView is honored.

Dual values (Pi) are read for continuous models solved to optimality.

Error handling
--------------
Every GRBException is rethrown as EngineFailure carrying Gurobi's message and
error code.

Typical Usage
-------------
    GurobiSolver solver;
    solver.setProblem(examples::oneFourThree());
    solver.solve();                                 // OPTIMAL
    solver.result().solution()->objectiveValue();   // 6266

===============================================================================
*/

#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "gurobi_c++.h"

#include "errors.h"
#include "logging.h"
#include "mp.h"
#include "parameters.h"
#include "result.h"
#include "solver.h"

namespace mpkit {

    class GurobiSolver : public Solver {
        std::unique_ptr<GRBEnv> env_;
        std::unique_ptr<GRBModel> model_;

        std::vector<GRBVar> vars_;
        std::unordered_map<std::string, std::size_t> varIndex_;
        std::vector<GRBConstr> constrs_;

        static EngineFailure wrap(const GRBException& e)
        {
            return EngineFailure(std::format("gurobi: {}", e.getMessage()), e.getErrorCode());
        }

        void buildModel()
        {
            model_ = std::make_unique<GRBModel>(*env_);
            vars_.clear();
            varIndex_.clear();
            constrs_.clear();

            addVariables();
            addConstraints();
            addObjective();
            addParameters();
        }

        RawOutcome readOutcome()
        {
            const IMP& mp = problem();
            RawOutcome out;
            out.code = model_->get(GRB_IntAttr_Status);
            out.solverWall = model_->get(GRB_DoubleAttr_Runtime);

            if (model_->get(GRB_IntAttr_SolCount) == 0)
                return out;

            std::unordered_map<Variable, double> values;
            for (const auto& v : mp.variables())
                values.emplace(v, engineVariable(v).get(GRB_DoubleAttr_X));

            std::unordered_map<Constraint, double> duals;
            if (model_->get(GRB_IntAttr_IsMIP) == 0 && out.code == GRB_OPTIMAL) {
                for (std::size_t i = 0; i < constrs_.size(); ++i)
                    duals.emplace(mp.constraints()[i], constrs_[i].get(GRB_DoubleAttr_Pi));
            }

            const double objective = mp.objective().isZero() ? 0.0 : model_->get(GRB_DoubleAttr_ObjVal);
            out.solution = Solution::of(mp, objective, std::move(values), std::move(duals));
            return out;
        }

    public:
        GurobiSolver() = default;

        std::string engineName() const override { return "gurobi"; }

        /// @brief Gurobi limits wall-clock time only
        bool cpuTimingSupported() const override { return false; }

        /**
         * @brief Create and start the environment, once
         *
         * @throws EngineFailure if Gurobi cannot start (license, library)
         */
        void initialize()
        {
            if (env_)
                return;
            try {
                auto env = std::make_unique<GRBEnv>(true);  // defer license check and load
                configureEnvironment(*env);                 // derived hook
                env->start();
                env_ = std::move(env);
            } catch (const GRBException& e) {
                throw wrap(e);
            }
        }

        /**
         * @brief Hand the native model over to the caller
         *
         * @details Builds the model when no solve ran yet. Afterwards the
         *          parameters and the problem are frozen, and solve()
         *          re-optimizes this model as the caller left it.
         *
         * @throws StatePrecondition if no problem was set
         * @throws EngineFailure on Gurobi errors
         */
        GRBModel& underlyingEngine()
        {
            problem();
            initialize();
            if (!model_) {
                try {
                    buildModel();
                } catch (const GRBException& e) {
                    throw wrap(e);
                }
            }
            markHandedOver();
            return *model_;
        }

    protected:
        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Configure environment before start; silences Gurobi output by default
        virtual void configureEnvironment(GRBEnv& env)
        {
            env.set(GRB_IntParam_OutputFlag, 0);
        }

        /// @brief One GRBVar per problem variable, in problem order
        virtual void addVariables()
        {
            const IMP& mp = problem();
            vars_.reserve(mp.variables().size());
            for (const auto& v : mp.variables()) {
                const Bounds bounds = mp.variableBounds(v);
                char type = GRB_CONTINUOUS;
                switch (mp.variableKind(v)) {
                    case VariableKind::BOOL: type = GRB_BINARY;  break;
                    case VariableKind::INT:  type = GRB_INTEGER; break;
                    case VariableKind::REAL:
                    case VariableKind::COUNT: break;
                }
                const double lb = bounds.hasLower() ? bounds.lower() : -GRB_INFINITY;
                const double ub = bounds.hasUpper() ? bounds.upper() : GRB_INFINITY;
                varIndex_.emplace(v.description(), vars_.size());
                vars_.push_back(model_->addVar(lb, ub, 0.0, type, variableName(v, FileFormat::GUROBI_LP)));
            }
        }

        /// @brief One GRBConstr per problem constraint, in problem order
        virtual void addConstraints()
        {
            const IMP& mp = problem();
            constrs_.reserve(mp.constraints().size());
            for (const auto& c : mp.constraints()) {
                char sense = GRB_EQUAL;
                switch (c.op()) {
                    case ComparisonOperator::LE: sense = GRB_LESS_EQUAL;    break;
                    case ComparisonOperator::GE: sense = GRB_GREATER_EQUAL; break;
                    case ComparisonOperator::EQ:
                    case ComparisonOperator::COUNT: break;
                }
                constrs_.push_back(model_->addConstr(
                    linearExpression(c.lhs()), sense, c.rhs(), constraintName(c, FileFormat::GUROBI_LP)));
            }
        }

        virtual void addObjective()
        {
            const Objective& objective = problem().objective();
            model_->setObjective(linearExpression(objective.function()),
                                 objective.sense() == Sense::MAX ? GRB_MAXIMIZE : GRB_MINIMIZE);
        }

        /// @throws UnsupportedFeature for a CPU time limit
        virtual void addParameters()
        {
            const Parameters& p = parameters();

            const TimingType timing = preferredTimingType();
            if (const auto limit = timeLimit(timing)) {
                // reachable only from adapters overriding cpuTimingSupported()
                if (timing == TimingType::CPU)
                    throw UnsupportedFeature("gurobi: CPU time limits are not supported");
                model_->set(GRB_DoubleParam_TimeLimit, *limit);
                logger()->debug("gurobi: TimeLimit = {}", *limit);
            }

            if (const auto threads = p.value(IntParameter::MAX_THREADS)) {
                model_->set(GRB_IntParam_Threads, *threads);
                logger()->debug("gurobi: Threads = {}", *threads);
            }

            if (const auto memory = p.value(DoubleParameter::MAX_MEMORY_MB)) {
                model_->set(GRB_DoubleParam_SoftMemLimit, *memory / 1024.0);
                logger()->debug("gurobi: SoftMemLimit = {} GB", *memory / 1024.0);
            }

            if (const auto tree = p.value(DoubleParameter::MAX_TREE_SIZE_MB)) {
                model_->set(GRB_DoubleParam_NodefileStart, *tree / 1024.0);
                logger()->warn("gurobi: {} has no hard limit counterpart; nodes are written to disk beyond {} GB",
                               toString(DoubleParameter::MAX_TREE_SIZE_MB), *tree / 1024.0);
            }

            if (const auto dir = p.value(StringParameter::WORK_DIR)) {
                model_->set(GRB_StringParam_NodefileDir, *dir);
                logger()->debug("gurobi: NodefileDir = {}", *dir);
            }

            if (p.value(IntParameter::DETERMINISTIC) == 0)
                logger()->debug("gurobi: {}=0 ignored, runs are always deterministic",
                                toString(IntParameter::DETERMINISTIC));
        }

        /// @brief Optional pre-optimization hook (warm starts, fixing variables).
        virtual void beforeOptimize() {}

        /// @brief Optional post-optimization hook.
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Solver hooks
        // -------------------------------------------------------------------------

        const StatusTable& statusTable() const override
        {
            static const StatusTable table{
                {GRB_OPTIMAL,        EngineOutcome::SOLVED_OPTIMAL},
                {GRB_SUBOPTIMAL,     EngineOutcome::SOLVED_FEASIBLE},
                {GRB_SOLUTION_LIMIT, EngineOutcome::SOLVED_FEASIBLE},
                {GRB_INFEASIBLE,     EngineOutcome::INFEASIBLE},
                {GRB_INF_OR_UNBD,    EngineOutcome::INFEASIBLE_OR_UNBOUNDED},
                {GRB_UNBOUNDED,      EngineOutcome::UNBOUNDED},
                {GRB_TIME_LIMIT,     EngineOutcome::TIME_LIMIT},
                {GRB_MEM_LIMIT,      EngineOutcome::MEMORY_LIMIT},
            };
            return table;
        }

        void problemChanged() override
        {
            vars_.clear();
            varIndex_.clear();
            constrs_.clear();
            model_.reset();
        }

        RawOutcome solveUnderlying() override
        {
            initialize();
            try {
                if (!handedOver() || !model_)
                    buildModel();
                beforeOptimize();
                model_->optimize();
                afterOptimize();
                return readOutcome();
            } catch (const GRBException& e) {
                throw wrap(e);
            }
        }

        // -------------------------------------------------------------------------
        // Accessors for derived adapters
        // -------------------------------------------------------------------------

        GRBModel& model() { return *model_; }

        /// @throws UnknownEntity if v is not a variable of the problem
        GRBVar& engineVariable(const Variable& v)
        {
            auto it = varIndex_.find(v.description());
            if (it == varIndex_.end())
                throw UnknownEntity(std::format("gurobi: no engine variable for {}", v.description()));
            return vars_[it->second];
        }

        /// @brief Linear expression over the engine variables
        GRBLinExpr linearExpression(const SumTerms& sum)
        {
            GRBLinExpr expr;
            for (const auto& term : sum)
                expr += term.coefficient() * engineVariable(term.variable());
            return expr;
        }
    };

} // namespace mpkit
