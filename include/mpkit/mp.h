#pragma once
/*
===============================================================================
MP — Mathematical programs: read interface, mutable interface and builder
===============================================================================

OVERVIEW
--------
An MP gathers a name, an insertion-ordered set of variables (keyed by
description), an insertion-ordered set of constraints, one objective and two
namers. Its central invariant:

    every variable used by a stored constraint or by the objective
    is a member of variables()

MPBuilder maintains it by construction: adding a constraint or setting the
objective registers the variables they reference.

Interfaces
----------
    IMP          read access (name, variables, constraints, objective,
                 dimension, lookups, names, engine-facing kind/bounds)
    IMutableMP   IMP plus the mutators
    MPBuilder    the concrete mutable program

Decorators over these interfaces live in views.h.

Variable conflicts
------------------
A variable whose description is already registered for a different variable
(other bounds or other kind) is rejected with InvalidArgument, whether it is
added directly, through a constraint, or through the objective. The check
runs before any state changes, so a rejected call leaves the program as it
was. Adding the very same variable again is a no-op returning false.

Dimension
---------
MPDimension counts binary, general integer and real variables plus
constraints. MPBuilder keeps per-kind counters, so dimension() is O(1).

Equality
--------
operator==(const IMP&, const IMP&) compares the variable set, the constraint
set and the objective. Names and namers are ignored.

USAGE EXAMPLES
--------------
    MPBuilder mp;
    mp.setName("OneFourThree");
    auto x = Variable::of("x", VariableDomain::INTEGER, Bounds::nonNegative());
    auto y = Variable::of("y", VariableDomain::INTEGER, Bounds::nonNegative());
    mp.setObjective(143 * x + 60 * y, Sense::MAX);     // registers x and y
    mp.add(Constraint::le("c1", 120 * x + 210 * y, 15000));
    mp.dimension().integers();                          // 2

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "constraints.h"
#include "enum_utils.h"
#include "errors.h"
#include "expressions.h"
#include "logging.h"
#include "naming.h"
#include "objective.h"
#include "variables.h"

namespace mpkit {

    using VariableNamer = Namer<Variable>;
    using ConstraintNamer = Namer<Constraint>;

    /// @brief Structural namer returning the variable description
    inline const VariableNamer& defaultVariablesNamer()
    {
        static const VariableNamer namer([](const Variable& v) -> std::optional<std::string> {
            return v.description();
        });
        return namer;
    }

    /// @brief Structural namer returning the constraint description
    inline const ConstraintNamer& defaultConstraintsNamer()
    {
        static const ConstraintNamer namer([](const Constraint& c) -> std::optional<std::string> {
            return c.description();
        });
        return namer;
    }

    // ========================================================================
    // DIMENSION
    // ========================================================================

    /**
     * @brief Size of a program, by variable kind
     *
     * @details Immutable snapshot; it does not follow later changes.
     */
    class MPDimension {
        std::size_t binaries_ = 0;
        std::size_t integers_ = 0;
        std::size_t reals_ = 0;
        std::size_t constraints_ = 0;

    public:
        MPDimension() = default;

        MPDimension(std::size_t binaries, std::size_t integers, std::size_t reals, std::size_t constraints) noexcept
            : binaries_(binaries), integers_(integers), reals_(reals), constraints_(constraints)
        {
        }

        std::size_t binaries() const noexcept { return binaries_; }
        /// @brief Integer variables that are not boolean
        std::size_t integers() const noexcept { return integers_; }
        std::size_t reals() const noexcept { return reals_; }
        std::size_t variables() const noexcept { return binaries_ + integers_ + reals_; }
        std::size_t constraints() const noexcept { return constraints_; }

        std::size_t count(VariableKind kind) const noexcept
        {
            switch (kind) {
                case VariableKind::BOOL:  return binaries_;
                case VariableKind::INT:   return integers_;
                case VariableKind::REAL:  return reals_;
                case VariableKind::COUNT: break;
            }
            return 0;
        }

        /// @brief "5 vars (2 bin, 1 int), 3 constrs"
        std::string toString() const
        {
            std::string result = std::format("{} vars", variables());
            if (binaries_ > 0 || integers_ > 0) {
                result += " (";
                if (binaries_ > 0) {
                    result += std::format("{} bin", binaries_);
                    if (integers_ > 0)
                        result += ", ";
                }
                if (integers_ > 0)
                    result += std::format("{} int", integers_);
                result += ")";
            }
            result += std::format(", {} constrs", constraints_);
            return result;
        }

        friend bool operator==(const MPDimension&, const MPDimension&) = default;
    };

    // ========================================================================
    // INTERFACES
    // ========================================================================

    /**
     * @class IMP
     * @brief Read access to a mathematical program
     */
    class IMP {
    public:
        virtual ~IMP() = default;

        virtual const std::string& name() const = 0;

        /// @brief Variables in insertion order
        virtual const std::vector<Variable>& variables() const = 0;

        /// @brief Constraints in insertion order
        virtual const std::vector<Constraint>& constraints() const = 0;

        virtual const Objective& objective() const = 0;

        virtual MPDimension dimension() const = 0;

        virtual bool containsVariable(const std::string& description) const = 0;

        virtual bool containsConstraint(const Constraint& constraint) const = 0;

        /**
         * @brief Variable registered under a description
         *
         * @throws UnknownEntity if no such variable
         */
        virtual const Variable& variable(const std::string& description) const = 0;

        virtual const VariableNamer& variablesNamer() const = 0;
        virtual const ConstraintNamer& constraintsNamer() const = 0;

        /**
         * @brief Kind under which engines should see the variable
         *
         * @details Equal to v.kind() unless a view transforms it.
         * @throws UnknownEntity if v is not a member of this program
         */
        virtual VariableKind variableKind(const Variable& v) const
        {
            requireMember(v);
            return v.kind();
        }

        /// @brief Bounds under which engines should see the variable
        virtual Bounds variableBounds(const Variable& v) const
        {
            requireMember(v);
            return v.bounds();
        }

        /// @brief True iff this exact variable is a member
        bool containsVariable(const Variable& v) const
        {
            return containsVariable(v.description()) && variable(v.description()) == v;
        }

        /// @brief Name given by this program's namer; "" for no name
        std::string variableName(const Variable& v) const { return variablesNamer()(v); }

        /// @brief Name given by this program's namer; "" for no name
        std::string constraintName(const Constraint& c) const { return constraintsNamer()(c); }

    protected:
        void requireMember(const Variable& v) const
        {
            if (!containsVariable(v))
                throw UnknownEntity(std::format("mp '{}': variable {} is not part of this program",
                                                name(), v.description()));
        }
    };

    /**
     * @class IMutableMP
     * @brief Read access plus the mutating operations
     *
     * @details Every mutator returns whether the program changed.
     */
    class IMutableMP : public IMP {
    public:
        /// @throws InvalidArgument on a conflicting variable with the same description
        virtual bool addVariable(const Variable& v) = 0;

        /// @throws InvalidArgument on a conflicting variable in the left-hand side
        virtual bool add(const Constraint& c) = 0;

        virtual bool setObjective(const Objective& objective) = 0;

        bool setObjective(SumTerms function, Sense sense)
        {
            return setObjective(Objective::of(std::move(function), sense));
        }

        virtual bool setName(std::string name) = 0;

        /// @brief Empty namer restores the structural default
        virtual bool setVariablesNamer(VariableNamer namer) = 0;

        /// @brief Empty namer restores the structural default
        virtual bool setConstraintsNamer(ConstraintNamer namer) = 0;

        /// @throws InvalidArgument if the variable is used by the objective or a constraint
        virtual bool removeVariable(const Variable& v) = 0;

        /// @brief Back to the state of a freshly constructed program
        virtual void clear() = 0;
    };

    // ========================================================================
    // BUILDER
    // ========================================================================

    /**
     * @class MPBuilder
     * @brief Concrete mutable program
     *
     * @details Copyable: a copy is a deep, independent program sharing only
     *          the (immutable) namer functions.
     */
    class MPBuilder : public IMutableMP {
        std::string name_;
        std::vector<Variable> variables_;
        std::unordered_map<std::string, std::size_t> descrToIndex_;
        std::vector<Constraint> constraints_;
        std::unordered_set<Constraint> constraintSet_;
        Objective objective_;
        EnumArray<VariableKind, std::size_t> kindCount_{};
        VariableNamer variablesNamer_ = defaultVariablesNamer();
        ConstraintNamer constraintsNamer_ = defaultConstraintsNamer();

        /**
         * @brief Reject any variable of sum conflicting with a registered one,
         *        or with another variable of the same sum
         */
        void checkCompatible(const SumTerms& sum) const
        {
            std::unordered_map<std::string, const Variable*> seen;
            for (const auto& term : sum) {
                const Variable& v = term.variable();
                checkCompatible(v);
                auto [it, inserted] = seen.emplace(v.description(), &v);
                if (!inserted && !(*it->second == v))
                    throw InvalidArgument(std::format(
                        "mp '{}': two different variables share the description '{}'", name_, v.description()));
            }
        }

        void checkCompatible(const Variable& v) const
        {
            auto it = descrToIndex_.find(v.description());
            if (it != descrToIndex_.end() && !(variables_[it->second] == v)) {
                const Variable& existing = variables_[it->second];
                throw InvalidArgument(std::format(
                    "mp '{}': already contains variable '{}' ({} {}); a different variable with the same "
                    "description ({} {}) cannot be added",
                    name_, existing.description(), mpkit::toString(existing.kind()), existing.bounds().toString(),
                    mpkit::toString(v.kind()), v.bounds().toString()));
            }
        }

        bool putVariable(const Variable& v)
        {
            if (descrToIndex_.contains(v.description()))
                return false;
            descrToIndex_.emplace(v.description(), variables_.size());
            variables_.push_back(v);
            ++kindCount_[enum_index(v.kind())];
            logger()->trace("mp '{}': registered variable {}", name_, v.description());
            return true;
        }

        bool putVariables(const SumTerms& sum)
        {
            bool added = false;
            for (const auto& term : sum)
                added = putVariable(term.variable()) || added;
            return added;
        }

    public:
        using IMutableMP::containsVariable;
        using IMutableMP::setObjective;

        MPBuilder() = default;

        explicit MPBuilder(std::string name) : name_(std::move(name)) {}

        /**
         * @brief Deep copy of any program: name, variables in order, objective,
         *        constraints in order, namers
         */
        static MPBuilder copyOf(const IMP& source)
        {
            MPBuilder mp(source.name());
            for (const auto& v : source.variables())
                mp.addVariable(v);
            mp.setObjective(source.objective());
            for (const auto& c : source.constraints())
                mp.add(c);
            mp.setVariablesNamer(source.variablesNamer());
            mp.setConstraintsNamer(source.constraintsNamer());
            return mp;
        }

        // --------------------------------------------------------------------
        // IMP
        // --------------------------------------------------------------------

        const std::string& name() const override { return name_; }
        const std::vector<Variable>& variables() const override { return variables_; }
        const std::vector<Constraint>& constraints() const override { return constraints_; }
        const Objective& objective() const override { return objective_; }

        MPDimension dimension() const override
        {
            return MPDimension(kindCount_[enum_index(VariableKind::BOOL)],
                               kindCount_[enum_index(VariableKind::INT)],
                               kindCount_[enum_index(VariableKind::REAL)],
                               constraints_.size());
        }

        bool containsVariable(const std::string& description) const override
        {
            return descrToIndex_.contains(description);
        }

        bool containsConstraint(const Constraint& constraint) const override
        {
            return constraintSet_.contains(constraint);
        }

        const Variable& variable(const std::string& description) const override
        {
            auto it = descrToIndex_.find(description);
            if (it == descrToIndex_.end())
                throw UnknownEntity(std::format("mp '{}': no variable described as '{}'", name_, description));
            return variables_[it->second];
        }

        const VariableNamer& variablesNamer() const override { return variablesNamer_; }
        const ConstraintNamer& constraintsNamer() const override { return constraintsNamer_; }

        // --------------------------------------------------------------------
        // Mutators
        // --------------------------------------------------------------------

        bool addVariable(const Variable& v) override
        {
            checkCompatible(v);
            return putVariable(v);
        }

        bool add(const Constraint& c) override
        {
            checkCompatible(c.lhs());
            const bool addedV = putVariables(c.lhs());
            bool addedC = false;
            if (!constraintSet_.contains(c)) {
                constraints_.push_back(c);
                constraintSet_.insert(c);
                addedC = true;
                logger()->trace("mp '{}': added constraint {}", name_, c.toString());
            }
            detail::ensure(!(addedV && !addedC), "a constraint with new variables was already stored");
            return addedC;
        }

        bool setObjective(const Objective& objective) override
        {
            checkCompatible(objective.function());
            putVariables(objective.function());
            if (objective == objective_)
                return false;
            objective_ = objective;
            return true;
        }

        bool setName(std::string name) override
        {
            if (name == name_)
                return false;
            name_ = std::move(name);
            return true;
        }

        bool setVariablesNamer(VariableNamer namer) override
        {
            if (!namer)
                namer = defaultVariablesNamer();
            if (namer == variablesNamer_)
                return false;
            variablesNamer_ = std::move(namer);
            return true;
        }

        bool setConstraintsNamer(ConstraintNamer namer) override
        {
            if (!namer)
                namer = defaultConstraintsNamer();
            if (namer == constraintsNamer_)
                return false;
            constraintsNamer_ = std::move(namer);
            return true;
        }

        bool removeVariable(const Variable& v) override
        {
            if (!containsVariable(v))
                return false;

            for (const auto& term : objective_.function()) {
                if (term.variable() == v)
                    throw InvalidArgument(std::format("mp '{}': cannot remove {} used in objective {}",
                                                      name_, v.description(), objective_.toString()));
            }
            for (const auto& c : constraints_) {
                for (const auto& term : c.lhs()) {
                    if (term.variable() == v)
                        throw InvalidArgument(std::format("mp '{}': cannot remove {} used in constraint {}",
                                                          name_, v.description(), c.toString()));
                }
            }

            const std::size_t index = descrToIndex_.at(v.description());
            variables_.erase(variables_.begin() + static_cast<std::ptrdiff_t>(index));
            descrToIndex_.erase(v.description());
            for (auto& [descr, i] : descrToIndex_) {
                if (i > index)
                    --i;
            }
            --kindCount_[enum_index(v.kind())];
            return true;
        }

        void clear() override
        {
            name_.clear();
            variables_.clear();
            descrToIndex_.clear();
            constraints_.clear();
            constraintSet_.clear();
            objective_ = Objective::zero();
            kindCount_.fill(0);
            variablesNamer_ = defaultVariablesNamer();
            constraintsNamer_ = defaultConstraintsNamer();
        }

        /// @brief Convenience chaining form of addVariable
        MPBuilder& with(const Variable& v)
        {
            addVariable(v);
            return *this;
        }

        /// @brief Convenience chaining form of add
        MPBuilder& with(const Constraint& c)
        {
            add(c);
            return *this;
        }
    };

    // ========================================================================
    // EQUALITY
    // ========================================================================

    /**
     * @brief Same variable set, same constraint set, same objective
     *
     * @note Order, names and namers are not compared.
     */
    inline bool operator==(const IMP& a, const IMP& b)
    {
        if (&a == &b)
            return true;
        if (a.variables().size() != b.variables().size())
            return false;
        if (a.constraints().size() != b.constraints().size())
            return false;
        if (!(a.objective() == b.objective()))
            return false;
        for (const auto& v : a.variables()) {
            if (!b.containsVariable(v))
                return false;
        }
        for (const auto& c : a.constraints()) {
            if (!b.containsConstraint(c))
                return false;
        }
        return true;
    }

} // namespace mpkit
