#pragma once
/*
===============================================================================
VIEWS — Decorators over mathematical programs
===============================================================================

OVERVIEW
--------
Four decorators share the IMP interfaces of mp.h:

    MPForwarder                 delegates every call to a referenced
                                IMutableMP; base for custom decorators
    MPReadView                  read-only window on any IMP; every mutator
                                throws UnsupportedFeature
    ImmutableMP                 owns a deep copy, detached from its source
    MPWithTransformedBoolsView  reports BOOL variables as INT over [0,1], for
                                engines without a native binary type

LIFETIME
--------
MPForwarder, MPReadView and MPWithTransformedBoolsView hold references: the
wrapped program must outlive them. ImmutableMP owns its data and may outlive
the program it was copied from; solutions and solvers keep ImmutableMP
snapshots for that reason.

An ImmutableMP copied from a view keeps the kinds and bounds the view reports,
so a snapshot of an MPWithTransformedBoolsView still reports INT.

USAGE EXAMPLES
--------------
    MPBuilder mp = examples::oneFourThree();

    MPReadView ro(mp);
    ro.addVariable(z);                      // throws UnsupportedFeature

    ImmutableMP snapshot(mp);
    mp.add(extra);                          // snapshot unchanged

    MPWithTransformedBoolsView asInts(mp);
    asInts.variableKind(b);                 // INT for a BOOL variable b

===============================================================================
*/

#include <format>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "errors.h"
#include "mp.h"

namespace mpkit {

    // ========================================================================
    // FORWARDER
    // ========================================================================

    /**
     * @class MPForwarder
     * @brief Mutable decorator delegating everything to another program
     */
    class MPForwarder : public IMutableMP {
    protected:
        IMutableMP& delegate_;

    public:
        using IMutableMP::containsVariable;
        using IMutableMP::setObjective;

        explicit MPForwarder(IMutableMP& delegate) noexcept : delegate_(delegate) {}

        const std::string& name() const override { return delegate_.name(); }
        const std::vector<Variable>& variables() const override { return delegate_.variables(); }
        const std::vector<Constraint>& constraints() const override { return delegate_.constraints(); }
        const Objective& objective() const override { return delegate_.objective(); }
        MPDimension dimension() const override { return delegate_.dimension(); }

        bool containsVariable(const std::string& description) const override
        {
            return delegate_.containsVariable(description);
        }

        bool containsConstraint(const Constraint& c) const override { return delegate_.containsConstraint(c); }

        const Variable& variable(const std::string& description) const override
        {
            return delegate_.variable(description);
        }

        const VariableNamer& variablesNamer() const override { return delegate_.variablesNamer(); }
        const ConstraintNamer& constraintsNamer() const override { return delegate_.constraintsNamer(); }

        VariableKind variableKind(const Variable& v) const override { return delegate_.variableKind(v); }
        Bounds variableBounds(const Variable& v) const override { return delegate_.variableBounds(v); }

        bool addVariable(const Variable& v) override { return delegate_.addVariable(v); }
        bool add(const Constraint& c) override { return delegate_.add(c); }
        bool setObjective(const Objective& objective) override { return delegate_.setObjective(objective); }
        bool setName(std::string name) override { return delegate_.setName(std::move(name)); }

        bool setVariablesNamer(VariableNamer namer) override
        {
            return delegate_.setVariablesNamer(std::move(namer));
        }

        bool setConstraintsNamer(ConstraintNamer namer) override
        {
            return delegate_.setConstraintsNamer(std::move(namer));
        }

        bool removeVariable(const Variable& v) override { return delegate_.removeVariable(v); }
        void clear() override { delegate_.clear(); }
    };

    // ========================================================================
    // READ-ONLY VIEW
    // ========================================================================

    /**
     * @class MPReadView
     * @brief Read-only window on a program
     *
     * @details Implements IMutableMP so it can stand where a mutable program
     *          is expected; every mutator throws UnsupportedFeature and leaves
     *          the wrapped program untouched.
     */
    class MPReadView : public IMutableMP {
        const IMP& delegate_;

        [[noreturn]] void reject(const char* operation) const
        {
            throw UnsupportedFeature(std::format("mp '{}' is read-only: {} is not allowed", name(), operation));
        }

    public:
        using IMutableMP::containsVariable;
        using IMutableMP::setObjective;

        explicit MPReadView(const IMP& delegate) noexcept : delegate_(delegate) {}

        const std::string& name() const override { return delegate_.name(); }
        const std::vector<Variable>& variables() const override { return delegate_.variables(); }
        const std::vector<Constraint>& constraints() const override { return delegate_.constraints(); }
        const Objective& objective() const override { return delegate_.objective(); }
        MPDimension dimension() const override { return delegate_.dimension(); }

        bool containsVariable(const std::string& description) const override
        {
            return delegate_.containsVariable(description);
        }

        bool containsConstraint(const Constraint& c) const override { return delegate_.containsConstraint(c); }

        const Variable& variable(const std::string& description) const override
        {
            return delegate_.variable(description);
        }

        const VariableNamer& variablesNamer() const override { return delegate_.variablesNamer(); }
        const ConstraintNamer& constraintsNamer() const override { return delegate_.constraintsNamer(); }

        VariableKind variableKind(const Variable& v) const override { return delegate_.variableKind(v); }
        Bounds variableBounds(const Variable& v) const override { return delegate_.variableBounds(v); }

        bool addVariable(const Variable&) override { reject("addVariable"); }
        bool add(const Constraint&) override { reject("add"); }
        bool setObjective(const Objective&) override { reject("setObjective"); }
        bool setName(std::string) override { reject("setName"); }
        bool setVariablesNamer(VariableNamer) override { reject("setVariablesNamer"); }
        bool setConstraintsNamer(ConstraintNamer) override { reject("setConstraintsNamer"); }
        bool removeVariable(const Variable&) override { reject("removeVariable"); }
        void clear() override { reject("clear"); }
    };

    // ========================================================================
    // IMMUTABLE COPY
    // ========================================================================

    /**
     * @class ImmutableMP
     * @brief Owned, unmodifiable deep copy of a program
     */
    class ImmutableMP : public IMP {
        struct EngineView {
            VariableKind kind;
            Bounds bounds;
        };

        MPBuilder mp_;
        MPDimension dimension_;
        std::unordered_map<Variable, EngineView> overrides_;

    public:
        using IMP::containsVariable;

        /// @brief Empty program
        ImmutableMP() = default;

        explicit ImmutableMP(const IMP& source)
            : mp_(MPBuilder::copyOf(source)), dimension_(source.dimension())
        {
            for (const auto& v : source.variables()) {
                VariableKind kind = source.variableKind(v);
                Bounds bounds = source.variableBounds(v);
                if (kind != v.kind() || !(bounds == v.bounds()))
                    overrides_.emplace(v, EngineView{kind, bounds});
            }
        }

        static ImmutableMP copyOf(const IMP& source) { return ImmutableMP(source); }

        const std::string& name() const override { return mp_.name(); }
        const std::vector<Variable>& variables() const override { return mp_.variables(); }
        const std::vector<Constraint>& constraints() const override { return mp_.constraints(); }
        const Objective& objective() const override { return mp_.objective(); }
        MPDimension dimension() const override { return dimension_; }

        bool containsVariable(const std::string& description) const override
        {
            return mp_.containsVariable(description);
        }

        bool containsConstraint(const Constraint& c) const override { return mp_.containsConstraint(c); }

        const Variable& variable(const std::string& description) const override
        {
            return mp_.variable(description);
        }

        const VariableNamer& variablesNamer() const override { return mp_.variablesNamer(); }
        const ConstraintNamer& constraintsNamer() const override { return mp_.constraintsNamer(); }

        VariableKind variableKind(const Variable& v) const override
        {
            auto it = overrides_.find(v);
            return it == overrides_.end() ? mp_.variableKind(v) : it->second.kind;
        }

        Bounds variableBounds(const Variable& v) const override
        {
            auto it = overrides_.find(v);
            return it == overrides_.end() ? mp_.variableBounds(v) : it->second.bounds;
        }
    };

    // ========================================================================
    // BOOLEANS AS INTEGERS
    // ========================================================================

    /**
     * @class MPWithTransformedBoolsView
     * @brief Reports BOOL variables as INT variables over [0,1]
     *
     * @details The variables themselves are untouched; only variableKind and
     *          variableBounds differ from the wrapped program.
     */
    class MPWithTransformedBoolsView : public IMP {
        const IMP& delegate_;

    public:
        using IMP::containsVariable;

        explicit MPWithTransformedBoolsView(const IMP& delegate) noexcept : delegate_(delegate) {}

        const std::string& name() const override { return delegate_.name(); }
        const std::vector<Variable>& variables() const override { return delegate_.variables(); }
        const std::vector<Constraint>& constraints() const override { return delegate_.constraints(); }
        const Objective& objective() const override { return delegate_.objective(); }

        /// @brief Binaries are counted as general integers
        MPDimension dimension() const override
        {
            const MPDimension d = delegate_.dimension();
            return MPDimension(0, d.binaries() + d.integers(), d.reals(), d.constraints());
        }

        bool containsVariable(const std::string& description) const override
        {
            return delegate_.containsVariable(description);
        }

        bool containsConstraint(const Constraint& c) const override { return delegate_.containsConstraint(c); }

        const Variable& variable(const std::string& description) const override
        {
            return delegate_.variable(description);
        }

        const VariableNamer& variablesNamer() const override { return delegate_.variablesNamer(); }
        const ConstraintNamer& constraintsNamer() const override { return delegate_.constraintsNamer(); }

        VariableKind variableKind(const Variable& v) const override
        {
            const VariableKind kind = delegate_.variableKind(v);
            return kind == VariableKind::BOOL ? VariableKind::INT : kind;
        }

        Bounds variableBounds(const Variable& v) const override
        {
            if (delegate_.variableKind(v) == VariableKind::BOOL)
                return Bounds::zeroOne();
            return delegate_.variableBounds(v);
        }
    };

} // namespace mpkit
