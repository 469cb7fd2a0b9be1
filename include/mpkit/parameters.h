#pragma once
/*
===============================================================================
PARAMETERS — Typed solver parameters and timing resolution
===============================================================================

OVERVIEW
--------
Solver settings are keyed by typed enums, one enum per value type, so a key
can only ever be paired with a value of its own type:

    DoubleParameter : MAX_CPU_SECONDS, MAX_TREE_SIZE_MB, MAX_MEMORY_MB,
                      MAX_WALL_SECONDS                     (unset, > 0)
    IntParameter    : MAX_THREADS                          (unset, > 0)
                      DETERMINISTIC                        (0, in {0,1})
    StringParameter : WORK_DIR                             (unset, non-empty)

plus four namer slots (global and per-format, for variables and for
constraints) used by name resolution (see solver.h).

An explicit entry exists only for values that differ from the default:
setting a parameter to its default, or to std::nullopt, removes the entry.
Every setter reports whether the stored state changed.

TIMING
------
A wall-clock limit and a CPU limit are mutually exclusive:

    both set          -> ConfigurationConflict
    wall set          -> WALL
    cpu set           -> CPU, or UnsupportedFeature without CPU timing
    neither           -> CPU when supported, else WALL

USAGE EXAMPLES
--------------
    Parameters p;
    p.set(DoubleParameter::MAX_WALL_SECONDS, 60.0);     // true
    p.set(IntParameter::DETERMINISTIC, 0);              // false: default
    p.set(IntParameter::MAX_THREADS, 0);                // throws InvalidArgument

    preferredTimingType(p, true);                       // WALL
    timeLimit(p, TimingType::WALL);                     // 60.0

===============================================================================
*/

#include <cstddef>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "enum_utils.h"
#include "errors.h"
#include "mp.h"
#include "naming.h"

namespace mpkit {

    // ========================================================================
    // KEYS
    // ========================================================================

    DECLARE_ENUM_WITH_COUNT(DoubleParameter, MAX_CPU_SECONDS, MAX_TREE_SIZE_MB, MAX_MEMORY_MB, MAX_WALL_SECONDS);
    DECLARE_ENUM_WITH_COUNT(IntParameter, MAX_THREADS, DETERMINISTIC);
    DECLARE_ENUM_WITH_COUNT(StringParameter, WORK_DIR);

    inline std::string toString(DoubleParameter key)
    {
        switch (key) {
            case DoubleParameter::MAX_CPU_SECONDS:  return "MAX_CPU_SECONDS";
            case DoubleParameter::MAX_TREE_SIZE_MB: return "MAX_TREE_SIZE_MB";
            case DoubleParameter::MAX_MEMORY_MB:    return "MAX_MEMORY_MB";
            case DoubleParameter::MAX_WALL_SECONDS: return "MAX_WALL_SECONDS";
            case DoubleParameter::COUNT:            break;
        }
        return "UNKNOWN";
    }

    inline std::string toString(IntParameter key)
    {
        switch (key) {
            case IntParameter::MAX_THREADS:   return "MAX_THREADS";
            case IntParameter::DETERMINISTIC: return "DETERMINISTIC";
            case IntParameter::COUNT:         break;
        }
        return "UNKNOWN";
    }

    inline std::string toString(StringParameter key)
    {
        switch (key) {
            case StringParameter::WORK_DIR: return "WORK_DIR";
            case StringParameter::COUNT:    break;
        }
        return "UNKNOWN";
    }

    // ========================================================================
    // DEFAULTS AND VALIDATION
    // ========================================================================

    inline std::optional<double> defaultValue(DoubleParameter) noexcept { return std::nullopt; }

    inline std::optional<int> defaultValue(IntParameter key) noexcept
    {
        if (key == IntParameter::DETERMINISTIC)
            return 0;
        return std::nullopt;
    }

    inline std::optional<std::string> defaultValue(StringParameter) { return std::nullopt; }

    /// @throws InvalidArgument unless value > 0
    inline void validate(DoubleParameter key, double value)
    {
        if (!(value > 0.0))
            throw InvalidArgument(std::format("parameter {}: value {} must be > 0", toString(key), value));
    }

    /// @throws InvalidArgument unless MAX_THREADS > 0 and DETERMINISTIC in {0,1}
    inline void validate(IntParameter key, int value)
    {
        switch (key) {
            case IntParameter::MAX_THREADS:
                if (value <= 0)
                    throw InvalidArgument(std::format("parameter {}: value {} must be > 0", toString(key), value));
                return;
            case IntParameter::DETERMINISTIC:
                if (value != 0 && value != 1)
                    throw InvalidArgument(std::format("parameter {}: value {} must be 0 or 1", toString(key), value));
                return;
            case IntParameter::COUNT:
                break;
        }
        throw InvalidArgument("parameter: invalid int key");
    }

    /// @throws InvalidArgument on an empty string
    inline void validate(StringParameter key, const std::string& value)
    {
        if (value.empty())
            throw InvalidArgument(std::format("parameter {}: value must not be empty", toString(key)));
    }

    // ========================================================================
    // PARAMETERS
    // ========================================================================

    /**
     * @class Parameters
     * @brief Explicit solver settings with defaults and validation
     *
     * @details Value semantics. Two parameter sets are equal iff every typed
     *          value is equal and every namer slot holds the same namer
     *          object.
     */
    class Parameters {
        EnumArray<DoubleParameter, std::optional<double>> doubles_{};
        EnumArray<IntParameter, std::optional<int>> ints_{};
        EnumArray<StringParameter, std::optional<std::string>> strings_{};

        VariableNamer variablesNamer_;
        ConstraintNamer constraintsNamer_;
        NamersByFormat<Variable> variablesNamersByFormat_;
        NamersByFormat<Constraint> constraintsNamersByFormat_;

        template<typename Key, typename V>
        static bool store(std::optional<V>& slot, Key key, std::optional<V> value)
        {
            if (value) {
                validate(key, *value);
                if (value == defaultValue(key))
                    value.reset();
            }
            if (slot == value)
                return false;
            slot = std::move(value);
            return true;
        }

        template<typename T>
        static bool storeNamer(Namer<T>& slot, Namer<T> namer)
        {
            if (slot == namer)
                return false;
            slot = std::move(namer);
            return true;
        }

    public:
        // --------------------------------------------------------------------
        // Typed values
        // --------------------------------------------------------------------

        /// @brief Explicit value, or the default; nullopt when neither exists
        std::optional<double> value(DoubleParameter key) const
        {
            const auto& slot = doubles_.at(enum_index(key));
            return slot ? slot : defaultValue(key);
        }

        std::optional<int> value(IntParameter key) const
        {
            const auto& slot = ints_.at(enum_index(key));
            return slot ? slot : defaultValue(key);
        }

        std::optional<std::string> value(StringParameter key) const
        {
            const auto& slot = strings_.at(enum_index(key));
            return slot ? slot : defaultValue(key);
        }

        bool isSet(DoubleParameter key) const { return doubles_.at(enum_index(key)).has_value(); }
        bool isSet(IntParameter key) const { return ints_.at(enum_index(key)).has_value(); }
        bool isSet(StringParameter key) const { return strings_.at(enum_index(key)).has_value(); }

        /**
         * @brief Set or clear a value
         *
         * @return true iff the stored state changed
         * @throws InvalidArgument if the value fails validation
         */
        bool set(DoubleParameter key, std::optional<double> value)
        {
            return store(doubles_.at(enum_index(key)), key, value);
        }

        bool set(IntParameter key, std::optional<int> value)
        {
            return store(ints_.at(enum_index(key)), key, value);
        }

        bool set(StringParameter key, std::optional<std::string> value)
        {
            return store(strings_.at(enum_index(key)), key, std::move(value));
        }

        bool set(StringParameter key, const char* value)
        {
            return set(key, std::optional<std::string>(value));
        }

        // --------------------------------------------------------------------
        // Namers
        // --------------------------------------------------------------------

        const VariableNamer& variablesNamer() const noexcept { return variablesNamer_; }
        const ConstraintNamer& constraintsNamer() const noexcept { return constraintsNamer_; }

        const NamersByFormat<Variable>& variablesNamersByFormat() const noexcept
        {
            return variablesNamersByFormat_;
        }

        const NamersByFormat<Constraint>& constraintsNamersByFormat() const noexcept
        {
            return constraintsNamersByFormat_;
        }

        /// @brief Global variable namer; an empty namer unsets it
        bool setVariablesNamer(VariableNamer namer) { return storeNamer(variablesNamer_, std::move(namer)); }

        bool setConstraintsNamer(ConstraintNamer namer)
        {
            return storeNamer(constraintsNamer_, std::move(namer));
        }

        bool setVariablesNamersByFormat(NamersByFormat<Variable> namers)
        {
            std::erase_if(namers, [](const auto& entry) { return !entry.second; });
            if (namers == variablesNamersByFormat_)
                return false;
            variablesNamersByFormat_ = std::move(namers);
            return true;
        }

        bool setConstraintsNamersByFormat(NamersByFormat<Constraint> namers)
        {
            std::erase_if(namers, [](const auto& entry) { return !entry.second; });
            if (namers == constraintsNamersByFormat_)
                return false;
            constraintsNamersByFormat_ = std::move(namers);
            return true;
        }

        /// @brief Namer for one format; an empty namer removes the entry
        bool setVariablesNamer(FileFormat format, VariableNamer namer)
        {
            auto copy = variablesNamersByFormat_;
            copy[format] = std::move(namer);
            return setVariablesNamersByFormat(std::move(copy));
        }

        bool setConstraintsNamer(FileFormat format, ConstraintNamer namer)
        {
            auto copy = constraintsNamersByFormat_;
            copy[format] = std::move(namer);
            return setConstraintsNamersByFormat(std::move(copy));
        }

        // --------------------------------------------------------------------
        // Bulk operations
        // --------------------------------------------------------------------

        /**
         * @brief Replace every entry by those of other
         *
         * @return true iff the stored state changed
         */
        bool setAll(const Parameters& other)
        {
            if (*this == other)
                return false;
            *this = other;
            return true;
        }

        /// @brief Remove every explicit value
        void reset() { *this = Parameters(); }

        /// @brief "{MAX_WALL_SECONDS=60, MAX_THREADS=4}"; explicit values only
        std::string toString() const
        {
            std::string out = "{";
            auto append = [&out](const std::string& entry) {
                if (out.size() > 1)
                    out += ", ";
                out += entry;
            };
            for (auto key : enum_values<DoubleParameter>()) {
                if (const auto& v = doubles_[enum_index(key)])
                    append(std::format("{}={}", mpkit::toString(key), *v));
            }
            for (auto key : enum_values<IntParameter>()) {
                if (const auto& v = ints_[enum_index(key)])
                    append(std::format("{}={}", mpkit::toString(key), *v));
            }
            for (auto key : enum_values<StringParameter>()) {
                if (const auto& v = strings_[enum_index(key)])
                    append(std::format("{}={}", mpkit::toString(key), *v));
            }
            if (variablesNamer_)
                append("VARIABLES_NAMER");
            if (constraintsNamer_)
                append("CONSTRAINTS_NAMER");
            for (const auto& [format, namer] : variablesNamersByFormat_)
                append(std::format("VARIABLES_NAMER[{}]", mpkit::toString(format)));
            for (const auto& [format, namer] : constraintsNamersByFormat_)
                append(std::format("CONSTRAINTS_NAMER[{}]", mpkit::toString(format)));
            out += "}";
            return out;
        }

        friend bool operator==(const Parameters&, const Parameters&) = default;
    };

    // ========================================================================
    // TIMING RESOLUTION
    // ========================================================================

    DECLARE_ENUM_WITH_COUNT(TimingType, WALL, CPU);

    inline std::string toString(TimingType type)
    {
        switch (type) {
            case TimingType::WALL:  return "WALL";
            case TimingType::CPU:   return "CPU";
            case TimingType::COUNT: break;
        }
        return "UNKNOWN";
    }

    /**
     * @brief Timing an engine should measure and limit
     *
     * @param params             Solver parameters
     * @param cpuTimingSupported Whether the engine can limit CPU time
     *
     * @throws ConfigurationConflict if both a wall and a CPU limit are set
     * @throws UnsupportedFeature if only a CPU limit is set and CPU timing is
     *         not supported
     */
    inline TimingType preferredTimingType(const Parameters& params, bool cpuTimingSupported)
    {
        const auto wall = params.value(DoubleParameter::MAX_WALL_SECONDS);
        const auto cpu = params.value(DoubleParameter::MAX_CPU_SECONDS);
        if (wall && cpu)
            throw ConfigurationConflict(std::format(
                "parameters: {} ({}) and {} ({}) cannot both be set",
                toString(DoubleParameter::MAX_WALL_SECONDS), *wall,
                toString(DoubleParameter::MAX_CPU_SECONDS), *cpu));
        if (wall)
            return TimingType::WALL;
        if (cpu) {
            if (!cpuTimingSupported)
                throw UnsupportedFeature(std::format(
                    "parameters: {} is set but CPU timing is not supported",
                    toString(DoubleParameter::MAX_CPU_SECONDS)));
            return TimingType::CPU;
        }
        return cpuTimingSupported ? TimingType::CPU : TimingType::WALL;
    }

    /// @brief Limit configured for a timing type, in seconds
    inline std::optional<double> timeLimit(const Parameters& params, TimingType type)
    {
        return params.value(type == TimingType::CPU ? DoubleParameter::MAX_CPU_SECONDS
                                                    : DoubleParameter::MAX_WALL_SECONDS);
    }

} // namespace mpkit
