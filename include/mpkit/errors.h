#pragma once
/*
===============================================================================
ERRORS — Exception taxonomy for mpkit
===============================================================================

OVERVIEW
--------
Every failure raised by the library belongs to one of six categories. Each
category is a distinct exception type deriving from the closest standard
exception, so callers may catch either the precise mpkit type or the standard
base they already handle.

KEY COMPONENTS
--------------
• InvalidArgument        : malformed value-model construction or bad parameter
• UnknownEntity          : lookup of a variable or constraint that is not there
• ConfigurationConflict  : mutually exclusive parameter settings
• UnsupportedFeature     : capability unavailable here (CPU timing, read views)
• StatePrecondition      : operation invoked before its prerequisite state
• EngineFailure          : the external engine raised an error

PROPAGATION
-----------
• Nothing is retried by the library.
• Engine errors are wrapped with their native code and message.
• Internal invariants are reported as plain std::logic_error.

USAGE EXAMPLES
--------------
    try {
        solver.result();
    } catch (const mpkit::StatePrecondition& e) {
        // no solve yet
    }

    // Message building
    throw InvalidArgument(std::format("coefficient {} is not finite", c));

===============================================================================
*/

#include <stdexcept>
#include <string>

namespace mpkit {

    /// @brief Malformed value, rejected at construction time
    class InvalidArgument : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// @brief A referenced variable or constraint is unknown to the target
    class UnknownEntity : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
    };

    /// @brief Two explicit settings cannot hold at the same time
    class ConfigurationConflict : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /// @brief The requested capability is not available in this environment
    class UnsupportedFeature : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief Operation invoked before the state it depends on exists
    class StatePrecondition : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /**
     * @brief The external engine reported an error
     *
     * @details Carries the engine's own error code untouched. The message
     *          holds the engine message prefixed with the failing operation.
     */
    class EngineFailure : public std::runtime_error {
        int code_ = 0;

    public:
        EngineFailure(const std::string& what, int code)
            : std::runtime_error(what), code_(code)
        {
        }

        /// @brief Native error code as reported by the engine
        int code() const noexcept { return code_; }
    };

    namespace detail {

        /// @brief Raise std::logic_error when an internal invariant is broken
        inline void ensure(bool condition, const char* what)
        {
            if (!condition)
                throw std::logic_error(std::string("mpkit internal invariant violated: ") + what);
        }

    } // namespace detail

} // namespace mpkit
