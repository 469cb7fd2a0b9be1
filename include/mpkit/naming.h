#pragma once
/*
===============================================================================
NAMING SYSTEM — Descriptions, namers and per-format name resolution
===============================================================================

OVERVIEW
--------
Two naming concerns live here.

1. Structural descriptions. A variable is identified by a categorical name and
   an ordered list of references (indices, keys, labels). describe() reduces
   them to a single string in math style:

       describe("x")          -> "x"
       describe("x", 1, 2)    -> "x[1,2]"
       describe("ship", "A")  -> "ship[A]"

2. Display names. A Namer<T> maps an entity to an optional display name. When
   an entity is exported or handed to an engine, its name is resolved through
   an override chain:

       per-format namer (if a format is given and one is registered for it)
         -> global namer (if set)
         -> the problem's own namer

   An absent name always resolves to "". Namers are statically typed, so a
   namer can never return anything but a string or nothing.

KEY COMPONENTS
--------------
• naming_detail::Streamable : concept for reference values
• describe()                : structural description of name + references
• FileFormat                : target format tags (MPS, LP, CPLEX_LP, GUROBI_LP)
• Namer<T>                  : shared, identity-comparable naming function
• NamersByFormat<T>         : per-format namer table
• resolveName()             : the override chain above

USAGE EXAMPLES
--------------
    Namer<Variable> prefixed([](const Variable& v) {
        return "v_" + v.description();
    });

    NamersByFormat<Variable> byFormat;
    byFormat[FileFormat::MPS] = Namer<Variable>([](const Variable& v)
        -> std::optional<std::string> { return std::nullopt; });

    auto n = resolveName(v, FileFormat::MPS, byFormat, prefixed, mpNamer);  // ""

EXCEPTION SAFETY
----------------
• describe(): strong guarantee; throws InvalidArgument on an empty base
  name combined with references.
• resolveName(): propagates whatever the user namer throws.

===============================================================================
*/

#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "errors.h"

namespace mpkit {

    // ========================================================================
    // STRUCTURAL DESCRIPTIONS
    // ========================================================================

    namespace naming_detail {

        /**
         * @concept Streamable
         * @brief True if the type can be written to std::ostream via operator<<
         *
         * @note Any such value may serve as a variable reference
         */
        template<typename T>
        concept Streamable = requires(std::ostream & os, T && value) {
            { os << std::forward<T>(value) } -> std::same_as<std::ostream&>;
        };

        template<Streamable T>
        inline std::string to_text(T&& value)
        {
            std::ostringstream oss;
            oss << std::forward<T>(value);
            return oss.str();
        }

        inline void check_base_name(std::string_view base, bool has_references)
        {
            if (has_references && base.empty()) {
                throw InvalidArgument("naming: base name cannot be empty when references are present");
            }
        }

    } // namespace naming_detail

    /**
     * @brief Render each reference to text, preserving order
     */
    template<naming_detail::Streamable... Refs>
    inline std::vector<std::string> references(Refs&&... refs)
    {
        std::vector<std::string> out;
        out.reserve(sizeof...(refs));
        (out.push_back(naming_detail::to_text(std::forward<Refs>(refs))), ...);
        return out;
    }

    /**
     * @brief Description of a name with textual references: "x[1,2]"
     *
     * @throws InvalidArgument if base is empty while references are given
     */
    inline std::string describe(std::string_view base, const std::vector<std::string>& refs)
    {
        naming_detail::check_base_name(base, !refs.empty());
        if (refs.empty())
            return std::string(base);

        std::string result;
        result.reserve(base.size() + refs.size() * 4 + 2);
        result.append(base).append("[");
        bool first = true;
        for (const auto& r : refs) {
            if (!first)
                result.append(",");
            first = false;
            result.append(r);
        }
        result.append("]");
        return result;
    }

    /// @brief Variadic form of describe()
    template<naming_detail::Streamable... Refs>
    inline std::string describe(std::string_view base, Refs&&... refs)
    {
        return describe(base, references(std::forward<Refs>(refs)...));
    }

    // ========================================================================
    // FILE FORMATS
    // ========================================================================

    /// @brief Target formats a problem may be exported to
    DECLARE_ENUM_WITH_COUNT(FileFormat, MPS, LP, CPLEX_LP, GUROBI_LP);

    inline std::string toString(FileFormat format)
    {
        switch (format) {
            case FileFormat::MPS:       return "MPS";
            case FileFormat::LP:        return "LP";
            case FileFormat::CPLEX_LP:  return "CPLEX_LP";
            case FileFormat::GUROBI_LP: return "GUROBI_LP";
            case FileFormat::COUNT:     break;
        }
        return "UNKNOWN";
    }

    // ========================================================================
    // NAMERS
    // ========================================================================

    /**
     * @class Namer
     * @brief Function from an entity to an optional display name
     *
     * @details The wrapped function is shared between copies. Two namers are
     *          equal iff they share the same function object (or are both
     *          empty), which lets parameter sets holding namers be compared.
     *
     * @tparam T Named entity type (Variable or Constraint)
     */
    template<typename T>
    class Namer {
    public:
        using Function = std::function<std::optional<std::string>(const T&)>;

    private:
        std::shared_ptr<const Function> fn_;

    public:
        /// @brief Empty namer; resolution skips it
        Namer() = default;

        template<typename F>
            requires (!std::same_as<std::remove_cvref_t<F>, Namer>) &&
                     std::is_invocable_r_v<std::optional<std::string>, F&, const T&>
        Namer(F&& f)
            : fn_(std::make_shared<const Function>(std::forward<F>(f)))
        {
        }

        explicit operator bool() const noexcept { return static_cast<bool>(fn_); }

        /**
         * @brief Name of the entity; "" when the function yields nothing
         *
         * @throws std::logic_error when called on an empty namer
         */
        std::string operator()(const T& entity) const
        {
            if (!fn_)
                throw std::logic_error("naming: empty namer invoked");
            return (*fn_)(entity).value_or(std::string{});
        }

        friend bool operator==(const Namer& a, const Namer& b) noexcept
        {
            return a.fn_ == b.fn_;
        }
    };

    /// @brief Per-format namers; a format without entry falls through
    template<typename T>
    using NamersByFormat = std::map<FileFormat, Namer<T>>;

    /**
     * @brief Resolve the display name of an entity through the override chain
     *
     * @param entity   Variable or constraint to name
     * @param format   Target format, or nullopt for the format-less name
     * @param byFormat Per-format namers (may be empty)
     * @param global   Global namer (may be empty)
     * @param fallback The problem's own namer (must not be empty)
     * @return Resolved name, never null; "" for no name
     */
    template<typename T>
    inline std::string resolveName(const T& entity,
                                   std::optional<FileFormat> format,
                                   const NamersByFormat<T>& byFormat,
                                   const Namer<T>& global,
                                   const Namer<T>& fallback)
    {
        if (format) {
            auto it = byFormat.find(*format);
            if (it != byFormat.end() && it->second)
                return it->second(entity);
        }
        if (global)
            return global(entity);
        return fallback(entity);
    }

} // namespace mpkit
