#pragma once

#include <scalex/core/error.hpp>
#include <scalex/expression/builtin.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace scalex::expression {

/// Binds a call's arguments to a concrete signature, or reports why it cannot.
using BuiltinConstructor = std::function<Result<std::unique_ptr<BuiltinFunction>>(
    session::SessionContext& ctx, std::vector<ExprPtr> args)>;

inline constexpr std::size_t kVariadic = std::numeric_limits<std::size_t>::max();

struct FunctionEntry {
    BuiltinConstructor make;
    std::size_t min_args = 0;
    std::size_t max_args = 0;
};

/// Name-keyed table of builtin constructors.
///
/// Names are stored lowercase. The process-wide instance from builtins() is populated once
/// and read-only afterwards, so lookups need no locking.
class FunctionRegistry {
   public:
    FunctionRegistry() = default;

    /// Register (or replace) a builtin taking between min_args and max_args arguments.
    void register_function(std::string_view name, std::size_t min_args, std::size_t max_args,
                           BuiltinConstructor make);

    /// Look up a builtin by (case-insensitive) name.
    [[nodiscard]] auto find(std::string_view name) const -> const FunctionEntry*;

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return find(name) != nullptr;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return registry_.size(); }

    /// Registered names, sorted.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// Checks arity and binds the builtin for `name`.
    [[nodiscard]] auto get_function(session::SessionContext& ctx, std::string_view name,
                                    std::vector<ExprPtr> args) const
        -> Result<std::unique_ptr<BuiltinFunction>>;

    /// The registry holding the full builtin catalog.
    [[nodiscard]] static auto builtins() -> const FunctionRegistry&;

   private:
    robin_hood::unordered_map<std::string, FunctionEntry> registry_;
};

/// Lowercase copy of `name`.
[[nodiscard]] auto canonical_name(std::string_view name) -> std::string;

/// Functions whose result must never be hoisted out of a single evaluation.
[[nodiscard]] auto is_unfoldable_function(std::string_view name) -> bool;

}  // namespace scalex::expression
