#include <scalex/expression/builtins.hpp>
#include <scalex/expression/function_registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace scalex::expression {

auto canonical_name(std::string_view name) -> std::string {
    std::string out(name);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto is_unfoldable_function(std::string_view name) -> bool {
    static const robin_hood::unordered_flat_set<std::string_view> kUnfoldable = {
        "sysdate", "rand",   "uuid",   "sleep",    "found_rows", "row",
        "values",  "setvar", "getvar", "getparam", "benchmark",
    };
    return kUnfoldable.count(name) > 0;
}

void FunctionRegistry::register_function(std::string_view name, std::size_t min_args,
                                         std::size_t max_args, BuiltinConstructor make) {
    registry_.insert_or_assign(
        canonical_name(name),
        FunctionEntry{.make = std::move(make), .min_args = min_args, .max_args = max_args});
}

auto FunctionRegistry::find(std::string_view name) const -> const FunctionEntry* {
    if (auto it = registry_.find(canonical_name(name)); it != registry_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto FunctionRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(registry_.size());
    for (const auto& kv : registry_) {
        out.push_back(kv.first);
    }
    std::ranges::sort(out);
    return out;
}

auto FunctionRegistry::get_function(session::SessionContext& ctx, std::string_view name,
                                    std::vector<ExprPtr> args) const
    -> Result<std::unique_ptr<BuiltinFunction>> {
    const auto* entry = find(name);
    if (entry == nullptr) {
        return make_error(ErrorCode::FunctionNotFound, "function {} does not exist", name);
    }
    if (args.size() < entry->min_args || args.size() > entry->max_args) {
        return make_error(ErrorCode::IncorrectParameterCount,
                          "incorrect parameter count in the call to native function '{}'",
                          canonical_name(name));
    }
    return entry->make(ctx, std::move(args));
}

auto FunctionRegistry::builtins() -> const FunctionRegistry& {
    static const FunctionRegistry kRegistry = [] {
        FunctionRegistry registry;
        register_builtin_functions(registry);
        spdlog::debug("builtin function registry populated with {} functions", registry.size());
        return registry;
    }();
    return kRegistry;
}

void register_builtin_functions(FunctionRegistry& registry) {
    register_arithmetic_functions(registry);
    register_compare_functions(registry);
    register_string_functions(registry);
    register_time_functions(registry);
    register_misc_functions(registry);
}

}  // namespace scalex::expression
