#pragma once

#include <scalex/expression/function_registry.hpp>

namespace scalex::expression {

// Catalog registration, one entry point per family.

void register_arithmetic_functions(FunctionRegistry& registry);
void register_compare_functions(FunctionRegistry& registry);
void register_string_functions(FunctionRegistry& registry);
void register_time_functions(FunctionRegistry& registry);
void register_misc_functions(FunctionRegistry& registry);

/// Registers every family above.
void register_builtin_functions(FunctionRegistry& registry);

}  // namespace scalex::expression
