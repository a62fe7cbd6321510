#pragma once

#include <scalex/expression/expression.hpp>

namespace scalex::expression {

/// Replaces constant subtrees of `expr` with literals.
///
/// Function arguments are folded first. A node that is const_item() is then evaluated once on
/// the empty row and returned as a Constant of its declared type. Evaluation failures leave the
/// node as it was.
///
/// `expr` and its subtrees are never modified. A call whose arguments fold is rebuilt from a
/// clone, so trees sharing the original nodes keep their rendering and memoized hash.
[[nodiscard]] auto fold_constant(ExprPtr expr) -> ExprPtr;

}  // namespace scalex::expression
