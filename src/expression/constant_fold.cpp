#include <scalex/expression/constant.hpp>
#include <scalex/expression/constant_fold.hpp>
#include <scalex/expression/scalar_function.hpp>

#include <spdlog/spdlog.h>

namespace scalex::expression {

auto fold_constant(ExprPtr expr) -> ExprPtr {
    if (expr->kind() != ExprKind::ScalarFunction) {
        return expr;
    }
    auto fn = std::static_pointer_cast<ScalarFunction>(expr);

    // Arguments may be shared with other trees; rewrites go to a private clone.
    std::shared_ptr<ScalarFunction> rewritten;
    for (std::size_t i = 0; i < fn->args().size(); ++i) {
        const auto& arg = fn->args()[i];
        auto folded = fold_constant(arg);
        if (folded == arg) {
            continue;
        }
        if (!rewritten) {
            rewritten = std::static_pointer_cast<ScalarFunction>(fn->clone());
        }
        rewritten->replace_arg(i, std::move(folded));
    }
    if (rewritten) {
        fn = std::move(rewritten);
    }

    if (!fn->const_item()) {
        return fn;
    }
    auto value = eval_to_datum(*fn, chunk::Row{});
    if (!value) {
        spdlog::debug("constant folding of {} skipped: {}", fn->to_string(),
                      value.error().format());
        return fn;
    }
    return Constant::make(std::move(*value), fn->type());
}

}  // namespace scalex::expression
