#include <scalex/expression/constant_fold.hpp>
#include <scalex/expression/scalar_function.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace scalex::expression {

ScalarFunction::ScalarFunction(std::string name, FieldType ret_type,
                               std::unique_ptr<BuiltinFunction> function)
    : Expression(ExprKind::ScalarFunction),
      name_(canonical_name(name)),
      ret_type_(ret_type),
      function_(std::move(function)) {}

void ScalarFunction::replace_arg(std::size_t idx, ExprPtr arg) {
    function_->args().at(idx) = std::move(arg);
    hash_code_.reset();
}

auto ScalarFunction::eval(const chunk::Row& row) const -> Result<Datum> {
    switch (ret_type_.eval_type()) {
        case EvalType::Int: {
            auto value = eval_int(row);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (!value->has_value()) {
                return Datum{};
            }
            if (ret_type_.is_unsigned()) {
                return Datum{static_cast<std::uint64_t>(**value)};
            }
            return Datum{**value};
        }
        case EvalType::Real: {
            auto value = eval_real(row);
            if (!value) {
                return std::unexpected(value.error());
            }
            return value->has_value() ? Datum{**value} : Datum{};
        }
        case EvalType::String: {
            auto value = eval_string(row);
            if (!value) {
                return std::unexpected(value.error());
            }
            return value->has_value() ? Datum{std::move(**value)} : Datum{};
        }
        default:
            // Other categories are not dispatched here; eval_to_datum covers them.
            return Datum{};
    }
}

auto ScalarFunction::hash_code(const session::StatementContext& sc) const -> const HashCode& {
    return hash_code_.get_or_compute([this, &sc] {
        HashCode bytes{kScalarFunctionFlag};
        codec::encode_compact_bytes(bytes, name_);
        for (const auto& arg : args()) {
            const auto& arg_hash = arg->hash_code(sc);
            bytes.insert(bytes.end(), arg_hash.begin(), arg_hash.end());
        }
        return bytes;
    });
}

auto ScalarFunction::equal(const Expression& other) const -> bool {
    if (other.kind() != ExprKind::ScalarFunction) {
        return false;
    }
    const auto& fn = static_cast<const ScalarFunction&>(other);
    return name_ == fn.name_ && function_->equal(*fn.function_);
}

auto ScalarFunction::is_correlated() const -> bool {
    return std::ranges::any_of(args(), [](const ExprPtr& arg) { return arg->is_correlated(); });
}

auto ScalarFunction::const_item() const -> bool {
    if (is_unfoldable_function(name_)) {
        return false;
    }
    return std::ranges::all_of(args(), [](const ExprPtr& arg) { return arg->const_item(); });
}

auto ScalarFunction::decorrelate(const Schema& schema) -> ExprPtr {
    for (auto& arg : function_->args()) {
        arg = arg->decorrelate(schema);
    }
    hash_code_.reset();
    return shared_from_this();
}

auto ScalarFunction::resolve_indices(const Schema& schema) const -> Result<ExprPtr> {
    auto copy = std::static_pointer_cast<ScalarFunction>(clone());
    if (auto status = copy->resolve_indices_in_place(schema); !status) {
        return std::unexpected(status.error());
    }
    return copy;
}

auto ScalarFunction::resolve_indices_in_place(const Schema& schema) -> Status {
    for (auto& arg : function_->args()) {
        if (auto status = arg->resolve_indices_in_place(schema); !status) {
            return status;
        }
    }
    return {};
}

auto ScalarFunction::clone() const -> ExprPtr {
    auto copy = std::make_shared<ScalarFunction>(name_, ret_type_, function_->clone());
    copy->hash_code_ = hash_code_;
    return copy;
}

auto ScalarFunction::to_string() const -> std::string {
    std::string out = name_;
    out.push_back('(');
    const auto& fn_args = args();
    for (std::size_t i = 0; i < fn_args.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(fn_args[i]->to_string());
    }
    out.push_back(')');
    return out;
}

// ─── Construction ─────────────────────────────────────────────────────────────

auto new_function_impl(session::SessionContext& ctx, const FunctionRegistry& registry, bool fold,
                       std::string_view name, std::optional<FieldType> ret_type,
                       std::vector<ExprPtr> args) -> Result<ExprPtr> {
    if (!ret_type.has_value()) {
        return make_error(ErrorCode::InvalidReturnType, "function {} has no return type", name);
    }
    auto fn_name = canonical_name(name);
    if (!registry.contains(fn_name)) {
        return make_error(ErrorCode::FunctionNotFound, "function {} does not exist", fn_name);
    }
    auto function = registry.get_function(ctx, fn_name, std::move(args));
    if (!function) {
        return std::unexpected(function.error());
    }
    auto final_type = (*function)->ret_type();
    if (final_type.tp == TypeCode::Unspecified && ret_type->tp != TypeCode::Unspecified) {
        final_type = *ret_type;
    }
    ExprPtr node =
        std::make_shared<ScalarFunction>(std::move(fn_name), final_type, std::move(*function));
    if (fold) {
        return fold_constant(std::move(node));
    }
    return node;
}

auto new_function(session::SessionContext& ctx, std::string_view name,
                  std::optional<FieldType> ret_type, std::vector<ExprPtr> args)
    -> Result<ExprPtr> {
    return new_function_impl(ctx, FunctionRegistry::builtins(), true, name, ret_type,
                             std::move(args));
}

auto new_function_base(session::SessionContext& ctx, std::string_view name,
                       std::optional<FieldType> ret_type, std::vector<ExprPtr> args)
    -> Result<ExprPtr> {
    return new_function_impl(ctx, FunctionRegistry::builtins(), false, name, ret_type,
                             std::move(args));
}

auto new_function_internal(session::SessionContext& ctx, std::string_view name,
                           std::optional<FieldType> ret_type, std::vector<ExprPtr> args)
    -> ExprPtr {
    auto expr = new_function(ctx, name, ret_type, std::move(args));
    if (!expr) {
        spdlog::error("building function {} failed: {}", name, expr.error().format());
        return nullptr;
    }
    return std::move(*expr);
}

auto scalar_funcs_to_exprs(const std::vector<std::shared_ptr<ScalarFunction>>& funcs)
    -> std::vector<ExprPtr> {
    std::vector<ExprPtr> exprs;
    exprs.reserve(funcs.size());
    for (const auto& fn : funcs) {
        exprs.push_back(fn);
    }
    return exprs;
}

}  // namespace scalex::expression
