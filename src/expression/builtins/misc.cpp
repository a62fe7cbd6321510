#include <scalex/expression/builtins.hpp>

#include "builtin_util.hpp"

#include <fmt/format.h>

#include <mutex>
#include <random>

namespace scalex::expression {

namespace {

auto thread_rng() -> std::mt19937_64& {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

/// Uniform double in [0, 1). With a seed argument every instance replays the same sequence.
class Rand final : public TypedFunction<Rand, double> {
   public:
    static constexpr Signature kSig = Signature::Rand;
    using TypedFunction::TypedFunction;

    Rand(const Rand& other) : TypedFunction(other) {
        std::lock_guard lock(other.mu_);
        seeded_ = other.seeded_;
        rng_ = other.rng_;
    }

    [[nodiscard]] auto eval_row(const chunk::Row& row) const -> EvalResult<double> {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        if (args().empty()) {
            return dist(thread_rng());
        }
        std::lock_guard lock(mu_);
        if (!seeded_) {
            auto seed = eval_arg<std::int64_t>(0, row);
            if (!seed) {
                return std::unexpected(seed.error());
            }
            rng_.seed(static_cast<std::uint64_t>(seed->value_or(0)));
            seeded_ = true;
        }
        return dist(rng_);
    }

   private:
    mutable std::mutex mu_;
    mutable bool seeded_ = false;
    mutable std::mt19937_64 rng_;
};

/// Random (version 4) UUID in its 36-character text form.
class Uuid final : public TypedFunction<Uuid, std::string> {
   public:
    static constexpr Signature kSig = Signature::Uuid;
    using TypedFunction::TypedFunction;

    [[nodiscard]] auto eval_row(const chunk::Row& /*row*/) const -> EvalResult<std::string> {
        auto& rng = thread_rng();
        const std::uint64_t hi = (rng() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        const std::uint64_t lo = (rng() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
        return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32U,
                           (hi >> 16U) & 0xFFFFU, hi & 0xFFFFU, lo >> 48U,
                           lo & 0xFFFFFFFFFFFFULL);
    }
};

auto make_rand(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    if (auto category = detail::numeric_category("rand", args); !category) {
        return std::unexpected(category.error());
    }
    return detail::make_builtin<Rand>(ctx, std::move(args), new_field_type(TypeCode::Double));
}

auto make_uuid(session::SessionContext& ctx, std::vector<ExprPtr> args)
    -> Result<std::unique_ptr<BuiltinFunction>> {
    auto type = new_field_type(TypeCode::Varchar);
    type.flen = 36;
    return detail::make_builtin<Uuid>(ctx, std::move(args), type);
}

}  // namespace

void register_misc_functions(FunctionRegistry& registry) {
    registry.register_function("rand", 0, 1, make_rand);
    registry.register_function("uuid", 0, 0, make_uuid);
}

}  // namespace scalex::expression
