#pragma once

#include <scalex/chunk/chunk.hpp>
#include <scalex/core/datum.hpp>
#include <scalex/core/error.hpp>
#include <scalex/core/field_type.hpp>
#include <scalex/session/context.hpp>
#include <scalex/util/codec.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace scalex::expression {

class Schema;
class Expression;

/// Sub-trees may be shared by several parents until a rewrite clones them.
using ExprPtr = std::shared_ptr<Expression>;

using HashCode = codec::Bytes;

/// Result of a typed evaluator: an empty optional is SQL NULL.
template <typename T>
using EvalResult = Result<std::optional<T>>;

/// The closed set of expression node kinds.
enum class ExprKind : std::uint8_t {
    Column,
    CorrelatedColumn,
    Constant,
    ScalarFunction,
};

/// Leading byte of each node's hash code.
inline constexpr std::uint8_t kConstantFlag = 0;
inline constexpr std::uint8_t kColumnFlag = 1;
inline constexpr std::uint8_t kScalarFunctionFlag = 3;

/// One-shot memoization slot for a node's hash code.
///
/// The first get_or_compute() stores the bytes under a lock; later calls return them
/// unchanged. reset() is for structural rewrites, which run before evaluation is shared
/// across threads. Copies carry the stored bytes.
class HashCache {
   public:
    HashCache() = default;
    HashCache(const HashCache& other) : bytes_(other.snapshot()) {}
    auto operator=(const HashCache& other) -> HashCache& {
        if (this != &other) {
            auto bytes = other.snapshot();
            std::lock_guard lock(mu_);
            bytes_ = std::move(bytes);
        }
        return *this;
    }

    template <typename F>
    auto get_or_compute(F&& compute) -> const HashCode& {
        std::lock_guard lock(mu_);
        if (bytes_.empty()) {
            bytes_ = std::forward<F>(compute)();
        }
        return bytes_;
    }

    void reset() {
        std::lock_guard lock(mu_);
        bytes_.clear();
    }

    [[nodiscard]] auto empty() const -> bool {
        std::lock_guard lock(mu_);
        return bytes_.empty();
    }

   private:
    [[nodiscard]] auto snapshot() const -> HashCode {
        std::lock_guard lock(mu_);
        return bytes_;
    }

    mutable std::mutex mu_;
    HashCode bytes_;
};

/// Base of every node in a value-producing expression tree.
///
/// Planning-time rewrites (decorrelate, resolve_indices) run single-threaded. Evaluation
/// never changes tree structure and may run concurrently on disjoint batches.
class Expression : public std::enable_shared_from_this<Expression> {
   public:
    explicit Expression(ExprKind kind) : kind_(kind) {}
    virtual ~Expression() = default;

    Expression(const Expression&) = delete;
    auto operator=(const Expression&) -> Expression& = delete;

    [[nodiscard]] auto kind() const noexcept -> ExprKind { return kind_; }
    [[nodiscard]] virtual auto type() const noexcept -> const FieldType& = 0;

    // ─── Row-at-a-time evaluation ─────────────────────────────────────────────

    [[nodiscard]] virtual auto eval(const chunk::Row& row) const -> Result<Datum> = 0;
    [[nodiscard]] virtual auto eval_int(const chunk::Row& row) const
        -> EvalResult<std::int64_t> = 0;
    [[nodiscard]] virtual auto eval_real(const chunk::Row& row) const -> EvalResult<double> = 0;
    [[nodiscard]] virtual auto eval_string(const chunk::Row& row) const
        -> EvalResult<std::string> = 0;
    [[nodiscard]] virtual auto eval_decimal(const chunk::Row& row) const
        -> EvalResult<Decimal> = 0;
    [[nodiscard]] virtual auto eval_time(const chunk::Row& row) const -> EvalResult<Timestamp> = 0;
    [[nodiscard]] virtual auto eval_duration(const chunk::Row& row) const
        -> EvalResult<Duration> = 0;

    // ─── Vectorized evaluation ────────────────────────────────────────────────
    //  Each evaluator resets `result` to the batch size and fills it in place.
    //  An error aborts the batch; the buffer contents are then unspecified.

    [[nodiscard]] virtual auto vec_eval_int(const chunk::Chunk& input,
                                            chunk::ColumnVector& result) const -> Status = 0;
    [[nodiscard]] virtual auto vec_eval_real(const chunk::Chunk& input,
                                             chunk::ColumnVector& result) const -> Status = 0;
    [[nodiscard]] virtual auto vec_eval_string(const chunk::Chunk& input,
                                               chunk::ColumnVector& result) const -> Status = 0;
    [[nodiscard]] virtual auto vec_eval_decimal(const chunk::Chunk& input,
                                                chunk::ColumnVector& result) const -> Status = 0;
    [[nodiscard]] virtual auto vec_eval_time(const chunk::Chunk& input,
                                             chunk::ColumnVector& result) const -> Status = 0;
    [[nodiscard]] virtual auto vec_eval_duration(const chunk::Chunk& input,
                                                 chunk::ColumnVector& result) const -> Status = 0;

    /// Whether the vec_eval_* entry points are usable for this whole subtree.
    [[nodiscard]] virtual auto vectorized() const -> bool = 0;

    // ─── Structure ────────────────────────────────────────────────────────────

    /// Memoized structural hash; the statement context is only consulted on the first call.
    [[nodiscard]] virtual auto hash_code(const session::StatementContext& sc) const
        -> const HashCode& = 0;
    [[nodiscard]] virtual auto equal(const Expression& other) const -> bool = 0;

    /// True when the subtree references a column of an enclosing query scope.
    [[nodiscard]] virtual auto is_correlated() const -> bool = 0;

    /// True when the subtree evaluates to the same value for every row.
    [[nodiscard]] virtual auto const_item() const -> bool = 0;

    /// Rewrites correlated references that `schema` provides. Mutates in place; clone first
    /// to keep the original.
    [[nodiscard]] virtual auto decorrelate(const Schema& schema) -> ExprPtr = 0;

    /// Independent copy with every column bound to its offset in `schema`. Never mutates
    /// the receiver.
    [[nodiscard]] virtual auto resolve_indices(const Schema& schema) const -> Result<ExprPtr> = 0;

    [[nodiscard]] virtual auto clone() const -> ExprPtr = 0;

    [[nodiscard]] virtual auto to_string() const -> std::string = 0;

    /// The rendered string, double-quoted.
    [[nodiscard]] auto to_json() const -> std::string;

   protected:
    friend class ScalarFunction;

    /// Binds column offsets inside an already-cloned subtree.
    [[nodiscard]] virtual auto resolve_indices_in_place(const Schema& schema) -> Status = 0;

   private:
    ExprKind kind_;
};

// ─── Category helpers ─────────────────────────────────────────────────────────

template <typename T>
inline constexpr bool kIsEvalValue =
    std::is_same_v<T, std::int64_t> || std::is_same_v<T, double> ||
    std::is_same_v<T, std::string> || std::is_same_v<T, Decimal> ||
    std::is_same_v<T, Timestamp> || std::is_same_v<T, Duration>;

/// Evaluation category whose evaluators produce T.
template <typename T>
    requires kIsEvalValue<T>
constexpr auto eval_type_of() noexcept -> EvalType {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        return EvalType::Int;
    } else if constexpr (std::is_same_v<T, double>) {
        return EvalType::Real;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return EvalType::String;
    } else if constexpr (std::is_same_v<T, Decimal>) {
        return EvalType::Decimal;
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        return EvalType::Datetime;
    } else {
        return EvalType::Duration;
    }
}

/// Calls the typed row evaluator matching T.
template <typename T>
    requires kIsEvalValue<T>
[[nodiscard]] auto eval_as(const Expression& expr, const chunk::Row& row) -> EvalResult<T> {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        return expr.eval_int(row);
    } else if constexpr (std::is_same_v<T, double>) {
        return expr.eval_real(row);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return expr.eval_string(row);
    } else if constexpr (std::is_same_v<T, Decimal>) {
        return expr.eval_decimal(row);
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        return expr.eval_time(row);
    } else {
        return expr.eval_duration(row);
    }
}

/// Calls the typed vectorized evaluator matching T.
template <typename T>
    requires kIsEvalValue<T>
[[nodiscard]] auto vec_eval_as(const Expression& expr, const chunk::Chunk& input,
                               chunk::ColumnVector& result) -> Status {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        return expr.vec_eval_int(input, result);
    } else if constexpr (std::is_same_v<T, double>) {
        return expr.vec_eval_real(input, result);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return expr.vec_eval_string(input, result);
    } else if constexpr (std::is_same_v<T, Decimal>) {
        return expr.vec_eval_decimal(input, result);
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        return expr.vec_eval_time(input, result);
    } else {
        return expr.vec_eval_duration(input, result);
    }
}

/// Evaluates `expr` through the typed evaluator of its declared category and boxes the
/// result. Covers all six categories; unsigned integer types box as std::uint64_t.
[[nodiscard]] auto eval_to_datum(const Expression& expr, const chunk::Row& row) -> Result<Datum>;

}  // namespace scalex::expression
