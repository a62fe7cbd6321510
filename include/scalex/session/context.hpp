#pragma once

#include <scalex/core/error.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace scalex::session {

/// Session-level settings that builtins read during evaluation.
struct SessionVars {
    std::string time_zone_name = "UTC";
    /// Offset added to UTC instants before they are exposed as Timestamp values.
    std::chrono::seconds time_zone_offset{0};
    bool strict_mode = true;
    /// When set, division by zero fails instead of producing NULL plus a warning.
    bool error_on_division_by_zero = false;
    bool enable_vectorized_expression = true;
    std::size_t max_chunk_size = 1024;
};

/// Per-statement state shared by every expression evaluated for the statement.
///
/// Warnings may be appended concurrently from several evaluating threads.
class StatementContext {
   public:
    StatementContext() = default;

    StatementContext(const StatementContext&) = delete;
    auto operator=(const StatementContext&) -> StatementContext& = delete;

    void append_warning(Error warning);

    [[nodiscard]] auto warnings() const -> std::vector<Error>;
    [[nodiscard]] auto warning_count() const -> std::size_t;

    void reset_warnings();

   private:
    mutable std::mutex mu_;
    std::vector<Error> warnings_;
};

/// Execution context handed to every builtin at construction time.
///
/// Builtins keep a non-owning reference; the session outlives the expressions built for it.
class SessionContext {
   public:
    SessionContext() = default;
    explicit SessionContext(SessionVars vars) : vars_(std::move(vars)) {}

    SessionContext(const SessionContext&) = delete;
    auto operator=(const SessionContext&) -> SessionContext& = delete;

    [[nodiscard]] auto vars() const noexcept -> const SessionVars& { return vars_; }
    [[nodiscard]] auto vars() noexcept -> SessionVars& { return vars_; }

    [[nodiscard]] auto stmt() const noexcept -> const StatementContext& { return stmt_; }
    [[nodiscard]] auto stmt() noexcept -> StatementContext& { return stmt_; }

   private:
    SessionVars vars_;
    StatementContext stmt_;
};

}  // namespace scalex::session
