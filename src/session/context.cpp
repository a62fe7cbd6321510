#include <scalex/session/context.hpp>

namespace scalex::session {

void StatementContext::append_warning(Error warning) {
    std::lock_guard lock(mu_);
    warnings_.push_back(std::move(warning));
}

auto StatementContext::warnings() const -> std::vector<Error> {
    std::lock_guard lock(mu_);
    return warnings_;
}

auto StatementContext::warning_count() const -> std::size_t {
    std::lock_guard lock(mu_);
    return warnings_.size();
}

void StatementContext::reset_warnings() {
    std::lock_guard lock(mu_);
    warnings_.clear();
}

}  // namespace scalex::session
