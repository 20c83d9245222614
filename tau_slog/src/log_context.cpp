#include "tau_slog/log_context.hpp"

#include <vector>

namespace tau {
namespace slog {

namespace {

thread_local std::vector<Context> tls_contexts;

} // namespace

Context Context::Current() {
    if (tls_contexts.empty()) {
        return Context();
    }
    return tls_contexts.back();
}

Context::Scope::Scope(Context ctx) {
    tls_contexts.push_back(std::move(ctx));
}

Context::Scope::~Scope() {
    tls_contexts.pop_back();
}

Context WithContext(const Context& ctx, const Entry& entry) {
    Context next = ctx;
    next.entry_ = std::make_shared<const Entry>(entry);
    return next;
}

Entry FromContext(const Context& ctx) {
    if (ctx.entry_) {
        return *ctx.entry_;
    }
    return Entry();
}

} // namespace slog
} // namespace tau
