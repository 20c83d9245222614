#include "tau_slog/entry.hpp"

#include "tau_slog/logger.hpp"

namespace tau {
namespace slog {

Entry::Entry()
    : logger_(nullptr) {}

Entry::Entry(Logger* logger)
    : logger_(logger) {}

Logger& Entry::Owner() const {
    return logger_ ? *logger_ : Logger::Default();
}

Entry Entry::WithLabels(const Fields& labels) const {
    Entry child = *this;
    for (const auto& kv : labels) {
        child.labels_[kv.first] = kv.second.ToString();
    }
    return child;
}

Entry Entry::WithDetail(const std::string& key, Value value) const {
    Entry child = *this;
    child.details_[key] = std::move(value);
    return child;
}

Entry Entry::WithDetails(const Fields& details) const {
    Entry child = *this;
    for (const auto& kv : details) {
        child.details_[kv.first] = kv.second;
    }
    return child;
}

Entry Entry::WithError(const std::exception& err) const {
    Entry child = *this;
    child.error_ = err.what();
    return child;
}

Entry Entry::WithError(const std::exception_ptr& err) const {
    Entry child = *this;
    child.error_.clear();
    if (err) {
        try {
            std::rethrow_exception(err);
        } catch (const std::exception& e) {
            child.error_ = e.what();
        } catch (...) {
            child.error_ = "unknown exception";
        }
    }
    return child;
}

Entry Entry::WithError(const std::error_code& err) const {
    Entry child = *this;
    child.error_ = err ? err.message() : std::string();
    return child;
}

Entry Entry::WithSpan(const SpanContext& span) const {
    Entry child = *this;
    std::string project = Owner().Project();
    if (project.empty()) {
        child.trace_.clear();
        child.span_id_.clear();
        child.trace_sampled_ = false;
        return child;
    }
    child.trace_         = Sprint("projects/", project, "/traces/", span.trace_id);
    child.span_id_       = span.span_id;
    child.trace_sampled_ = span.sampled;
    return child;
}

Entry Entry::WithStack() const {
    Entry child = *this;
    child.stack_ = std::make_shared<const StackSnapshot>(StackSnapshot::Capture(1));
    return child;
}

Entry& Entry::WithOperation(const std::string& id, const std::string& producer) {
    operation_ = Operation{id, producer, false, false};
    return *this;
}

Entry& Entry::StartOperation(const std::string& id, const std::string& producer) {
    operation_ = Operation{id, producer, true, false};
    Emit(Severity::Notice, Sprint(producer, " starting operation ", id),
         TAU_SLOG_RETURN_ADDRESS(), stack_);
    operation_->first = false;
    return *this;
}

void Entry::EndOperation() {
    if (!operation_) {
        return;
    }
    operation_->last = true;
    Emit(Severity::Notice, Sprint(operation_->producer, " ending operation ", operation_->id),
         TAU_SLOG_RETURN_ADDRESS(), stack_);
    operation_.reset();
}

LogRecord Entry::ToRecord() const {
    LogRecord record;
    record.labels        = labels_;
    record.operation     = operation_;
    record.trace         = trace_;
    record.span_id       = span_id_;
    record.trace_sampled = trace_sampled_;
    record.details       = details_;
    record.error         = error_;
    return record;
}

void Entry::Log(Severity severity, std::string message) const {
    std::uintptr_t caller = TAU_SLOG_RETURN_ADDRESS();
    if (CapturesStack(severity)) {
        // Skip Capture and this frame so the trace starts at the call site.
        auto stack = std::make_shared<const StackSnapshot>(StackSnapshot::Capture(1));
        Emit(severity, std::move(message), caller, stack);
        return;
    }
    Emit(severity, std::move(message), caller, stack_);
}

void Entry::Emit(Severity severity, std::string message, std::uintptr_t caller,
                 const std::shared_ptr<const StackSnapshot>& stack) const {
    Owner().Write(*this, severity, std::move(message), caller, stack);
}

} // namespace slog
} // namespace tau
