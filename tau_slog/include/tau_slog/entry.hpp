#pragma once
#include "format.hpp"
#include "log_record.hpp"
#include "platform.hpp"
#include "severity.hpp"
#include "span_context.hpp"
#include "stack_trace.hpp"
#include "value.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tau {
namespace slog {

class Logger;

// A set of fields reused across log calls. With* calls return a child that
// owns its own copies; the parent is never modified. The operation calls are
// the exception: they update the receiver and return it.
class Entry {
public:
    // Bound to Logger::Default().
    Entry();
    explicit Entry(Logger* logger);

    // ===== Children =====
    Entry WithLabels(const Fields& labels) const;
    Entry WithDetail(const std::string& key, Value value) const;
    Entry WithDetails(const Fields& details) const;
    Entry WithError(const std::exception& err) const;
    Entry WithError(const std::exception_ptr& err) const;
    Entry WithError(const std::error_code& err) const;
    Entry WithSpan(const SpanContext& span) const;
    // Captures the caller's stack; it is rendered only when an entry is written.
    TAU_SLOG_NOINLINE Entry WithStack() const;

    // ===== Operation lifecycle (in place) =====
    Entry& WithOperation(const std::string& id, const std::string& producer);
    // Writes a NOTICE entry flagged as the first of the operation.
    TAU_SLOG_NOINLINE Entry& StartOperation(const std::string& id, const std::string& producer);
    // Writes a NOTICE entry flagged as the last, then drops the operation.
    // Does nothing when no operation is set.
    TAU_SLOG_NOINLINE void EndOperation();

    // ===== Accessors =====
    Logger& Owner() const;
    const Labels& GetLabels() const { return labels_; }
    const Fields& Details() const { return details_; }
    const std::optional<Operation>& CurrentOperation() const { return operation_; }
    const std::string& ErrorMessage() const { return error_; }
    const std::string& Trace() const { return trace_; }
    const std::string& SpanId() const { return span_id_; }
    bool TraceSampled() const { return trace_sampled_; }
    bool HasStack() const { return stack_ != nullptr; }

    // Fields of this entry; message, severity and source are left unset.
    LogRecord ToRecord() const;

    // ===== Emission =====
    // Print-style: operands are joined, with a space between two adjacent
    // operands when neither is a string. f-suffixed forms take a printf format.
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Debug(const Args&... args) const {
        Log(Severity::Debug, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Debugf(std::string_view format, const Args&... args) const {
        Log(Severity::Debug, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Info(const Args&... args) const {
        Log(Severity::Info, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Infof(std::string_view format, const Args&... args) const {
        Log(Severity::Info, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Notice(const Args&... args) const {
        Log(Severity::Notice, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Noticef(std::string_view format, const Args&... args) const {
        Log(Severity::Notice, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Warn(const Args&... args) const {
        Log(Severity::Warning, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Warnf(std::string_view format, const Args&... args) const {
        Log(Severity::Warning, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Error(const Args&... args) const {
        Log(Severity::Error, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Errorf(std::string_view format, const Args&... args) const {
        Log(Severity::Error, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Critical(const Args&... args) const {
        Log(Severity::Critical, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Criticalf(std::string_view format, const Args&... args) const {
        Log(Severity::Critical, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Alert(const Args&... args) const {
        Log(Severity::Alert, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Alertf(std::string_view format, const Args&... args) const {
        Log(Severity::Alert, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Emergency(const Args&... args) const {
        Log(Severity::Emergency, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Emergencyf(std::string_view format, const Args&... args) const {
        Log(Severity::Emergency, Sprintf(format, args...));
    }

    // Generic emitter behind every severity method. The source location is
    // taken from this function's return address.
    TAU_SLOG_NOINLINE void Log(Severity severity, std::string message) const;

private:
    void Emit(Severity severity, std::string message, std::uintptr_t caller,
              const std::shared_ptr<const StackSnapshot>& stack) const;

    Logger*                              logger_;
    Labels                               labels_;
    Fields                               details_;
    std::optional<Operation>             operation_;
    std::string                          trace_;
    std::string                          span_id_;
    bool                                 trace_sampled_ = false;
    std::string                          error_;
    std::shared_ptr<const StackSnapshot> stack_;
};

} // namespace slog
} // namespace tau
