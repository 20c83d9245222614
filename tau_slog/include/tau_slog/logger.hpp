#pragma once
#include "entry.hpp"
#include "formatters/json_formatter.hpp"
#include "platform.hpp"
#include "severity.hpp"
#include "sinks/sink_interface.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace tau {
namespace slog {

// Writes entries as JSON lines to one output. Writes and setters are
// serialized by a single mutex; an entry is formatted before the lock is
// taken, so each write is one whole line.
class Logger {
public:
    // Writes to stdout.
    Logger();
    explicit Logger(std::shared_ptr<ILogSink> output);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Process-wide logger used by the package-level functions.
    static Logger& Default();

    // A null output discards entries.
    void SetOutput(std::shared_ptr<ILogSink> output);
    // Destination of serialization diagnostics; stderr by default.
    void SetErrorOutput(std::shared_ptr<ILogSink> output);
    // Project id used to qualify trace names.
    void SetProject(const std::string& project);
    std::string Project() const;
    // Include file, line and function of the call site (default true).
    void SetIncludeSources(bool include);
    bool IncludeSources() const;

    void Flush();

    Entry NewEntry() { return Entry(this); }

    // ===== Chain starters =====
    Entry WithLabels(const Fields& labels) { return NewEntry().WithLabels(labels); }
    Entry WithDetail(const std::string& key, Value value) {
        return NewEntry().WithDetail(key, std::move(value));
    }
    Entry WithDetails(const Fields& details) { return NewEntry().WithDetails(details); }
    template <typename E>
    Entry WithError(const E& err) { return NewEntry().WithError(err); }
    Entry WithSpan(const SpanContext& span) { return NewEntry().WithSpan(span); }
    Entry WithOperation(const std::string& id, const std::string& producer) {
        Entry e(this);
        e.WithOperation(id, producer);
        return e;
    }
    TAU_SLOG_ALWAYS_INLINE Entry WithStack() { return NewEntry().WithStack(); }
    TAU_SLOG_ALWAYS_INLINE Entry StartOperation(const std::string& id, const std::string& producer) {
        Entry e(this);
        e.StartOperation(id, producer);
        return e;
    }

    // ===== Emission =====
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Debug(const Args&... args) {
        base_.Log(Severity::Debug, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Debugf(std::string_view format, const Args&... args) {
        base_.Log(Severity::Debug, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Info(const Args&... args) {
        base_.Log(Severity::Info, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Infof(std::string_view format, const Args&... args) {
        base_.Log(Severity::Info, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Notice(const Args&... args) {
        base_.Log(Severity::Notice, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Noticef(std::string_view format, const Args&... args) {
        base_.Log(Severity::Notice, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Warn(const Args&... args) {
        base_.Log(Severity::Warning, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Warnf(std::string_view format, const Args&... args) {
        base_.Log(Severity::Warning, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Error(const Args&... args) {
        base_.Log(Severity::Error, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Errorf(std::string_view format, const Args&... args) {
        base_.Log(Severity::Error, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Critical(const Args&... args) {
        base_.Log(Severity::Critical, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Criticalf(std::string_view format, const Args&... args) {
        base_.Log(Severity::Critical, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Alert(const Args&... args) {
        base_.Log(Severity::Alert, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Alertf(std::string_view format, const Args&... args) {
        base_.Log(Severity::Alert, Sprintf(format, args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Emergency(const Args&... args) {
        base_.Log(Severity::Emergency, Sprint(args...));
    }
    template <typename... Args>
    TAU_SLOG_ALWAYS_INLINE void Emergencyf(std::string_view format, const Args&... args) {
        base_.Log(Severity::Emergency, Sprintf(format, args...));
    }

private:
    friend class Entry;

    void Write(const Entry& entry, Severity severity, std::string message,
               std::uintptr_t caller, const std::shared_ptr<const StackSnapshot>& stack);
    void ReportLocked(const char* cause);

    mutable std::mutex        mutex_;
    std::shared_ptr<ILogSink> output_;
    std::shared_ptr<ILogSink> error_output_;
    std::string               project_;
    std::atomic<bool>         include_sources_{true};
    JsonFormatter             formatter_;
    Entry                     base_;
};

} // namespace slog
} // namespace tau
