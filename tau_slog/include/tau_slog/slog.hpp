#pragma once
#include "entry.hpp"
#include "log_context.hpp"
#include "logger.hpp"
#include "platform.hpp"
#include "severity.hpp"
#include "span_context.hpp"
#include "value.hpp"
#include "sinks/callback_sink.hpp"
#include "sinks/console_sink.hpp"
#include "sinks/file_sink.hpp"
#include "sinks/memory_sink.hpp"

#include <memory>
#include <string>

// Package-level functions. All of them act on Logger::Default().
namespace tau {
namespace slog {

void SetOutput(std::shared_ptr<ILogSink> output);
void SetErrorOutput(std::shared_ptr<ILogSink> output);
void SetProject(const std::string& project);
void SetIncludeSources(bool include);

Entry NewEntry();
Entry WithLabels(const Fields& labels);
Entry WithDetail(const std::string& key, Value value);
Entry WithDetails(const Fields& details);
Entry WithSpan(const SpanContext& span);
Entry WithOperation(const std::string& id, const std::string& producer);

template <typename E>
Entry WithError(const E& err) {
    return Logger::Default().WithError(err);
}

TAU_SLOG_ALWAYS_INLINE Entry WithStack() {
    return Logger::Default().WithStack();
}

TAU_SLOG_ALWAYS_INLINE Entry StartOperation(const std::string& id, const std::string& producer) {
    return Logger::Default().StartOperation(id, producer);
}

#define TAU_SLOG_DEFINE_SEVERITY_(name)                                                    \
    template <typename... Args>                                                            \
    TAU_SLOG_ALWAYS_INLINE void name(const Args&... args) {                                \
        Logger::Default().name(args...);                                                   \
    }                                                                                      \
    template <typename... Args>                                                            \
    TAU_SLOG_ALWAYS_INLINE void name##f(std::string_view format, const Args&... args) {    \
        Logger::Default().name##f(format, args...);                                        \
    }

TAU_SLOG_DEFINE_SEVERITY_(Debug)
TAU_SLOG_DEFINE_SEVERITY_(Info)
TAU_SLOG_DEFINE_SEVERITY_(Notice)
TAU_SLOG_DEFINE_SEVERITY_(Warn)
TAU_SLOG_DEFINE_SEVERITY_(Error)
TAU_SLOG_DEFINE_SEVERITY_(Critical)
TAU_SLOG_DEFINE_SEVERITY_(Alert)
TAU_SLOG_DEFINE_SEVERITY_(Emergency)

#undef TAU_SLOG_DEFINE_SEVERITY_

} // namespace slog
} // namespace tau
