#include "tau_slog/logger.hpp"

#include "tau_slog/sinks/console_sink.hpp"
#include "tau_slog/source_location.hpp"

#include <cstdio>
#include <exception>

namespace tau {
namespace slog {

Logger::Logger()
    : Logger(std::make_shared<ConsoleSink>(ConsoleSink::Stream::Stdout)) {}

Logger::Logger(std::shared_ptr<ILogSink> output)
    : output_(std::move(output))
    , error_output_(std::make_shared<ConsoleSink>(ConsoleSink::Stream::Stderr))
    , base_(this) {}

Logger& Logger::Default() {
    static Logger logger;
    return logger;
}

void Logger::SetOutput(std::shared_ptr<ILogSink> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = std::move(output);
}

void Logger::SetErrorOutput(std::shared_ptr<ILogSink> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_output_ = std::move(output);
}

void Logger::SetProject(const std::string& project) {
    std::lock_guard<std::mutex> lock(mutex_);
    project_ = project;
}

std::string Logger::Project() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return project_;
}

void Logger::SetIncludeSources(bool include) {
    std::lock_guard<std::mutex> lock(mutex_);
    include_sources_.store(include, std::memory_order_relaxed);
}

bool Logger::IncludeSources() const {
    return include_sources_.load(std::memory_order_relaxed);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (output_) {
        output_->Flush();
    }
}

void Logger::Write(const Entry& entry, Severity severity, std::string message,
                   std::uintptr_t caller, const std::shared_ptr<const StackSnapshot>& stack) {
    // Resolve, render and serialize before taking the lock.
    LogRecord record = entry.ToRecord();
    if (IncludeSources() && caller != 0) {
        record.source_location = SourceLocationCache::Instance().Resolve(caller);
    }
    if (stack && !stack->Empty()) {
        record.stack_trace = stack->Format(record.error.empty() ? message : record.error);
    }
    record.severity = severity;
    record.message  = std::move(message);

    std::string line;
    try {
        line = formatter_.Format(record);
        line += '\n';
    } catch (const SerializationError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        ReportLocked(e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!output_) {
        return;
    }
    try {
        output_->Write(line);
    } catch (const std::exception& e) {
        ReportLocked(e.what());
    } catch (...) {
        ReportLocked("unknown sink error");
    }
}

void Logger::ReportLocked(const char* cause) {
    std::string diag = Sprint("could not marshal log: ", cause, "\n");
    if (!error_output_) {
        return;
    }
    try {
        error_output_->Write(diag);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "could not marshal log: %s (%s)\n", cause, e.what());
    } catch (...) {
        std::fprintf(stderr, "could not marshal log: %s (unknown error output failure)\n", cause);
    }
}

} // namespace slog
} // namespace tau
