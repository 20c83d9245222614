#include "tau_slog/slog.hpp"

namespace tau {
namespace slog {

void SetOutput(std::shared_ptr<ILogSink> output) {
    Logger::Default().SetOutput(std::move(output));
}

void SetErrorOutput(std::shared_ptr<ILogSink> output) {
    Logger::Default().SetErrorOutput(std::move(output));
}

void SetProject(const std::string& project) {
    Logger::Default().SetProject(project);
}

void SetIncludeSources(bool include) {
    Logger::Default().SetIncludeSources(include);
}

Entry NewEntry() {
    return Logger::Default().NewEntry();
}

Entry WithLabels(const Fields& labels) {
    return Logger::Default().WithLabels(labels);
}

Entry WithDetail(const std::string& key, Value value) {
    return Logger::Default().WithDetail(key, std::move(value));
}

Entry WithDetails(const Fields& details) {
    return Logger::Default().WithDetails(details);
}

Entry WithSpan(const SpanContext& span) {
    return Logger::Default().WithSpan(span);
}

Entry WithOperation(const std::string& id, const std::string& producer) {
    return Logger::Default().WithOperation(id, producer);
}

} // namespace slog
} // namespace tau
