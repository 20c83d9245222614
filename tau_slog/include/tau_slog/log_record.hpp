#pragma once
#include <map>
#include <optional>
#include <string>

#include "severity.hpp"
#include "source_location.hpp"
#include "value.hpp"

namespace tau {
namespace slog {

using Labels = std::map<std::string, std::string>;

// A logical unit of work spanning several log entries.
struct Operation {
    std::string id;
    std::string producer;
    bool        first = false;
    bool        last  = false;
};

// Snapshot of one entry at emission time, as handed to the formatter.
struct LogRecord {
    std::string message;
    Severity    severity = Severity::Info;

    Labels                        labels;
    std::optional<SourceLocation> source_location;
    std::optional<Operation>      operation;

    std::string trace;
    std::string span_id;
    bool        trace_sampled = false;

    Fields      details;
    std::string error;
    std::string stack_trace;
};

} // namespace slog
} // namespace tau
