#pragma once
#include <cstdint>
#include <string_view>

namespace tau {
namespace slog {

// Ordered by increasing urgency, named after the LogSeverity values of the
// logging backend.
enum class Severity : uint8_t {
    Debug     = 0,
    Info      = 1,
    Notice    = 2,
    Warning   = 3,
    Error     = 4,
    Critical  = 5,
    Alert     = 6,
    Emergency = 7
};

constexpr std::string_view ToString(Severity severity) {
    switch (severity) {
        case Severity::Debug:     return "DEBUG";
        case Severity::Info:      return "INFO";
        case Severity::Notice:    return "NOTICE";
        case Severity::Warning:   return "WARNING";
        case Severity::Error:     return "ERROR";
        case Severity::Critical:  return "CRITICAL";
        case Severity::Alert:     return "ALERT";
        case Severity::Emergency: return "EMERGENCY";
    }
    return "DEFAULT";
}

// Error-level severities always carry a stack trace.
constexpr bool CapturesStack(Severity severity) {
    switch (severity) {
        case Severity::Error:
        case Severity::Critical:
        case Severity::Alert:
        case Severity::Emergency:
            return true;
        default:
            return false;
    }
}

} // namespace slog
} // namespace tau
