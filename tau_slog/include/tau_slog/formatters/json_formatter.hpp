#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

#include "../log_record.hpp"
#include "../value.hpp"

namespace tau {
namespace slog {

class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Renders a LogRecord as a single-line JSON object in the structured-log
// layout understood by the logging agent. Empty fields are omitted, except
// "message".
class JsonFormatter {
public:
    // Throws SerializationError when a detail cannot be represented in JSON.
    std::string Format(const LogRecord& record) const;

    static void AppendValue(std::string& out, const Value& value);
    static void AppendEscaped(std::string& out, std::string_view src);
};

} // namespace slog
} // namespace tau
