#include "tau_slog/formatters/json_formatter.hpp"

#include <fmt/format.h>

#include <cmath>
#include <iterator>
#include <string>

#include "tau_slog/platform.hpp"

namespace tau {
namespace slog {

namespace {

constexpr const char* kLabelsKey         = "\"" TAU_SLOG_FIELD_PREFIX "labels\":";
constexpr const char* kSourceLocationKey = "\"" TAU_SLOG_FIELD_PREFIX "sourceLocation\":";
constexpr const char* kOperationKey      = "\"" TAU_SLOG_FIELD_PREFIX "operation\":";
constexpr const char* kTraceKey          = "\"" TAU_SLOG_FIELD_PREFIX "trace\":";
constexpr const char* kSpanIdKey         = "\"" TAU_SLOG_FIELD_PREFIX "spanId\":";
constexpr const char* kTraceSampledKey   = "\"" TAU_SLOG_FIELD_PREFIX "trace_sampled\":";

// Writes `"key":"value"` with a leading comma unless first.
void AppendStringMember(std::string& out, bool& first, const char* key, std::string_view value) {
    if (!first) {
        out += ',';
    }
    first = false;
    out += '"';
    out += key;
    out += "\":\"";
    JsonFormatter::AppendEscaped(out, value);
    out += '"';
}

void AppendBoolMember(std::string& out, bool& first, const char* key) {
    if (!first) {
        out += ',';
    }
    first = false;
    out += '"';
    out += key;
    out += "\":true";
}

// Length of the well-formed UTF-8 sequence starting at src[pos], or 0.
// Overlong forms, surrogates and code points past U+10FFFF are rejected.
size_t Utf8SequenceLength(std::string_view src, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(src[pos + i]); };
    unsigned char lead = byte(0);
    size_t len;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) {
            lo = 0xA0;
        } else if (lead == 0xED) {
            hi = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) {
            lo = 0x90;
        } else if (lead == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }
    if (src.size() - pos < len) {
        return 0;
    }
    if (byte(1) < lo || byte(1) > hi) {
        return 0;
    }
    for (size_t i = 2; i < len; ++i) {
        if (byte(i) < 0x80 || byte(i) > 0xBF) {
            return 0;
        }
    }
    return len;
}

} // namespace

void JsonFormatter::AppendEscaped(std::string& out, std::string_view src) {
    const char* hex_digits = "0123456789ABCDEF";
    for (size_t pos = 0; pos < src.size(); ++pos) {
        unsigned char c = static_cast<unsigned char>(src[pos]);
        if (c >= 0x80) {
            size_t len = Utf8SequenceLength(src, pos);
            if (len == 0) {
                // Each invalid byte becomes U+FFFD.
                out += "\\ufffd";
            } else {
                out.append(src.data() + pos, len);
                pos += len - 1;
            }
            continue;
        }
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c <= 0x1F) {
                    out += "\\u00";
                    out += hex_digits[(c >> 4) & 0x0F];
                    out += hex_digits[c & 0x0F];
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
}

void JsonFormatter::AppendValue(std::string& out, const Value& value) {
    switch (value.GetType()) {
        case Value::Type::Null:
            out += "null";
            break;
        case Value::Type::Bool:
            out += value.AsBool() ? "true" : "false";
            break;
        case Value::Type::Int:
            fmt::format_to(std::back_inserter(out), "{}", value.AsInt());
            break;
        case Value::Type::Uint:
            fmt::format_to(std::back_inserter(out), "{}", value.AsUint());
            break;
        case Value::Type::Double: {
            double d = value.AsDouble();
            if (!std::isfinite(d)) {
                throw SerializationError(fmt::format("json: unsupported value: {}", d));
            }
            fmt::format_to(std::back_inserter(out), "{}", d);
            break;
        }
        case Value::Type::String:
            out += '"';
            AppendEscaped(out, value.AsString());
            out += '"';
            break;
        case Value::Type::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : value.AsArray()) {
                if (!first) {
                    out += ',';
                }
                first = false;
                AppendValue(out, item);
            }
            out += ']';
            break;
        }
        case Value::Type::Object: {
            out += '{';
            bool first = true;
            for (const auto& kv : value.AsObject()) {
                if (!first) {
                    out += ',';
                }
                first = false;
                out += '"';
                AppendEscaped(out, kv.first);
                out += "\":";
                AppendValue(out, kv.second);
            }
            out += '}';
            break;
        }
    }
}

std::string JsonFormatter::Format(const LogRecord& record) const {
    std::string out;
    out.reserve(256 + record.message.size() + record.stack_trace.size());

    out += "{\"message\":\"";
    AppendEscaped(out, record.message);
    out += "\",\"severity\":\"";
    out += ToString(record.severity);
    out += '"';

    if (!record.labels.empty()) {
        out += ',';
        out += kLabelsKey;
        out += '{';
        bool first = true;
        for (const auto& kv : record.labels) {
            if (!first) {
                out += ',';
            }
            first = false;
            out += '"';
            AppendEscaped(out, kv.first);
            out += "\":\"";
            AppendEscaped(out, kv.second);
            out += '"';
        }
        out += '}';
    }

    if (record.source_location) {
        const SourceLocation& loc = *record.source_location;
        out += ',';
        out += kSourceLocationKey;
        out += '{';
        bool first = true;
        if (!loc.file.empty()) {
            AppendStringMember(out, first, "file", loc.file);
        }
        if (loc.line != 0) {
            AppendStringMember(out, first, "line", std::to_string(loc.line));
        }
        if (!loc.function.empty()) {
            AppendStringMember(out, first, "function", loc.function);
        }
        out += '}';
    }

    if (record.operation) {
        const Operation& op = *record.operation;
        out += ',';
        out += kOperationKey;
        out += '{';
        bool first = true;
        if (!op.id.empty()) {
            AppendStringMember(out, first, "id", op.id);
        }
        if (!op.producer.empty()) {
            AppendStringMember(out, first, "producer", op.producer);
        }
        if (op.first) {
            AppendBoolMember(out, first, "first");
        }
        if (op.last) {
            AppendBoolMember(out, first, "last");
        }
        out += '}';
    }

    if (!record.trace.empty()) {
        out += ',';
        out += kTraceKey;
        out += '"';
        AppendEscaped(out, record.trace);
        out += '"';
    }
    if (!record.span_id.empty()) {
        out += ',';
        out += kSpanIdKey;
        out += '"';
        AppendEscaped(out, record.span_id);
        out += '"';
    }
    if (record.trace_sampled) {
        out += ',';
        out += kTraceSampledKey;
        out += "true";
    }

    if (!record.details.empty()) {
        out += ",\"details\":";
        AppendValue(out, record.details);
    }
    if (!record.error.empty()) {
        out += ",\"error\":\"";
        AppendEscaped(out, record.error);
        out += '"';
    }
    if (!record.stack_trace.empty()) {
        out += ",\"exception\":\"";
        AppendEscaped(out, record.stack_trace);
        out += '"';
    }

    out += '}';
    return out;
}

} // namespace slog
} // namespace tau
