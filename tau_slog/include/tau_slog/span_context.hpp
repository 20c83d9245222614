#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace tau
{
namespace slog
{

// Identifiers of the active span, as handed over by a tracing library.
// Ids are lowercase hex: 32 digits for the trace, 16 for the span.
struct SpanContext
{
  std::string trace_id;
  std::string span_id;
  bool sampled = false;

  bool IsValid() const;

  // Parses a W3C traceparent header ("00-<trace>-<span>-<flags>").
  static std::optional<SpanContext> FromTraceParent(std::string_view header);
  std::string ToTraceParent() const;
};

}  // namespace slog
}  // namespace tau
