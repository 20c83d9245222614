#include "tau_slog/span_context.hpp"

#include <fmt/format.h>

namespace tau
{
namespace slog
{

namespace
{

constexpr size_t kTraceIdLen = 32;
constexpr size_t kSpanIdLen = 16;
// "00-" + trace + "-" + span + "-" + flags
constexpr size_t kTraceParentLen = 3 + kTraceIdLen + 1 + kSpanIdLen + 3;

bool IsLowerHex(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }

int HexDigit(char c) { return (c >= '0' && c <= '9') ? c - '0' : c - 'a' + 10; }

bool IsHexId(std::string_view id, size_t len)
{
  if (id.size() != len)
  {
    return false;
  }
  bool all_zero = true;
  for (char c : id)
  {
    if (!IsLowerHex(c))
    {
      return false;
    }
    if (c != '0')
    {
      all_zero = false;
    }
  }
  return !all_zero;
}

}  // namespace

bool SpanContext::IsValid() const
{
  return IsHexId(trace_id, kTraceIdLen) && IsHexId(span_id, kSpanIdLen);
}

std::optional<SpanContext> SpanContext::FromTraceParent(std::string_view header)
{
  if (header.size() != kTraceParentLen || header[2] != '-' || header[35] != '-' ||
      header[52] != '-')
  {
    return std::nullopt;
  }
  std::string_view version = header.substr(0, 2);
  std::string_view flags = header.substr(53, 2);
  if (!IsLowerHex(version[0]) || !IsLowerHex(version[1]) || version == "ff" ||
      !IsLowerHex(flags[0]) || !IsLowerHex(flags[1]))
  {
    return std::nullopt;
  }

  SpanContext sc;
  sc.trace_id = std::string(header.substr(3, kTraceIdLen));
  sc.span_id = std::string(header.substr(36, kSpanIdLen));
  sc.sampled = (HexDigit(flags[1]) & 0x1) != 0;
  if (!sc.IsValid())
  {
    return std::nullopt;
  }
  return sc;
}

std::string SpanContext::ToTraceParent() const
{
  return fmt::format("00-{}-{}-{}", trace_id, span_id, sampled ? "01" : "00");
}

}  // namespace slog
}  // namespace tau
