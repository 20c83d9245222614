#include "tau_slog/stack_trace.hpp"

#include <fmt/format.h>

#include <iterator>

namespace tau
{
namespace slog
{

StackSnapshot StackSnapshot::Capture(size_t skip, size_t depth)
{
  // One extra frame for Capture itself.
  return StackSnapshot(boost::stacktrace::stacktrace(skip + 1, depth));
}

std::string StackSnapshot::Format(std::string_view description) const
{
  std::string out;
  out.reserve(64 * (trace_.size() + 1));
  fmt::format_to(std::back_inserter(out), "{}:\n\n", description);
  for (const auto& frame : trace_)
  {
    std::string function = frame.name();
    std::string file = frame.source_file();
    fmt::format_to(std::back_inserter(out), "{}(...)\n\t{}:{}\n",
                   function.empty() ? "unknown" : function, file.empty() ? "unknown" : file,
                   frame.source_line());
  }
  return out;
}

}  // namespace slog
}  // namespace tau
