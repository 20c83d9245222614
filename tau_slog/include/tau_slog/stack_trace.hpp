#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include <boost/stacktrace/stacktrace.hpp>

#include "platform.hpp"

namespace tau
{
namespace slog
{

// Raw frames captured at a call site. Symbolization is deferred until Format.
class StackSnapshot
{
 public:
  // Records up to `depth` frames above the function calling Capture, after
  // dropping `skip` more.
  TAU_SLOG_NOINLINE static StackSnapshot Capture(size_t skip = 0,
                                                 size_t depth = TAU_SLOG_STACK_DEPTH);

  bool Empty() const { return trace_.empty(); }
  size_t Depth() const { return trace_.size(); }

  // Renders the trace the way error reporting expects it:
  //
  //   <description>:
  //
  //   <function>(...)
  //   	<file>:<line>
  std::string Format(std::string_view description) const;

 private:
  explicit StackSnapshot(boost::stacktrace::stacktrace trace) : trace_(std::move(trace)) {}

  boost::stacktrace::stacktrace trace_;
};

}  // namespace slog
}  // namespace tau
