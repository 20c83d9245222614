#pragma once
#include <string_view>

namespace tau
{
namespace slog
{

// Destination of serialized entries. Calls are serialized by the owning
// Logger's lock.
class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // Writes one line, trailing newline included.
  virtual void Write(std::string_view line) = 0;

  virtual void Flush() = 0;
};

}  // namespace slog
}  // namespace tau
