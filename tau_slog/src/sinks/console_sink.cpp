#include "tau_slog/sinks/console_sink.hpp"

namespace tau
{
namespace slog
{

ConsoleSink::ConsoleSink(Stream stream) : target_(stream == Stream::Stderr ? stderr : stdout) {}

void ConsoleSink::Write(std::string_view line)
{
  std::fwrite(line.data(), 1, line.size(), target_);
}

void ConsoleSink::Flush() { std::fflush(target_); }

}  // namespace slog
}  // namespace tau
