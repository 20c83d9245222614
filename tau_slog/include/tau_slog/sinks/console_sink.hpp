#pragma once
#include <cstdio>

#include "sink_interface.hpp"

namespace tau
{
namespace slog
{

class ConsoleSink : public ILogSink
{
 public:
  enum class Stream
  {
    Stdout,
    Stderr
  };

  explicit ConsoleSink(Stream stream = Stream::Stdout);

  void Write(std::string_view line) override;
  void Flush() override;

 private:
  FILE* target_;
};

}  // namespace slog
}  // namespace tau
