#pragma once
#include <string>

#include "sink_interface.hpp"

namespace tau
{
namespace slog
{

// Appends lines to a file. If the file cannot be opened, a diagnostic goes to
// stderr and writes are dropped.
class FileSink : public ILogSink
{
 public:
  explicit FileSink(const std::string& path);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  void Write(std::string_view line) override;
  void Flush() override;

  bool IsOpen() const { return fd_ >= 0; }
  const std::string& Path() const { return path_; }

 private:
  std::string path_;
  int fd_;
};

}  // namespace slog
}  // namespace tau
