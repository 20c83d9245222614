#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "sink_interface.hpp"

namespace tau
{
namespace slog
{

// Keeps the most recent `capacity` lines in memory.
class MemorySink : public ILogSink
{
 public:
  explicit MemorySink(size_t capacity = 1024);

  void Write(std::string_view line) override;
  void Flush() override;

  bool DumpToFile(const char* path) const;

  size_t Size() const;

  // Oldest first.
  std::string At(size_t index) const;
  std::vector<std::string> Lines() const;
  std::string Contents() const;

  void Clear();

 private:
  const std::string& AtLocked(size_t index) const;

  mutable std::mutex mutex_;
  std::vector<std::string> buffer_;
  size_t capacity_;
  size_t head_;
  size_t count_;
};

}  // namespace slog
}  // namespace tau
