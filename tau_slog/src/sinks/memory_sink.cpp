#include "tau_slog/sinks/memory_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <stdexcept>

namespace tau
{
namespace slog
{

MemorySink::MemorySink(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), head_(0), count_(0)
{
  buffer_.resize(capacity_);
}

void MemorySink::Write(std::string_view line)
{
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_[head_].assign(line.data(), line.size());
  head_ = (head_ + 1) % capacity_;
  if (count_ < capacity_)
  {
    ++count_;
  }
}

void MemorySink::Flush() {}

bool MemorySink::DumpToFile(const char* path) const
{
  int fd = ::open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
  {
    return false;
  }

  bool ok = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < count_ && ok; ++i)
    {
      const std::string& line = AtLocked(i);
      ok = ::write(fd, line.data(), line.size()) == static_cast<ssize_t>(line.size());
    }
  }

  ::close(fd);
  return ok;
}

size_t MemorySink::Size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

std::string MemorySink::At(size_t index) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= count_)
  {
    throw std::out_of_range("MemorySink::At");
  }
  return AtLocked(index);
}

std::vector<std::string> MemorySink::Lines() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> lines;
  lines.reserve(count_);
  for (size_t i = 0; i < count_; ++i)
  {
    lines.push_back(AtLocked(i));
  }
  return lines;
}

std::string MemorySink::Contents() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::string out;
  for (size_t i = 0; i < count_; ++i)
  {
    out += AtLocked(i);
  }
  return out;
}

void MemorySink::Clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& line : buffer_)
  {
    line.clear();
  }
  head_ = 0;
  count_ = 0;
}

const std::string& MemorySink::AtLocked(size_t index) const
{
  size_t start = (count_ < capacity_) ? 0 : head_;
  return buffer_[(start + index) % capacity_];
}

}  // namespace slog
}  // namespace tau
