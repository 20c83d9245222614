#include "tau_slog/sinks/file_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace tau
{
namespace slog
{

FileSink::FileSink(const std::string& path) : path_(path), fd_(-1)
{
  fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd_ < 0)
  {
    std::fprintf(stderr, "FileSink: failed to open '%s': %s\n", path_.c_str(),
                 std::strerror(errno));
  }
}

FileSink::~FileSink()
{
  if (fd_ >= 0)
  {
    ::fsync(fd_);
    ::close(fd_);
    fd_ = -1;
  }
}

void FileSink::Write(std::string_view line)
{
  if (fd_ < 0)
  {
    return;
  }
  const char* data = line.data();
  size_t left = line.size();
  while (left > 0)
  {
    ssize_t written = ::write(fd_, data, left);
    if (written < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      std::fprintf(stderr, "FileSink: write to '%s' failed: %s\n", path_.c_str(),
                   std::strerror(errno));
      return;
    }
    data += written;
    left -= static_cast<size_t>(written);
  }
}

void FileSink::Flush()
{
  if (fd_ >= 0)
  {
    ::fdatasync(fd_);
  }
}

}  // namespace slog
}  // namespace tau
