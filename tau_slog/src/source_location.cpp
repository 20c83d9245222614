#include "tau_slog/source_location.hpp"

#include <boost/stacktrace/frame.hpp>

#include <mutex>

namespace tau
{
namespace slog
{

SourceLocation StacktraceLocationResolver::Resolve(std::uintptr_t pc)
{
  SourceLocation loc;
  if (pc == 0)
  {
    return loc;
  }
  // A return address points past the call; step back into the call itself.
  boost::stacktrace::frame frame(reinterpret_cast<const void*>(pc - 1));
  loc.file = frame.source_file();
  loc.line = static_cast<uint32_t>(frame.source_line());
  loc.function = frame.name();
  return loc;
}

SourceLocationCache& SourceLocationCache::Instance()
{
  static SourceLocationCache cache;
  return cache;
}

SourceLocationCache::SourceLocationCache(std::unique_ptr<ILocationResolver> resolver)
    : resolver_(resolver ? std::move(resolver) : std::make_unique<StacktraceLocationResolver>())
{
}

SourceLocation SourceLocationCache::Resolve(std::uintptr_t pc)
{
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(pc);
    if (it != cache_.end())
    {
      return it->second;
    }
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = cache_.find(pc);
  if (it != cache_.end())
  {
    return it->second;
  }
  misses_.fetch_add(1, std::memory_order_relaxed);
  SourceLocation loc = resolver_->Resolve(pc);
  cache_.emplace(pc, loc);
  return loc;
}

void SourceLocationCache::SetResolver(std::unique_ptr<ILocationResolver> resolver)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  resolver_ = resolver ? std::move(resolver) : std::make_unique<StacktraceLocationResolver>();
  cache_.clear();
}

size_t SourceLocationCache::Size() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return cache_.size();
}

uint64_t SourceLocationCache::Misses() const { return misses_.load(std::memory_order_relaxed); }

}  // namespace slog
}  // namespace tau
