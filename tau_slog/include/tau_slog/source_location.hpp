#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tau
{
namespace slog
{

struct SourceLocation
{
  std::string file;
  uint32_t line = 0;
  std::string function;

  bool operator==(const SourceLocation& other) const
  {
    return line == other.line && file == other.file && function == other.function;
  }
  bool operator!=(const SourceLocation& other) const { return !(*this == other); }
};

// Turns an instruction address into file/line/function.
class ILocationResolver
{
 public:
  virtual ~ILocationResolver() = default;
  virtual SourceLocation Resolve(std::uintptr_t pc) = 0;
};

// Symbolizes with Boost.Stacktrace. File and line need debug info and the
// libbacktrace backend; function names need exported symbols.
class StacktraceLocationResolver : public ILocationResolver
{
 public:
  SourceLocation Resolve(std::uintptr_t pc) override;
};

// Process-wide cache of resolved call sites, keyed by return address. Entries
// are never evicted: call sites are bounded by the program's code size.
// NOLINTBEGIN(readability-identifier-naming)
class SourceLocationCache
{
 public:
  static SourceLocationCache& Instance();

  explicit SourceLocationCache(std::unique_ptr<ILocationResolver> resolver = nullptr);

  SourceLocationCache(const SourceLocationCache&) = delete;
  SourceLocationCache& operator=(const SourceLocationCache&) = delete;

  SourceLocation Resolve(std::uintptr_t pc);

  // Replaces the resolver (null restores the default) and forgets everything
  // resolved so far.
  void SetResolver(std::unique_ptr<ILocationResolver> resolver);

  size_t Size() const;
  uint64_t Misses() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::uintptr_t, SourceLocation> cache_;
  std::unique_ptr<ILocationResolver> resolver_;
  std::atomic<uint64_t> misses_{0};
};
// NOLINTEND(readability-identifier-naming)

}  // namespace slog
}  // namespace tau
