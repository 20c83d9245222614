#pragma once
#include <memory>

#include "entry.hpp"

namespace tau
{
namespace slog
{

// Request-scoped carrier for an Entry. Contexts are cheap to copy and share
// the carried Entry, which is never modified once attached.
// NOLINTBEGIN(readability-identifier-naming)
class Context
{
 public:
  Context() = default;

  bool HasEntry() const { return entry_ != nullptr; }

  // Innermost context pushed on this thread by a Scope, or an empty one.
  static Context Current();

  // Makes a context the current one for the calling thread until destroyed.
  class Scope
  {
   public:
    explicit Scope(Context ctx);
    ~Scope();
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;
  };

 private:
  friend Context WithContext(const Context& ctx, const Entry& entry);
  friend Entry FromContext(const Context& ctx);

  std::shared_ptr<const Entry> entry_;
};
// NOLINTEND(readability-identifier-naming)

// Returns a copy of ctx carrying entry.
Context WithContext(const Context& ctx, const Entry& entry);

// Copy of the Entry carried by ctx, or a fresh Entry on the default Logger.
// Operations started or ended on the copy stay on the copy; the carried Entry
// keeps the operation it had when attached.
Entry FromContext(const Context& ctx);

#define TAU_SLOG_CONCAT_IMPL_(a, b) a##b
#define TAU_SLOG_CONCAT_(a, b) TAU_SLOG_CONCAT_IMPL_(a, b)
#define TAU_SLOG_SCOPED_CONTEXT(ctx) \
  ::tau::slog::Context::Scope TAU_SLOG_CONCAT_(_tau_slog_scope_, __COUNTER__)(ctx)

}  // namespace slog
}  // namespace tau
