#pragma once
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

// Development helpers: a fail-fast guard for unrecoverable startup errors and
// a marker error for code that still has to be written.
namespace tau
{
namespace dev
{

class NotImplementedError : public std::logic_error
{
 public:
  NotImplementedError(std::string file, int line, std::string function);

  const std::string& File() const { return file_; }
  int Line() const { return line_; }
  const std::string& Function() const { return function_; }

 private:
  std::string file_;
  int line_;
  std::string function_;
};

// Returns an error naming the calling function. Missing location data reads
// "unknown" and -1.
NotImplementedError NotImplemented(const char* file = __builtin_FILE(),
                                   int line = __builtin_LINE(),
                                   const char* function = __builtin_FUNCTION());

// Throw err when it is set, do nothing otherwise.
void FailFast(const std::exception_ptr& err);
void FailFast(const std::error_code& err);

template <typename E>
void FailFast(const std::optional<E>& err)
{
  if (err)
  {
    throw *err;
  }
}

inline void Verify(const std::exception_ptr& err) { FailFast(err); }
inline void Verify(const std::error_code& err) { FailFast(err); }

template <typename E>
void Verify(const std::optional<E>& err)
{
  FailFast(err);
}

}  // namespace dev
}  // namespace tau
