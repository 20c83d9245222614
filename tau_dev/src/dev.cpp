#include "tau_dev/dev.hpp"

#include <utility>

namespace tau
{
namespace dev
{

NotImplementedError::NotImplementedError(std::string file, int line, std::string function)
    : std::logic_error("not implemented: " + function),
      file_(std::move(file)),
      line_(line),
      function_(std::move(function))
{
}

NotImplementedError NotImplemented(const char* file, int line, const char* function)
{
  std::string file_name = (file != nullptr && *file != '\0') ? file : "unknown";
  std::string function_name = (function != nullptr && *function != '\0') ? function : "unknown";
  return NotImplementedError(std::move(file_name), line > 0 ? line : -1,
                             std::move(function_name));
}

void FailFast(const std::exception_ptr& err)
{
  if (err)
  {
    std::rethrow_exception(err);
  }
}

void FailFast(const std::error_code& err)
{
  if (err)
  {
    throw std::system_error(err);
  }
}

}  // namespace dev
}  // namespace tau
