#include "tau_config/config.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <utility>

namespace tau
{
namespace config
{

std::string EnvironmentName(const std::string& flag)
{
  std::string env;
  env.reserve(flag.size());
  for (char c : flag)
  {
    if (c == '-' || c == '.')
    {
      env += '_';
    }
    else
    {
      env += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
  }
  return env;
}

std::string UpdateUsage(const std::string& flag, const std::string& usage)
{
  return fmt::format("{}\nAlso set by environment variable {}", usage, EnvironmentName(flag));
}

std::optional<FlagError> ParseFlagSet(const std::vector<std::string>& args, FlagSet& fs)
{
  if (fs.Parsed())
  {
    return FlagError(FlagError::Code::kAlreadyParsed,
                     "config::Parse can only be called once and before FlagSet::Parse");
  }

  std::vector<std::pair<std::string, std::string>> overrides;
  std::vector<std::string> errs;
  fs.VisitAll(
      [&](const std::string& name, std::string& usage)
      {
        const char* value = std::getenv(EnvironmentName(name).c_str());
        if (value != nullptr)
        {
          if (auto err = fs.Validate(name, value))
          {
            errs.push_back(fmt::format("could not set {} to {}: {}", name, value, err->what()));
          }
          else
          {
            overrides.emplace_back(name, value);
          }
        }
        usage = UpdateUsage(name, usage);
      });

  if (!errs.empty())
  {
    return FlagError(FlagError::Code::kEnvironment,
                     fmt::format("parsing flags: {}", fmt::join(errs, "; ")));
  }

  for (const auto& kv : overrides)
  {
    if (auto err = fs.Set(kv.first, kv.second))
    {
      return FlagError(FlagError::Code::kEnvironment,
                       fmt::format("parsing flags: could not set {} to {}: {}", kv.first,
                                   kv.second, err->what()));
    }
  }

  return fs.Parse(args);
}

std::optional<FlagError> Parse(int argc, const char* const* argv)
{
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i)
  {
    args.emplace_back(argv[i]);
  }
  return ParseFlagSet(args, CommandLine());
}

FlagSet& CommandLine()
{
  static FlagSet flags("");
  return flags;
}

}  // namespace config
}  // namespace tau
