#pragma once
#include <optional>
#include <string>
#include <vector>

#include "flag_set.hpp"

namespace tau
{
namespace config
{

// Environment variable that overrides a flag: upper-cased, with '-' and '.'
// replaced by '_' ("set-flag" -> "SET_FLAG").
std::string EnvironmentName(const std::string& flag);

// Usage string advertising the environment override.
std::string UpdateUsage(const std::string& flag, const std::string& usage);

// Applies environment overrides to fs, then parses args (program name
// excluded). Precedence is command line, then environment, then default.
// If any override is invalid, none is applied and an error listing all of
// them is returned. Fails without parsing when fs is already parsed.
std::optional<FlagError> ParseFlagSet(const std::vector<std::string>& args, FlagSet& fs);

// ParseFlagSet on CommandLine() with argv[1..argc).
std::optional<FlagError> Parse(int argc, const char* const* argv);

// Process-wide flag set used by Parse.
FlagSet& CommandLine();

}  // namespace config
}  // namespace tau
