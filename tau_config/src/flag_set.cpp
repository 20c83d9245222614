#include "tau_config/flag_set.hpp"

#include <iostream>
#include <sstream>

namespace po = boost::program_options;

namespace tau
{
namespace config
{

namespace
{

// Hidden option collecting positional arguments.
constexpr const char* kArgsOption = "tau-config-positional";

bool IsHelpToken(const std::string& arg, std::string* name)
{
  size_t dashes = 0;
  while (dashes < arg.size() && dashes < 2 && arg[dashes] == '-')
  {
    ++dashes;
  }
  if (dashes == 0)
  {
    return false;
  }
  *name = arg.substr(dashes, arg.find('=') == std::string::npos ? std::string::npos
                                                                  : arg.find('=') - dashes);
  return *name == "h" || *name == "help";
}

}  // namespace

FlagSet::FlagSet(std::string name) : name_(std::move(name)), output_(&std::cerr) {}

bool FlagSet::Has(const std::string& name) const { return flags_.count(name) != 0; }

std::optional<FlagError> FlagSet::Set(const std::string& name, const std::string& value)
{
  auto err = ParseValue(name, value, true);
  if (!err)
  {
    actual_[name] = value;
  }
  return err;
}

std::optional<FlagError> FlagSet::Validate(const std::string& name, const std::string& value) const
{
  return ParseValue(name, value, false);
}

std::optional<FlagError> FlagSet::ParseValue(const std::string& name, const std::string& value,
                                             bool assign) const
{
  auto it = flags_.find(name);
  if (it == flags_.end())
  {
    return FlagError(FlagError::Code::kInvalid, "no such flag -" + name);
  }

  std::unique_ptr<po::value_semantic> semantic(it->second.semantic());
  boost::any parsed;
  try
  {
    semantic->parse(parsed, std::vector<std::string>{value}, false);
    if (assign)
    {
      semantic->notify(parsed);
    }
  }
  catch (po::error_with_option_name& e)
  {
    e.set_option_name(name);
    return FlagError(FlagError::Code::kInvalid,
                     fmt::format("invalid value \"{}\" for flag -{}: {}", value, name, e.what()));
  }
  catch (const po::error& e)
  {
    return FlagError(FlagError::Code::kInvalid,
                     fmt::format("invalid value \"{}\" for flag -{}: {}", value, name, e.what()));
  }
  return std::nullopt;
}

std::optional<FlagError> FlagSet::Parse(const std::vector<std::string>& args)
{
  parsed_ = true;
  args_.clear();

  for (const auto& arg : args)
  {
    if (arg == "--")
    {
      break;
    }
    std::string flag_name;
    if (IsHelpToken(arg, &flag_name) && !Has(flag_name))
    {
      Usage(Output());
      return FlagError(FlagError::Code::kHelp, "flag: help requested");
    }
  }

  po::options_description hidden;
  hidden.add_options()(kArgsOption, po::value<std::vector<std::string>>(&args_));
  po::options_description all;
  all.add(Describe()).add(hidden);

  po::positional_options_description positional;
  positional.add(kArgsOption, -1);

  const int style = (po::command_line_style::default_style |
                     po::command_line_style::allow_long_disguise) &
                    ~po::command_line_style::allow_guessing;

  try
  {
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(all).positional(positional).style(style).run(),
              vm);

    // Options seen on the command line are final in vm, so these only
    // replace defaults.
    po::parsed_options explicit_values(&all);
    for (const auto& kv : actual_)
    {
      explicit_values.options.emplace_back(kv.first, std::vector<std::string>{kv.second});
    }
    po::store(explicit_values, vm);

    po::notify(vm);
  }
  catch (const po::error& e)
  {
    Output() << e.what() << "\n";
    Usage(Output());
    return FlagError(FlagError::Code::kInvalid, e.what());
  }
  return std::nullopt;
}

void FlagSet::VisitAll(const Visitor& fn)
{
  for (auto& kv : flags_)
  {
    fn(kv.first, kv.second.usage);
  }
}

void FlagSet::SetOutput(std::ostream* os) { output_ = os ? os : &std::cerr; }

std::ostream& FlagSet::Output() const { return *output_; }

void FlagSet::PrintDefaults(std::ostream& os) const
{
  for (const auto& kv : flags_)
  {
    const Flag& flag = kv.second;
    std::ostringstream line;
    line << "  -" << kv.first;
    if (!flag.type_name.empty())
    {
      line << " " << flag.type_name;
    }
    // Short names fit on the same line as their usage.
    if (line.str().size() <= 4)
    {
      line << "\t";
    }
    else
    {
      line << "\n    \t";
    }

    for (char c : flag.usage)
    {
      line << c;
      if (c == '\n')
      {
        line << "    \t";
      }
    }

    if (!flag.zero_default)
    {
      if (flag.is_string)
      {
        line << fmt::format(" (default \"{}\")", flag.default_text);
      }
      else
      {
        line << " (default " << flag.default_text << ")";
      }
    }
    os << line.str() << "\n";
  }
}

void FlagSet::Usage(std::ostream& os) const
{
  if (name_.empty())
  {
    os << "Usage:\n";
  }
  else
  {
    os << "Usage of " << name_ << ":\n";
  }
  PrintDefaults(os);
}

po::options_description FlagSet::Describe() const
{
  po::options_description desc(name_.empty() ? std::string("flags") : name_);
  for (const auto& kv : flags_)
  {
    desc.add_options()(kv.first.c_str(), kv.second.semantic(), kv.second.usage.c_str());
  }
  return desc;
}

void FlagSet::Redefined(const std::string& name) const
{
  Output() << name_ << " flag redefined: " << name << "\n";
}

}  // namespace config
}  // namespace tau
