#pragma once
#include <boost/program_options.hpp>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

namespace tau
{
namespace config
{

class FlagError : public std::runtime_error
{
 public:
  enum class Code
  {
    kInvalid,
    kHelp,
    kAlreadyParsed,
    kEnvironment
  };

  FlagError(Code code, const std::string& what) : std::runtime_error(what), code_(code) {}

  Code GetCode() const { return code_; }

 private:
  Code code_;
};

// A named set of flags backed by Boost.ProgramOptions. Accepts -name=value,
// --name=value and --name value; bool flags also accept a bare --name.
// NOLINTBEGIN(readability-identifier-naming)
class FlagSet
{
 public:
  using Visitor = std::function<void(const std::string& name, std::string& usage)>;

  explicit FlagSet(std::string name);

  FlagSet(const FlagSet&) = delete;
  FlagSet& operator=(const FlagSet&) = delete;

  // Binds a flag to caller-owned storage, which is set to the default now.
  template <typename T>
  void Var(T* target, const std::string& name, const T& default_value, const std::string& usage);

  // Defines a flag whose storage is owned by the set.
  template <typename T>
  T* Define(const std::string& name, const T& default_value, const std::string& usage)
  {
    auto storage = std::make_shared<T>(default_value);
    T* target = storage.get();
    storage_.push_back(std::move(storage));
    Var(target, name, default_value, usage);
    return target;
  }

  std::string* String(const std::string& name, const std::string& def, const std::string& usage)
  {
    return Define<std::string>(name, def, usage);
  }
  int* Int(const std::string& name, int def, const std::string& usage)
  {
    return Define<int>(name, def, usage);
  }
  int64_t* Int64(const std::string& name, int64_t def, const std::string& usage)
  {
    return Define<int64_t>(name, def, usage);
  }
  double* Double(const std::string& name, double def, const std::string& usage)
  {
    return Define<double>(name, def, usage);
  }
  bool* Bool(const std::string& name, bool def, const std::string& usage)
  {
    return Define<bool>(name, def, usage);
  }

  bool Has(const std::string& name) const;

  // Parses value and assigns it to the flag. During Parse a value given on
  // the command line takes precedence.
  std::optional<FlagError> Set(const std::string& name, const std::string& value);
  // Same checks as Set without assigning.
  std::optional<FlagError> Validate(const std::string& name, const std::string& value) const;

  // Parses arguments, not including the program name. The set counts as
  // parsed even when this fails.
  std::optional<FlagError> Parse(const std::vector<std::string>& args);
  bool Parsed() const { return parsed_; }
  // Arguments left after the flags.
  const std::vector<std::string>& Args() const { return args_; }

  // Visits every flag in name order.
  void VisitAll(const Visitor& fn);

  const std::string& Name() const { return name_; }
  void SetOutput(std::ostream* os);
  std::ostream& Output() const;

  void PrintDefaults(std::ostream& os) const;
  void PrintDefaults() const { PrintDefaults(Output()); }
  void Usage(std::ostream& os) const;
  void Usage() const { Usage(Output()); }

 private:
  struct Flag
  {
    std::string usage;
    std::string type_name;
    std::string default_text;
    bool zero_default = true;
    bool is_string = false;
    std::function<boost::program_options::value_semantic*()> semantic;
  };

  std::optional<FlagError> ParseValue(const std::string& name, const std::string& value,
                                      bool assign) const;
  boost::program_options::options_description Describe() const;
  void Redefined(const std::string& name) const;

  std::string name_;
  std::map<std::string, Flag> flags_;
  // Values assigned through Set, re-applied under the command line on Parse.
  std::map<std::string, std::string> actual_;
  std::vector<std::shared_ptr<void>> storage_;
  std::vector<std::string> args_;
  std::ostream* output_;
  bool parsed_ = false;
};
// NOLINTEND(readability-identifier-naming)

namespace detail
{

template <typename T>
std::string TypeName()
{
  if constexpr (std::is_same<T, std::string>::value)
  {
    return "string";
  }
  else if constexpr (std::is_same<T, bool>::value)
  {
    return "";
  }
  else if constexpr (std::is_floating_point<T>::value)
  {
    return "float";
  }
  else if constexpr (std::is_integral<T>::value && std::is_unsigned<T>::value)
  {
    return "uint";
  }
  else if constexpr (std::is_integral<T>::value)
  {
    return "int";
  }
  else
  {
    return "value";
  }
}

template <typename T>
std::string ValueText(const T& value)
{
  if constexpr (std::is_same<T, bool>::value)
  {
    return value ? "true" : "false";
  }
  else
  {
    return fmt::format("{}", value);
  }
}

}  // namespace detail

template <typename T>
void FlagSet::Var(T* target, const std::string& name, const T& default_value,
                  const std::string& usage)
{
  namespace po = boost::program_options;
  if (flags_.count(name) != 0)
  {
    Redefined(name);
    return;
  }
  *target = default_value;

  Flag flag;
  flag.usage = usage;
  flag.type_name = detail::TypeName<T>();
  flag.default_text = detail::ValueText(default_value);
  flag.zero_default = default_value == T{};
  flag.is_string = std::is_same<T, std::string>::value;
  std::string text = flag.default_text;
  flag.semantic = [target, default_value, text]() -> po::value_semantic*
  {
    auto* semantic = po::value<T>(target)->default_value(default_value, text);
    if constexpr (std::is_same<T, bool>::value)
    {
      semantic->implicit_value(true, "true");
    }
    return semantic;
  };
  flags_.emplace(name, std::move(flag));
}

}  // namespace config
}  // namespace tau
