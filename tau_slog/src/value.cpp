#include "tau_slog/value.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include "tau_slog/formatters/json_formatter.hpp"

namespace tau
{
namespace slog
{

namespace
{

[[noreturn]] void ThrowWrongType(const char* wanted)
{
  throw std::logic_error(fmt::format("tau::slog::Value is not {}", wanted));
}

}  // namespace

bool Value::AsBool() const
{
  if (const auto* b = std::get_if<bool>(&data_))
  {
    return *b;
  }
  ThrowWrongType("a bool");
}

int64_t Value::AsInt() const
{
  if (const auto* i = std::get_if<int64_t>(&data_))
  {
    return *i;
  }
  if (const auto* u = std::get_if<uint64_t>(&data_))
  {
    return static_cast<int64_t>(*u);
  }
  ThrowWrongType("an integer");
}

uint64_t Value::AsUint() const
{
  if (const auto* u = std::get_if<uint64_t>(&data_))
  {
    return *u;
  }
  if (const auto* i = std::get_if<int64_t>(&data_))
  {
    return static_cast<uint64_t>(*i);
  }
  ThrowWrongType("an integer");
}

double Value::AsDouble() const
{
  switch (GetType())
  {
    case Type::Double:
      return std::get<double>(data_);
    case Type::Int:
      return static_cast<double>(std::get<int64_t>(data_));
    case Type::Uint:
      return static_cast<double>(std::get<uint64_t>(data_));
    default:
      ThrowWrongType("a number");
  }
}

const std::string& Value::AsString() const
{
  if (const auto* s = std::get_if<std::string>(&data_))
  {
    return *s;
  }
  ThrowWrongType("a string");
}

const Value::Array& Value::AsArray() const
{
  if (const auto* a = std::get_if<std::shared_ptr<const Array>>(&data_))
  {
    return **a;
  }
  ThrowWrongType("an array");
}

const Value::Object& Value::AsObject() const
{
  if (const auto* o = std::get_if<std::shared_ptr<const Object>>(&data_))
  {
    return **o;
  }
  ThrowWrongType("an object");
}

std::string Value::ToString() const
{
  switch (GetType())
  {
    case Type::Null:
      return "null";
    case Type::Bool:
      return std::get<bool>(data_) ? "true" : "false";
    case Type::Int:
      return fmt::format("{}", std::get<int64_t>(data_));
    case Type::Uint:
      return fmt::format("{}", std::get<uint64_t>(data_));
    case Type::Double:
      return fmt::format("{}", std::get<double>(data_));
    case Type::String:
      return std::get<std::string>(data_);
    case Type::Array:
    case Type::Object:
      break;
  }

  // Containers coerce to their JSON text.
  std::string out;
  try
  {
    JsonFormatter::AppendValue(out, *this);
  }
  catch (const SerializationError& e)
  {
    out = fmt::format("%!({})", e.what());
  }
  return out;
}

bool Value::operator==(const Value& other) const
{
  if (GetType() != other.GetType())
  {
    return false;
  }
  switch (GetType())
  {
    case Type::Array:
      return AsArray() == other.AsArray();
    case Type::Object:
      return AsObject() == other.AsObject();
    default:
      return data_ == other.data_;
  }
}

}  // namespace slog
}  // namespace tau
