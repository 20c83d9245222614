#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tau
{
namespace slog
{

// Structured value carried in an entry's details. Arrays and objects are
// immutable once built and shared between copies.
class Value
{
 public:
  using Array = std::vector<Value>;
  using Object = std::map<std::string, Value>;

  enum class Type : uint8_t
  {
    Null,
    Bool,
    Int,
    Uint,
    Double,
    String,
    Array,
    Object
  };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : data_(b) {}

  template <typename T,
            typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value &&
                                        !std::is_same<T, bool>::value,
                                    int>::type = 0>
  Value(T v) : data_(static_cast<int64_t>(v))
  {
  }

  template <typename T,
            typename std::enable_if<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                                        !std::is_same<T, bool>::value,
                                    int>::type = 0>
  Value(T v) : data_(static_cast<uint64_t>(v))
  {
  }

  template <typename T,
            typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
  Value(T v) : data_(static_cast<double>(v))
  {
  }

  Value(const char* s) : data_(std::string(s ? s : "")) {}
  Value(std::string s) : data_(std::move(s)) {}
  Value(std::string_view s) : data_(std::string(s)) {}
  Value(Array a) : data_(std::make_shared<const Array>(std::move(a))) {}
  Value(Object o) : data_(std::make_shared<const Object>(std::move(o))) {}

  Type GetType() const { return static_cast<Type>(data_.index()); }
  bool IsNull() const { return GetType() == Type::Null; }

  bool AsBool() const;
  int64_t AsInt() const;
  uint64_t AsUint() const;
  double AsDouble() const;
  const std::string& AsString() const;
  const Array& AsArray() const;
  const Object& AsObject() const;

  // String coercion used for labels.
  std::string ToString() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string,
               std::shared_ptr<const Array>, std::shared_ptr<const Object>>
      data_{nullptr};
};

using Fields = Value::Object;

}  // namespace slog
}  // namespace tau
