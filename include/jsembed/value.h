#ifndef JSEMBED_VALUE_H
#define JSEMBED_VALUE_H

#include <cstdint>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace jsembed {

/// A script value that has an equivalent C++ mapping.
///
/// The engine supports values beyond these (symbols, functions, BigInts, ...),
/// but they don't have good C++ semantics, so they can't cross the boundary.
class Value final {
public:
  enum class Type : uint8_t {
    /// The `undefined` value.
    Undefined,
    /// The `null` value.
    Null,
    /// A boolean like `true` or `false`.
    Boolean,
    /// Any number, both integral like `5` and fractional like `2.3`.
    Number,
    /// Any string like `'abc'`.
    String,
    /// Any array of values like `['a', 2, false]`.
    Array,
    /// A JSON-like object like `{a: 'a', b: 2, c: false}`.
    Object,
    /// A byte buffer like `new Uint8Array([1, 2, 3])`.
    Bytes,
  };

  using Array = std::vector<Value>;
  using Object = std::map<std::string, Value>;
  using Bytes = std::vector<uint8_t>;

  Value() = default;

  static Value undefined() { return Value(); }
  static Value null();
  static Value boolean(bool value);
  static Value number(double value);
  static Value string(std::string value);
  static Value array(Array value);
  static Value object(Object value);
  static Value bytes(Bytes value);

  Type type() const { return static_cast<Type>(payload_.index()); }

  bool is_undefined() const { return type() == Type::Undefined; }
  bool is_null() const { return type() == Type::Null; }
  bool is_boolean() const { return type() == Type::Boolean; }
  bool is_number() const { return type() == Type::Number; }
  bool is_string() const { return type() == Type::String; }
  bool is_array() const { return type() == Type::Array; }
  bool is_object() const { return type() == Type::Object; }
  bool is_bytes() const { return type() == Type::Bytes; }

  // The accessors throw `std::bad_variant_access` if `type()` doesn't match.
  bool as_boolean() const { return std::get<bool>(payload_); }
  double as_number() const { return std::get<double>(payload_); }
  const std::string &as_string() const { return std::get<std::string>(payload_); }
  const Array &as_array() const { return std::get<Array>(payload_); }
  const Object &as_object() const { return *std::get<ObjectPtr>(payload_); }
  const Bytes &as_bytes() const { return std::get<Bytes>(payload_); }

  bool operator==(const Value &other) const;
  bool operator!=(const Value &other) const { return !(*this == other); }

private:
  // Objects are held through a pointer, since `std::map` can't be instantiated with the
  // still incomplete `Value`. The pointee is never mutated, so copies share it.
  using ObjectPtr = std::shared_ptr<const Object>;

  // Alternatives are in the order of `Type`.
  std::variant<std::monostate, std::nullptr_t, bool, double, std::string, Array, ObjectPtr,
               Bytes>
      payload_;
};

const char *type_name(Value::Type type);

/// Render a value as JSON-like text, for diagnostics and the shell.
std::string describe(const Value &value);

} // namespace jsembed

#endif // JSEMBED_VALUE_H
