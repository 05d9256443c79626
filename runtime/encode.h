#ifndef JSEMBED_CORE_ENCODE_H
#define JSEMBED_CORE_ENCODE_H

#include <string>
#include <string_view>

#include "jsembed/builtin.h"

namespace jsembed::core {

/// A UTF-8 string allocated by the engine. Holds ownership of the data.
struct EncodedString final {
  JS::UniqueChars ptr;
  size_t len = 0;

  EncodedString() = default;
  EncodedString(JS::UniqueChars ptr, size_t len) : ptr{std::move(ptr)}, len{len} {}

  EncodedString(const EncodedString &other) = delete;
  EncodedString &operator=(const EncodedString &other) = delete;

  EncodedString(EncodedString &&other) = default;
  EncodedString &operator=(EncodedString &&other) = default;

  size_t size() const { return this->len; }

  const char *begin() const { return this->ptr.get(); }
  const char *end() const { return this->begin() + this->len; }

  /// Conversion to a bool, testing for an empty pointer.
  operator bool() const { return this->ptr != nullptr; }

  /// Conversion to a `std::string_view`.
  operator std::string_view() const { return std::string_view(this->ptr.get(), this->len); }

  std::string to_string() const { return std::string(this->ptr.get(), this->len); }
};

EncodedString encode(JSContext *cx, JS::HandleString str);

/// Convert `val` with `ToString` and encode the result. Fails with a pending
/// exception if the conversion throws.
EncodedString encode(JSContext *cx, JS::HandleValue val);

JSString *new_string(JSContext *cx, std::string_view str);

/// Atomize a UTF-8 property name.
bool property_id(JSContext *cx, std::string_view name, JS::MutableHandleId id);

} // namespace jsembed::core

#endif // JSEMBED_CORE_ENCODE_H
