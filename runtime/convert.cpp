#include "convert.h"
#include "encode.h"
#include "exception.h"

#include <algorithm>
#include <cstring>

// TODO: remove these once the warnings are fixed
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Winvalid-offsetof"
#include "js/Array.h"
#include "js/ArrayBuffer.h"
#include "js/experimental/TypedData.h"
#pragma clang diagnostic pop

namespace jsembed::core {

namespace {

Result<Value> to_value(JSContext *cx, HandleValue val, size_t depth);

Result<Value> bytes_to_value(HandleObject obj) {
  uint8_t *data = nullptr;
  bool is_shared;
  size_t len = 0;

  if (JS_IsArrayBufferViewObject(obj)) {
    js::GetArrayBufferViewLengthAndData(obj, &len, &is_shared, &data);
  } else {
    JS::GetArrayBufferLengthAndData(obj, &len, &is_shared, &data);
  }

  if (len == 0) {
    return Value::bytes({});
  }
  return Value::bytes(Value::Bytes(data, data + len));
}

Result<Value> array_to_value(JSContext *cx, HandleObject obj, size_t depth) {
  uint32_t len = 0;
  if (!JS::GetArrayLength(cx, obj, &len)) {
    return take_pending_error(cx);
  }

  Value::Array array;
  array.reserve(len);
  RootedValue elem(cx);
  for (uint32_t i = 0; i < len; i++) {
    if (!JS_GetElement(cx, obj, i, &elem)) {
      return take_pending_error(cx);
    }
    auto converted = to_value(cx, elem, depth + 1);
    if (converted.is_err()) {
      return converted;
    }
    array.push_back(std::move(converted.unwrap()));
  }

  return Value::array(std::move(array));
}

Result<Value> object_to_value(JSContext *cx, HandleObject obj, size_t depth) {
  JS::RootedIdVector ids(cx);
  if (!js::GetPropertyKeys(cx, obj, JSITER_OWNONLY, &ids)) {
    return take_pending_error(cx);
  }

  Value::Object object;
  JS::RootedId id(cx);
  RootedValue key(cx);
  RootedValue elem(cx);
  for (size_t i = 0; i < ids.length(); i++) {
    id = ids[i];
    if (!JS_IdToValue(cx, id, &key)) {
      return take_pending_error(cx);
    }
    auto key_chars = encode(cx, key);
    if (!key_chars) {
      return take_pending_error(cx);
    }
    if (!JS_GetPropertyById(cx, obj, id, &elem)) {
      return take_pending_error(cx);
    }
    auto converted = to_value(cx, elem, depth + 1);
    if (converted.is_err()) {
      return converted;
    }
    object.insert_or_assign(key_chars.to_string(), std::move(converted.unwrap()));
  }

  return Value::object(std::move(object));
}

Result<Value> to_value(JSContext *cx, HandleValue val, size_t depth) {
  if (depth > MAX_CONVERSION_DEPTH) {
    return Error::unsupported_type("cyclic or too deeply nested value");
  }

  if (val.isUndefined()) {
    return Value::undefined();
  }
  if (val.isNull()) {
    return Value::null();
  }
  if (val.isBoolean()) {
    return Value::boolean(val.toBoolean());
  }
  if (val.isNumber()) {
    return Value::number(val.toNumber());
  }
  if (val.isString()) {
    RootedString str(cx, val.toString());
    auto chars = encode(cx, str);
    if (!chars) {
      return take_pending_error(cx);
    }
    return Value::string(chars.to_string());
  }
  if (val.isSymbol()) {
    return Error::unsupported_type("symbol");
  }
  if (val.isBigInt()) {
    return Error::unsupported_type("bigint");
  }
  if (!val.isObject()) {
    return Error::unsupported_type("unknown");
  }

  RootedObject obj(cx, &val.toObject());
  if (JS::IsCallable(obj)) {
    return Error::unsupported_type("function");
  }
  if (JS::IsArrayBufferObject(obj) || JS_IsArrayBufferViewObject(obj)) {
    JSEMBED_SPAM("converting buffer at depth {}\n", depth);
    return bytes_to_value(obj);
  }

  bool is_array = false;
  if (!JS::IsArrayObject(cx, obj, &is_array)) {
    return take_pending_error(cx);
  }
  if (is_array) {
    JSEMBED_SPAM("converting array at depth {}\n", depth);
    return array_to_value(cx, obj, depth);
  }

  JSEMBED_SPAM("converting object at depth {}\n", depth);
  return object_to_value(cx, obj, depth);
}

} // namespace

Result<Value> to_value(JSContext *cx, HandleValue val) { return to_value(cx, val, 0); }

bool from_value(JSContext *cx, const Value &value, MutableHandleValue out) {
  switch (value.type()) {
  case Value::Type::Undefined:
    out.setUndefined();
    return true;
  case Value::Type::Null:
    out.setNull();
    return true;
  case Value::Type::Boolean:
    out.setBoolean(value.as_boolean());
    return true;
  case Value::Type::Number:
    out.setNumber(value.as_number());
    return true;
  case Value::Type::String: {
    JSString *str = new_string(cx, value.as_string());
    if (!str) {
      return false;
    }
    out.setString(str);
    return true;
  }
  case Value::Type::Array: {
    const auto &array = value.as_array();
    RootedObject arr(cx, JS::NewArrayObject(cx, array.size()));
    if (!arr) {
      return false;
    }
    RootedValue elem(cx);
    for (size_t i = 0; i < array.size(); i++) {
      if (!from_value(cx, array[i], &elem) ||
          !JS_SetElement(cx, arr, static_cast<uint32_t>(i), elem)) {
        return false;
      }
    }
    out.setObject(*arr);
    return true;
  }
  case Value::Type::Object: {
    RootedObject obj(cx, JS_NewPlainObject(cx));
    if (!obj) {
      return false;
    }
    JS::RootedId id(cx);
    RootedValue elem(cx);
    for (const auto &[key, member] : value.as_object()) {
      // Defined rather than set, so that keys like "__proto__" become own data properties.
      if (!property_id(cx, key, &id) || !from_value(cx, member, &elem) ||
          !JS_DefinePropertyById(cx, obj, id, elem, JSPROP_ENUMERATE)) {
        return false;
      }
    }
    out.setObject(*obj);
    return true;
  }
  case Value::Type::Bytes: {
    const auto &bytes = value.as_bytes();
    RootedObject arr(cx, JS_NewUint8Array(cx, bytes.size()));
    if (!arr) {
      return false;
    }
    if (!bytes.empty()) {
      uint8_t *data = nullptr;
      bool is_shared;
      size_t len = 0;
      js::GetArrayBufferViewLengthAndData(arr, &len, &is_shared, &data);
      std::memcpy(data, bytes.data(), std::min(len, bytes.size()));
    }
    out.setObject(*arr);
    return true;
  }
  }

  out.setUndefined();
  return true;
}

} // namespace jsembed::core
