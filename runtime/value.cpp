#include "jsembed/value.h"

#include <cmath>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace jsembed {

Value Value::null() {
  Value v;
  v.payload_.emplace<std::nullptr_t>(nullptr);
  return v;
}

Value Value::boolean(bool value) {
  Value v;
  v.payload_.emplace<bool>(value);
  return v;
}

Value Value::number(double value) {
  Value v;
  v.payload_.emplace<double>(value);
  return v;
}

Value Value::string(std::string value) {
  Value v;
  v.payload_.emplace<std::string>(std::move(value));
  return v;
}

Value Value::array(Array value) {
  Value v;
  v.payload_.emplace<Array>(std::move(value));
  return v;
}

Value Value::object(Object value) {
  Value v;
  v.payload_.emplace<ObjectPtr>(std::make_shared<const Object>(std::move(value)));
  return v;
}

Value Value::bytes(Bytes value) {
  Value v;
  v.payload_.emplace<Bytes>(std::move(value));
  return v;
}

bool Value::operator==(const Value &other) const {
  if (type() != other.type()) {
    return false;
  }

  // Shared object payloads compare by content, everything else by value.
  if (is_object()) {
    return as_object() == other.as_object();
  }
  return payload_ == other.payload_;
}

const char *type_name(Value::Type type) {
  switch (type) {
  case Value::Type::Undefined:
    return "undefined";
  case Value::Type::Null:
    return "null";
  case Value::Type::Boolean:
    return "boolean";
  case Value::Type::Number:
    return "number";
  case Value::Type::String:
    return "string";
  case Value::Type::Array:
    return "array";
  case Value::Type::Object:
    return "object";
  case Value::Type::Bytes:
    return "bytes";
  }

  return "unknown";
}

namespace {

void append_quoted(std::string &out, const std::string &str) {
  out += '"';
  for (char c : str) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void append_number(std::string &out, double n) {
  if (std::isnan(n)) {
    out += "NaN";
  } else if (std::isinf(n)) {
    out += n > 0 ? "Infinity" : "-Infinity";
  } else {
    out += fmt::format("{}", n);
  }
}

void append(std::string &out, const Value &value) {
  switch (value.type()) {
  case Value::Type::Undefined:
    out += "undefined";
    break;
  case Value::Type::Null:
    out += "null";
    break;
  case Value::Type::Boolean:
    out += value.as_boolean() ? "true" : "false";
    break;
  case Value::Type::Number:
    append_number(out, value.as_number());
    break;
  case Value::Type::String:
    append_quoted(out, value.as_string());
    break;
  case Value::Type::Array: {
    out += '[';
    bool first = true;
    for (const auto &elem : value.as_array()) {
      if (!first) {
        out += ", ";
      }
      first = false;
      append(out, elem);
    }
    out += ']';
    break;
  }
  case Value::Type::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, elem] : value.as_object()) {
      if (!first) {
        out += ", ";
      }
      first = false;
      append_quoted(out, key);
      out += ": ";
      append(out, elem);
    }
    out += '}';
    break;
  }
  case Value::Type::Bytes:
    out += fmt::format("<bytes [{:02x}]>", fmt::join(value.as_bytes(), " "));
    break;
  }
}

} // namespace

std::string describe(const Value &value) {
  std::string out;
  append(out, value);
  return out;
}

} // namespace jsembed
