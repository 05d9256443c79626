#ifndef JSEMBED_CORE_CONVERT_H
#define JSEMBED_CORE_CONVERT_H

#include "jsembed/builtin.h"
#include "jsembed/error.h"
#include "jsembed/value.h"

namespace jsembed::core {

/// Nesting limit for converting script values. Cyclic structures hit it, too.
constexpr size_t MAX_CONVERSION_DEPTH = 1000;

/**
 * Convert a script value into a `Value`.
 *
 * Symbols, BigInts and functions have no mapping and produce an
 * `Error::Category::UnsupportedType` error. Exceptions thrown during conversion (e.g. by
 * getters) are returned as script errors. Never leaves an exception pending.
 */
Result<Value> to_value(JSContext *cx, HandleValue val);

/// Convert a `Value` into a script value. Returns false with a pending exception on failure.
bool from_value(JSContext *cx, const Value &value, MutableHandleValue out);

} // namespace jsembed::core

#endif // JSEMBED_CORE_CONVERT_H
