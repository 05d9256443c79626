#ifndef JSEMBED_CORE_EXCEPTION_H
#define JSEMBED_CORE_EXCEPTION_H

#include "jsembed/builtin.h"
#include "jsembed/error.h"

namespace jsembed::core {

ErrorKind error_kind_from_exn_type(int16_t exn_type);

/**
 * Convert the exception pending on `cx` into an `Error`, and clear it.
 *
 * The message is the string conversion of the thrown value, e.g. "TypeError: xyz" for
 * `throw new TypeError('xyz')`. If no exception is pending, the failure was
 * uncatchable, e.g. because execution was interrupted.
 */
Error take_pending_error(JSContext *cx);

} // namespace jsembed::core

#endif // JSEMBED_CORE_EXCEPTION_H
