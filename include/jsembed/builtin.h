#ifndef JSEMBED_BUILTIN_H
#define JSEMBED_BUILTIN_H

#include <cstdio>

#include <fmt/format.h>

// TODO: remove these once the warnings are fixed
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Winvalid-offsetof"
#pragma clang diagnostic ignored "-Wdeprecated-enum-enum-conversion"
#include "js/CallAndConstruct.h"
#include "js/Conversions.h"
#include "jsapi.h"
#include "jsfriendapi.h"
#pragma clang diagnostic pop

using JS::CallArgs;
using JS::CallArgsFromVp;
using JS::UniqueChars;

using JS::ObjectValue;
using JS::StringValue;

using JS::RootedObject;
using JS::RootedString;
using JS::RootedValue;
using JS::RootedValueArray;

using JS::HandleObject;
using JS::HandleString;
using JS::HandleValue;
using JS::HandleValueArray;
using JS::MutableHandleValue;
using JS::UndefinedHandleValue;

using JS::PersistentRooted;

#define DEF_ERR(name, exception, format, count) \
static constexpr JSErrorFormatString name = { #name, format, count, exception };

namespace jsembed {
#include "errors.h"

/// Whether `JSEMBED_LOG` output is currently emitted.
///
/// Defaults to true if the `JSEMBED_DEBUG_LOG` environment variable is set to `1`, and
/// can be raised per context with `ContextConfig::verbose`.
bool debug_logging_enabled();
void set_debug_logging(bool enabled);
} // namespace jsembed

#ifdef JSEMBED_ENABLE_LOGGING
#define JSEMBED_LOG(...)                                                                           \
  if (::jsembed::debug_logging_enabled()) {                                                        \
    fmt::print(stderr, __VA_ARGS__);                                                               \
    fflush(stderr);                                                                                \
  }
#else
#define JSEMBED_LOG(...)
#endif

// High-volume diagnostics, e.g. per-value conversion and module cache hits.
#ifdef JSEMBED_ENABLE_SPAM
#define JSEMBED_SPAM(...) JSEMBED_LOG(__VA_ARGS__)
#else
#define JSEMBED_SPAM(...)
#endif

// Build with `JSEMBED_TRACE` to make native methods log their name when invoked.
#ifdef JSEMBED_ENABLE_TRACE
#define TRACE_METHOD(name) JSEMBED_LOG("{}#{}: {}\n", __func__, __LINE__, name)
#else
#define TRACE_METHOD(name)
#endif

namespace jsembed {

using InternalMethod = bool(JSContext *cx, HandleObject receiver, HandleValue extra,
                            CallArgs args);

template <InternalMethod fun> bool internal_method(JSContext *cx, const unsigned argc, JS::Value *vp) {
  const CallArgs args = CallArgsFromVp(argc, vp);
  const RootedObject self(cx, &js::GetFunctionNativeReserved(&args.callee(), 0).toObject());
  const RootedValue extra(cx, js::GetFunctionNativeReserved(&args.callee(), 1));
  return fun(cx, self, extra, args);
}

/// Create a native function whose invocations receive `receiver` and `extra` back.
template <InternalMethod fun>
JSObject *create_internal_method(JSContext *cx, const HandleObject receiver,
                                 const HandleValue extra = UndefinedHandleValue,
                                 unsigned int nargs = 0, const char *name = "") {
  JSFunction *method = js::NewFunctionWithReserved(cx, internal_method<fun>, nargs, 0, name);
  if (!method)
    return nullptr;
  RootedObject method_obj(cx, JS_GetFunctionObject(method));
  js::SetFunctionNativeReserved(method_obj, 0, ObjectValue(*receiver));
  js::SetFunctionNativeReserved(method_obj, 1, extra);
  return method_obj;
}

} // namespace jsembed

#endif // JSEMBED_BUILTIN_H
