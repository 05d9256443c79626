#include "jsembed/builtin.h"

#include <cstdlib>
#include <cstring>

namespace {

bool default_debug_logging() {
  const char *env = std::getenv("JSEMBED_DEBUG_LOG");
  return env && std::strcmp(env, "1") == 0;
}

bool DEBUG_LOGGING = default_debug_logging();

} // namespace

static const JSErrorFormatString *GetErrorMessageFromRef(void *userRef, unsigned errorNumber) {
  return static_cast<JSErrorFormatString *>(userRef);
}

bool jsembed::throw_error(JSContext* cx, const JSErrorFormatString &error,
                          const char* arg1, const char* arg2, const char* arg3, const char* arg4) {
  const char** args = nullptr;
  const char* list[4] = { arg1, arg2, arg3, arg4 };
  if (arg1) {
    args = list;
  }

  JS_ReportErrorNumberUTF8Array(cx, GetErrorMessageFromRef,
    const_cast<JSErrorFormatString*>(&error), 0, args);
  return false;
}

bool jsembed::debug_logging_enabled() { return DEBUG_LOGGING; }

void jsembed::set_debug_logging(bool enabled) { DEBUG_LOGGING = enabled; }
