#include "debug.h"
#include "encode.h"

namespace jsembed::builtins::debug {

namespace {

JSString *stringify_value(JSContext *cx, HandleValue value) { return JS_ValueToSource(cx, value); }

} // namespace

/**
 * The `dumpValue` global function.
 *
 * Writes the source representation of each argument to stdout, one per line, and
 * returns the representation of the first argument.
 */
bool dumpValue(JSContext *cx, unsigned argc, JS::Value *vp) {
  TRACE_METHOD("dumpValue")
  CallArgs args = CallArgsFromVp(argc, vp);

  RootedString first(cx);
  for (unsigned i = 0; i < args.length(); i++) {
    RootedString str(cx, stringify_value(cx, args[i]));
    if (!str) {
      return false;
    }
    auto chars = core::encode(cx, str);
    if (!chars) {
      return false;
    }

    fprintf(stdout, "%.*s\n", static_cast<int>(chars.size()), chars.begin());
    if (i == 0) {
      first = str;
    }
  }
  fflush(stdout);

  if (first) {
    args.rval().setString(first);
  } else {
    args.rval().setUndefined();
  }
  return true;
}

const JSFunctionSpec methods[] = {JS_FN("dumpValue", dumpValue, 1, JSPROP_ENUMERATE), JS_FS_END};

bool install(Context *context) {
  JSEMBED_LOG("installing debug builtins\n");
  return JS_DefineFunctions(context->cx(), context->global(), methods);
}

} // namespace jsembed::builtins::debug
