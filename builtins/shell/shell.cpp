#include "shell.h"
#include "encode.h"

#include <string>

namespace jsembed::builtins::shell {

namespace {

/// Joins the string conversions of all arguments with single spaces.
bool join_args(JSContext *cx, const CallArgs &args, std::string &out) {
  for (unsigned i = 0; i < args.length(); i++) {
    auto chars = core::encode(cx, args[i]);
    if (!chars) {
      return false;
    }
    if (i > 0) {
      out += ' ';
    }
    out.append(chars.begin(), chars.size());
  }
  out += '\n';
  return true;
}

bool write_args(JSContext *cx, unsigned argc, JS::Value *vp, FILE *fp) {
  CallArgs args = CallArgsFromVp(argc, vp);
  std::string line;
  if (!join_args(cx, args, line)) {
    return false;
  }

  fwrite(line.data(), 1, line.size(), fp);
  fflush(fp);
  args.rval().setUndefined();
  return true;
}

} // namespace

/**
 * The `print` global function.
 *
 * Writes its arguments to stdout, converted to strings and separated by spaces.
 */
bool print(JSContext *cx, unsigned argc, JS::Value *vp) {
  TRACE_METHOD("print")
  return write_args(cx, argc, vp, stdout);
}

/// Like `print`, but writes to stderr.
bool alert(JSContext *cx, unsigned argc, JS::Value *vp) {
  TRACE_METHOD("alert")
  return write_args(cx, argc, vp, stderr);
}

const JSFunctionSpec methods[] = {JS_FN("print", print, 0, JSPROP_ENUMERATE),
                                  JS_FN("alert", alert, 0, JSPROP_ENUMERATE), JS_FS_END};

bool install(Context *context) {
  return JS_DefineFunctions(context->cx(), context->global(), methods);
}

} // namespace jsembed::builtins::shell
