#include "jsembed/error.h"
#include "encode.h"
#include "exception.h"

#include <fmt/format.h>

namespace jsembed {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Generic:
    return "generic";
  case ErrorKind::Error:
    return "Error";
  case ErrorKind::Internal:
    return "InternalError";
  case ErrorKind::Aggregate:
    return "AggregateError";
  case ErrorKind::Eval:
    return "EvalError";
  case ErrorKind::Range:
    return "RangeError";
  case ErrorKind::Reference:
    return "ReferenceError";
  case ErrorKind::Syntax:
    return "SyntaxError";
  case ErrorKind::Type:
    return "TypeError";
  case ErrorKind::Uri:
    return "URIError";
  case ErrorKind::OutOfMemory:
    return "out of memory";
  case ErrorKind::Uncatchable:
    return "uncatchable";
  }

  return "unknown";
}

Error Error::js(ErrorKind kind, std::string message) {
  return Error(Category::Js, kind, std::move(message));
}

Error Error::unsupported_type(std::string type_name) {
  return Error(Category::UnsupportedType, ErrorKind::Generic, std::move(type_name));
}

Error Error::non_existent(std::string name) {
  return Error(Category::NonExistent, ErrorKind::Generic, std::move(name));
}

Error Error::io(std::string path, std::string reason) {
  return Error(Category::Io, ErrorKind::Generic, std::move(reason), std::move(path));
}

Error Error::init(std::string reason) {
  return Error(Category::Init, ErrorKind::Generic, std::move(reason));
}

std::string Error::describe() const {
  switch (category_) {
  case Category::Js:
    // Error instances already carry their name in the message.
    if (kind_ == ErrorKind::Generic) {
      return fmt::format("uncaught exception: {}", message_);
    }
    return message_;
  case Category::UnsupportedType:
    return fmt::format("unsupported type: {}", message_);
  case Category::NonExistent:
    return fmt::format("\"{}\" does not exist", message_);
  case Category::Io:
    return fmt::format("can't read \"{}\": {}", path_, message_);
  case Category::Init:
    return fmt::format("engine initialization failed: {}", message_);
  }

  return message_;
}

namespace core {

ErrorKind error_kind_from_exn_type(int16_t exn_type) {
  switch (exn_type) {
  case JSEXN_INTERNALERR:
    return ErrorKind::Internal;
  case JSEXN_AGGREGATEERR:
    return ErrorKind::Aggregate;
  case JSEXN_EVALERR:
    return ErrorKind::Eval;
  case JSEXN_RANGEERR:
    return ErrorKind::Range;
  case JSEXN_REFERENCEERR:
    return ErrorKind::Reference;
  case JSEXN_SYNTAXERR:
    return ErrorKind::Syntax;
  case JSEXN_TYPEERR:
    return ErrorKind::Type;
  case JSEXN_URIERR:
    return ErrorKind::Uri;
  default:
    return ErrorKind::Error;
  }
}

static std::string exception_message(JSContext *cx, HandleValue exn, JSErrorReport *report) {
  auto message = encode(cx, exn);
  if (message) {
    return message.to_string();
  }

  // Stringification threw, e.g. because of a throwing `toString`.
  JS_ClearPendingException(cx);
  if (report && report->message()) {
    return std::string(report->message().c_str());
  }

  return "<unprintable exception>";
}

Error take_pending_error(JSContext *cx) {
  if (!JS_IsExceptionPending(cx)) {
    return Error::js(ErrorKind::Uncatchable, "uncatchable exception");
  }

  if (JS_IsThrowingOutOfMemory(cx)) {
    JS_ClearPendingException(cx);
    return Error::js(ErrorKind::OutOfMemory, "out of memory");
  }

  RootedValue exn(cx);
  if (!JS_GetPendingException(cx, &exn)) {
    JS_ClearPendingException(cx);
    return Error::js(ErrorKind::Uncatchable, "exception pending, but couldn't be retrieved");
  }
  JS_ClearPendingException(cx);

  ErrorKind kind = ErrorKind::Generic;
  JSErrorReport *report = nullptr;
  if (exn.isObject()) {
    RootedObject err(cx, &exn.toObject());
    report = JS_ErrorFromException(cx, err);
    if (report) {
      kind = error_kind_from_exn_type(report->exnType);
    }
  }

  auto message = exception_message(cx, exn, report);
  JSEMBED_LOG("script error ({}): {}\n", error_kind_name(kind), message);
  return Error::js(kind, std::move(message));
}

} // namespace core

} // namespace jsembed
