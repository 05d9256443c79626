#ifndef JSEMBED_CONTEXT_H
#define JSEMBED_CONTEXT_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include "error.h"
#include "value.h"

// TODO: remove these once the warnings are fixed
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Winvalid-offsetof"
#pragma clang diagnostic ignored "-Wdeprecated-enum-enum-conversion"
#include "jsapi.h"
#pragma clang diagnostic pop

namespace jsembed {

class ModuleResolver;

namespace core {
class ModuleLoader;
}

struct ContextConfig {
  /// Upper bound for the GC heap. Zero selects the engine default.
  size_t max_heap_bytes = 0;

  /**
   * Native stack budget for script execution.
   *
   * Recursion exceeding it raises an `InternalError` ("too much recursion") instead of
   * overflowing the native stack.
   */
  size_t native_stack_quota = 1024 * 1024;

  /// Install the `print` and `alert` globals (and `dumpValue` in debug builds).
  bool shell_builtins = true;

  /// Turn on debug logging, if logging is compiled in.
  bool verbose = false;
};

/// A context corresponding to a thread of script execution.
///
/// Only one `Context` may be alive per thread at a time.
class Context final {
  ContextConfig config_;
  JSContext *cx_ = nullptr;
  JS::Realm *old_realm_ = nullptr;
  bool entered_realm_ = false;
  std::unique_ptr<JS::PersistentRootedObject> global_;
  std::unique_ptr<core::ModuleLoader> module_loader_;

  explicit Context(ContextConfig config);
  Result<Void> init();

public:
  /// Creates a new context with a fresh global object.
  static Result<std::unique_ptr<Context>> create(ContextConfig config = {});

  /// Returns the `Context` owning the given engine context.
  static Context *get(JSContext *cx);

  ~Context();

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  JSContext *cx() { return cx_; }
  JS::HandleObject global();
  const ContextConfig &config() const { return config_; }

  /**
   * Evaluates the given script within this context.
   *
   * Returns the completion value of the script, e.g. `'ab' + 'cd'` evaluates to
   * `Value::string("abcd")`. A thrown exception is returned as an error of category
   * `Error::Category::Js`, e.g. `var a = {}; a.foo()` fails with `ErrorKind::Type`.
   */
  Result<Value> eval_string(std::string_view code, const char *filename = "<eval>");

  /// Loads and evaluates the specified file within this context.
  Result<Value> eval_file(const std::filesystem::path &path);

  /**
   * Calls the specified global function with the supplied arguments.
   *
   * Fails with `Error::Category::NonExistent` if no such global is defined.
   */
  Result<Value> call_global(std::string_view name, const std::vector<Value> &args = {});

  Result<Value> get_global(std::string_view name);
  Result<Void> set_global(std::string_view name, const Value &value);

  /**
   * Install a global `require` backed by the given resolver.
   *
   * Installing a new resolver replaces the previous one, including its module cache.
   */
  Result<Void> set_module_resolver(std::unique_ptr<ModuleResolver> resolver);
  core::ModuleLoader *module_loader() { return module_loader_.get(); }

  /// True if no exception is pending on the context.
  bool is_clean();

  /// Run a full, non-incremental garbage collection.
  void gc();
};

} // namespace jsembed

#endif // JSEMBED_CONTEXT_H
