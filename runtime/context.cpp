#include "jsembed/context.h"
#include "jsembed/builtin.h"

#include "convert.h"
#include "encode.h"
#include "exception.h"
#include "module_loader.h"

// TODO: remove these once the warnings are fixed
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Winvalid-offsetof"
#pragma clang diagnostic ignored "-Wdeprecated-enum-enum-conversion"
#include "js/CompilationAndEvaluation.h"
#include "js/CompileOptions.h"
#include "js/Initialization.h"
#include "js/SourceText.h"
#pragma clang diagnostic pop

namespace jsembed {

bool install_builtins(Context *context);

namespace {

/* The class of the global object. */
JSClass global_class = {"global", JSCLASS_GLOBAL_FLAGS, &JS::DefaultGlobalClassOps};

thread_local Context *CURRENT_CONTEXT = nullptr;

bool init_engine() {
  // JS_Init must be called exactly once per process, before creating any context.
  static const bool initialized = JS_Init();
  return initialized;
}

void gc_callback(JSContext *cx, JSGCStatus status, JS::GCReason reason, void *data) {
  JSEMBED_LOG("gc for reason {}, {}\n", JS::ExplainGCReason(reason),
              status == JSGC_END ? "end" : "start");
}

void out_of_memory_callback(JSContext *cx, void *data) {
  // Note: we unconditionally print these, since the context is likely unusable afterwards.
  fmt::print(stderr, "jsembed: the engine ran out of memory (heap limit {} bytes)\n",
             static_cast<Context *>(data)->config().max_heap_bytes);
  fflush(stderr);
}

} // namespace

Context::Context(ContextConfig config) : config_(std::move(config)) {}

Result<std::unique_ptr<Context>> Context::create(ContextConfig config) {
  if (CURRENT_CONTEXT) {
    return Error::init("another context is already alive on this thread");
  }

  std::unique_ptr<Context> context(new Context(std::move(config)));
  auto res = context->init();
  if (res.is_err()) {
    return *res.to_err();
  }

  return context;
}

Result<Void> Context::init() {
  if (config_.verbose) {
    set_debug_logging(true);
  }

  if (!init_engine()) {
    return Error::init("JS_Init failed");
  }

  cx_ = JS_NewContext(config_.max_heap_bytes ? config_.max_heap_bytes : JS::DefaultHeapMaxBytes);
  if (!cx_) {
    return Error::init("couldn't create the engine context");
  }
  CURRENT_CONTEXT = this;
  JS_SetContextPrivate(cx_, this);

  JS_SetNativeStackQuota(cx_, config_.native_stack_quota);
  if (!JS::InitSelfHostedCode(cx_)) {
    return Error::init("couldn't initialize self-hosted code");
  }

  JS::RealmOptions options;
  RootedObject global(
      cx_, JS_NewGlobalObject(cx_, &global_class, nullptr, JS::FireOnNewGlobalHook, options));
  if (!global) {
    return Error::init("couldn't create the global object");
  }
  global_ = std::make_unique<JS::PersistentRootedObject>(cx_, global);

  old_realm_ = JS::EnterRealm(cx_, global);
  entered_realm_ = true;
  if (!JS::InitRealmStandardClasses(cx_)) {
    return Error::init(core::take_pending_error(cx_).describe());
  }

  JS_SetGCCallback(cx_, gc_callback, this);
  JS::SetOutOfMemoryCallback(cx_, out_of_memory_callback, this);

  if (config_.shell_builtins && !install_builtins(this)) {
    return Error::init(core::take_pending_error(cx_).describe());
  }

  JSEMBED_LOG("context created (heap limit {}, stack quota {})\n", config_.max_heap_bytes,
              config_.native_stack_quota);
  return Void{};
}

Context::~Context() {
  // Rooted state has to go before the engine context does.
  module_loader_.reset();
  global_.reset();

  if (cx_) {
    if (entered_realm_) {
      JS::LeaveRealm(cx_, old_realm_);
    }
    JS_DestroyContext(cx_);
    JSEMBED_LOG("context destroyed\n");
  }

  if (CURRENT_CONTEXT == this) {
    CURRENT_CONTEXT = nullptr;
  }
}

Context *Context::get(JSContext *cx) { return static_cast<Context *>(JS_GetContextPrivate(cx)); }

JS::HandleObject Context::global() { return *global_; }

Result<Value> Context::eval_string(std::string_view code, const char *filename) {
  JSEMBED_LOG("evaluating {} bytes of {}\n", code.size(), filename);
  JS::CompileOptions opts(cx_);
  opts.setFileAndLine(filename, 1);

  JS::SourceText<mozilla::Utf8Unit> source;
  if (!source.init(cx_, code.data(), code.size(), JS::SourceOwnership::Borrowed)) {
    return core::take_pending_error(cx_);
  }

  RootedValue result(cx_);
  if (!JS::Evaluate(cx_, opts, source, &result)) {
    return core::take_pending_error(cx_);
  }

  return core::to_value(cx_, result);
}

Result<Value> Context::eval_file(const std::filesystem::path &path) {
  auto source = core::read_file(path.string());
  if (source.is_err()) {
    return *source.to_err();
  }

  auto filename = path.string();
  return eval_string(source.unwrap(), filename.c_str());
}

Result<Value> Context::call_global(std::string_view name, const std::vector<Value> &args) {
  JS::RootedId id(cx_);
  if (!core::property_id(cx_, name, &id)) {
    return core::take_pending_error(cx_);
  }

  RootedValue fun(cx_);
  if (!JS_GetPropertyById(cx_, global(), id, &fun)) {
    return core::take_pending_error(cx_);
  }
  if (fun.isUndefined()) {
    return Error::non_existent(std::string(name));
  }

  JS::RootedValueVector argv(cx_);
  if (!argv.reserve(args.size())) {
    JS_ReportOutOfMemory(cx_);
    return core::take_pending_error(cx_);
  }
  RootedValue arg(cx_);
  for (const auto &value : args) {
    if (!core::from_value(cx_, value, &arg)) {
      return core::take_pending_error(cx_);
    }
    argv.infallibleAppend(arg);
  }

  JSEMBED_LOG("calling global {} with {} arguments\n", name, args.size());
  RootedValue result(cx_);
  if (!JS_CallFunctionValue(cx_, global(), fun, argv, &result)) {
    return core::take_pending_error(cx_);
  }

  return core::to_value(cx_, result);
}

Result<Value> Context::get_global(std::string_view name) {
  JS::RootedId id(cx_);
  if (!core::property_id(cx_, name, &id)) {
    return core::take_pending_error(cx_);
  }

  bool found = false;
  if (!JS_HasPropertyById(cx_, global(), id, &found)) {
    return core::take_pending_error(cx_);
  }
  if (!found) {
    return Error::non_existent(std::string(name));
  }

  RootedValue value(cx_);
  if (!JS_GetPropertyById(cx_, global(), id, &value)) {
    return core::take_pending_error(cx_);
  }

  return core::to_value(cx_, value);
}

Result<Void> Context::set_global(std::string_view name, const Value &value) {
  JS::RootedId id(cx_);
  RootedValue val(cx_);
  if (!core::property_id(cx_, name, &id) || !core::from_value(cx_, value, &val) ||
      !JS_SetPropertyById(cx_, global(), id, val)) {
    return core::take_pending_error(cx_);
  }

  return Void{};
}

Result<Void> Context::set_module_resolver(std::unique_ptr<ModuleResolver> resolver) {
  auto loader = std::make_unique<core::ModuleLoader>(std::move(resolver));
  if (!loader->install(cx_, global())) {
    return core::take_pending_error(cx_);
  }

  module_loader_ = std::move(loader);
  return Void{};
}

bool Context::is_clean() { return !JS_IsExceptionPending(cx_); }

void Context::gc() {
  JS::PrepareForFullGC(cx_);
  JS::NonIncrementalGC(cx_, JS::GCOptions::Normal, JS::GCReason::API);
}

} // namespace jsembed
