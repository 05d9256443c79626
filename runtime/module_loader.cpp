#include "module_loader.h"
#include "encode.h"

#include "jsembed/context.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <sys/stat.h>

#include <fmt/format.h>

// TODO: remove these once the warnings are fixed
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Winvalid-offsetof"
#include "js/CompilationAndEvaluation.h"
#include "js/CompileOptions.h"
#include "js/SourceText.h"
#pragma clang diagnostic pop

namespace jsembed {

namespace {

class AutoCloseFile {
  FILE* file;

public:
  explicit AutoCloseFile(FILE* f) : file(f) {}
  ~AutoCloseFile() {
    release();
  }
  bool release() {
    bool success = true;
    if (file && file != stdin && file != stdout && file != stderr) {
      success = !fclose(file);
    }
    file = nullptr;
    // NOLINTNEXTLINE(clang-analyzer-unix.Stream)
    return success;
  }
};

std::string resolve_extension(std::string resolved_path) {
  struct stat s;
  if (stat(resolved_path.c_str(), &s) == 0) {
    return resolved_path;
  }

  if (resolved_path.ends_with(".js")) {
    return resolved_path;
  }

  std::string with_ext = resolved_path + ".js";
  if (stat(with_ext.c_str(), &s) == 0) {
    return with_ext;
  }
  return resolved_path;
}

// Resolve `path` against the directory part of `base`, normalizing `.` and `..` segments.
std::string resolve_path(std::string_view path, std::string_view base) {
  size_t base_len = base.size();
  while (base_len > 0 && base[base_len - 1] != '/') {
    base_len--;
  }
  size_t path_len = path.size();

  std::string resolved_path;
  resolved_path.reserve(base_len + path_len + 1);

  // copy the base in if used
  size_t resolved_len = base_len;
  if (!path.empty() && path[0] == '/') {
    resolved_path.assign("/");
    resolved_len = 1;
  } else {
    resolved_path.assign(base.substr(0, base_len));
  }

  // Copy each segment of the path into the resolved path, backtracking for `..`
  // segments and skipping `.` and empty segments.
  size_t path_from_idx = 0;
  size_t path_cur_idx = 0;
  while (path_cur_idx < path_len) {
    while (path_cur_idx < path_len && path[path_cur_idx] != '/')
      path_cur_idx++;
    if (path_cur_idx == path_from_idx) {
      path_cur_idx++;
      path_from_idx = path_cur_idx;
      continue;
    }
    // . segment to skip
    if (path_cur_idx - path_from_idx == 1 && path[path_from_idx] == '.') {
      path_cur_idx++;
      path_from_idx = path_cur_idx;
      continue;
    }
    // .. segment backtracking
    if (path_cur_idx - path_from_idx == 2 && path[path_from_idx] == '.' &&
        path[path_from_idx + 1] == '.') {
      path_cur_idx++;
      path_from_idx = path_cur_idx;
      // Never backtrack past the root of an absolute path.
      if (resolved_len > 1 && resolved_path[resolved_len - 1] == '/') {
        resolved_len--;
      }
      while (resolved_len > 0 && resolved_path[resolved_len - 1] != '/') {
        resolved_len--;
      }
      resolved_path.resize(resolved_len);
      continue;
    }
    // normal segment to copy, with the trailing / if not the last segment
    if (path_cur_idx < path_len && path[path_cur_idx] == '/')
      path_cur_idx++;

    resolved_path.append(path.substr(path_from_idx, path_cur_idx - path_from_idx));
    resolved_len += path_cur_idx - path_from_idx;
    path_from_idx = path_cur_idx;
  }

  return resolved_path;
}

// Strip off the given prefix when possible.
std::string strip_prefix(std::string_view resolved_path, std::string_view prefix) {
  if (!resolved_path.starts_with(prefix)) {
    return std::string(resolved_path);
  }

  return std::string(resolved_path.substr(prefix.size()));
}

std::string dirname_of(std::string_view id) {
  auto pos = id.rfind('/');
  if (pos == std::string_view::npos) {
    return ".";
  }
  if (pos == 0) {
    return "/";
  }
  return std::string(id.substr(0, pos));
}

std::string with_js_suffix(std::string_view id) {
  if (id.ends_with(".js")) {
    return std::string(id);
  }
  return fmt::format("{}.js", id);
}

// The native behind every `require` function. `cache` is the module cache the function
// was created for, `parent_id` the id of the module owning it.
bool require_native(JSContext *cx, HandleObject cache, HandleValue parent_id, CallArgs args) {
  TRACE_METHOD("require")
  auto *context = Context::get(cx);
  auto *loader = context ? context->module_loader() : nullptr;
  if (!loader || loader->cache().get() != cache.get()) {
    return throw_error(cx, Errors::NoModuleLoader, "require");
  }

  if (!args.get(0).isString()) {
    return throw_error(cx, Errors::WrongType, "require", "module id", "be a string");
  }

  RootedString requested_str(cx, args[0].toString());
  auto requested = core::encode(cx, requested_str);
  if (!requested) {
    return false;
  }
  auto parent = core::encode(cx, parent_id);
  if (!parent) {
    return false;
  }

  return loader->require(cx, parent, requested, args.rval());
}

} // namespace

FileResolver::FileResolver(std::string root) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(root.empty() ? "." : root, ec);
  root_ = ec ? std::move(root) : absolute.lexically_normal().string();
  if (root_.empty() || root_.back() != '/') {
    root_ += '/';
  }
}

std::string FileResolver::path_of(std::string_view id) const {
  if (id.starts_with('/')) {
    return std::string(id);
  }
  return fmt::format("{}{}", root_, id);
}

Result<std::string> FileResolver::resolve(std::string_view requested_id,
                                          std::string_view parent_id) {
  if (requested_id.empty()) {
    return Error::io(std::string(requested_id), "empty module id");
  }

  bool relative = requested_id.starts_with("./") || requested_id.starts_with("../");
  std::string base = relative && !parent_id.empty() ? path_of(parent_id) : root_;
  auto path = resolve_extension(resolve_path(requested_id, base));

  // Modules below the root are identified relative to it, all others by absolute path.
  return strip_prefix(path, root_);
}

Result<std::string> FileResolver::load(const std::string &resolved_id) {
  return core::read_file(path_of(resolved_id));
}

void MemoryResolver::add(std::string_view id, std::string source) {
  sources_.insert_or_assign(with_js_suffix(id), std::move(source));
}

Result<std::string> MemoryResolver::resolve(std::string_view requested_id,
                                            std::string_view parent_id) {
  return with_js_suffix(requested_id);
}

Result<std::string> MemoryResolver::load(const std::string &resolved_id) {
  auto it = sources_.find(resolved_id);
  if (it == sources_.end()) {
    return Error::io(resolved_id, "no such module");
  }
  return it->second;
}

namespace core {

Result<std::string> read_file(const std::string &path) {
  struct stat s;
  if (stat(path.c_str(), &s) == 0 && S_ISDIR(s.st_mode)) {
    return Error::io(path, "is a directory");
  }

  FILE *file = fopen(path.c_str(), "r");
  if (!file) {
    return Error::io(path, std::strerror(errno));
  }

  AutoCloseFile autoclose(file);
  if (fseek(file, 0, SEEK_END) != 0) {
    return Error::io(path, "can't read from file");
  }
  long len = ftell(file);
  if (len < 0 || fseek(file, 0, SEEK_SET) != 0) {
    return Error::io(path, "can't read from file");
  }

  std::string buf(static_cast<size_t>(len), '\0');
  size_t cc = fread(buf.data(), sizeof(char), buf.size(), file);
  if (cc != buf.size()) {
    return Error::io(path, "error reading file");
  }
  if (!autoclose.release()) {
    return Error::io(path, std::strerror(errno));
  }

  return buf;
}

ModuleLoader::ModuleLoader(std::unique_ptr<ModuleResolver> resolver)
    : resolver_(std::move(resolver)) {}

bool ModuleLoader::install(JSContext *cx, HandleObject global) {
  cache_.init(cx, JS_NewPlainObject(cx));
  if (!cache_) {
    return false;
  }

  RootedValue main_id(cx, StringValue(JS_GetEmptyString(cx)));
  RootedObject global_require(cx, create_require(cx, main_id));
  if (!global_require) {
    return false;
  }

  return JS_DefineProperty(cx, global, "require", global_require, JSPROP_ENUMERATE);
}

JSObject *ModuleLoader::create_require(JSContext *cx, HandleValue id) {
  RootedObject fun(cx, create_internal_method<require_native>(cx, cache_, id, 1, "require"));
  if (!fun) {
    return nullptr;
  }

  if (!JS_DefineProperty(cx, fun, "id", id, JSPROP_ENUMERATE) ||
      !JS_DefineProperty(cx, fun, "cache", cache_, JSPROP_ENUMERATE)) {
    return nullptr;
  }

  return fun;
}

JSObject *ModuleLoader::create_module(JSContext *cx, HandleString id) {
  RootedObject module(cx, JS_NewPlainObject(cx));
  if (!module) {
    return nullptr;
  }
  RootedObject exports(cx, JS_NewPlainObject(cx));
  if (!exports) {
    return nullptr;
  }

  RootedValue id_val(cx, StringValue(id));
  RootedObject module_require(cx, create_require(cx, id_val));
  if (!module_require) {
    return nullptr;
  }

  RootedValue loaded(cx, JS::FalseValue());
  if (!JS_DefineProperty(cx, module, "exports", exports, JSPROP_ENUMERATE) ||
      !JS_DefineProperty(cx, module, "id", id_val, JSPROP_ENUMERATE) ||
      !JS_DefineProperty(cx, module, "filename", id_val, JSPROP_ENUMERATE) ||
      !JS_DefineProperty(cx, module, "loaded", loaded, JSPROP_ENUMERATE) ||
      !JS_DefineProperty(cx, module, "require", module_require, JSPROP_ENUMERATE)) {
    return nullptr;
  }

  return module;
}

bool ModuleLoader::execute(JSContext *cx, HandleObject module, HandleString id_str,
                           const std::string &requested, const std::string &id) {
  auto source = resolver_->load(id);
  if (source.is_err()) {
    return throw_error(cx, Errors::ModuleLoadingError, requested.c_str(), id.c_str(),
                       source.to_err()->message().c_str());
  }

  // The wrapper head stays on the first line, so that line numbers in stacks match the
  // module source.
  auto wrapped = fmt::format(
      "(function (exports, require, module, __filename, __dirname) {{{}\n}})", source.unwrap());

  JS::CompileOptions opts(cx);
  opts.setFileAndLine(id.c_str(), 1);
  JS::SourceText<mozilla::Utf8Unit> src;
  if (!src.init(cx, wrapped.data(), wrapped.size(), JS::SourceOwnership::Borrowed)) {
    return false;
  }

  RootedValue fun(cx);
  if (!JS::Evaluate(cx, opts, src, &fun)) {
    return false;
  }

  RootedString dirname(cx, new_string(cx, dirname_of(id)));
  if (!dirname) {
    return false;
  }

  RootedValueArray<5> args(cx);
  if (!JS_GetProperty(cx, module, "exports", args[0]) ||
      !JS_GetProperty(cx, module, "require", args[1])) {
    return false;
  }
  args[2].setObject(*module);
  args[3].setString(id_str);
  args[4].setString(dirname);

  RootedValue rval(cx);
  return JS::Call(cx, args[0], fun, args, &rval);
}

bool ModuleLoader::require(JSContext *cx, std::string_view parent_id,
                           std::string_view requested, MutableHandleValue rval) {
  std::string requested_id(requested);
  auto resolved = resolver_->resolve(requested, parent_id);
  if (resolved.is_err()) {
    std::string parent(parent_id);
    return throw_error(cx, Errors::ModuleResolutionError, requested_id.c_str(), parent.c_str(),
                       resolved.to_err()->message().c_str());
  }
  const std::string &id = resolved.unwrap();

  JS::RootedId key(cx);
  if (!property_id(cx, id, &key)) {
    return false;
  }

  bool cached = false;
  if (!JS_HasOwnPropertyById(cx, cache_, key, &cached)) {
    return false;
  }
  if (cached) {
    RootedValue cached_val(cx);
    if (!JS_GetPropertyById(cx, cache_, key, &cached_val)) {
      return false;
    }
    if (cached_val.isObject()) {
      JSEMBED_SPAM("require: cache hit for {}\n", id);
      RootedObject cached_module(cx, &cached_val.toObject());
      return JS_GetProperty(cx, cached_module, "exports", rval);
    }
  }

  JSEMBED_LOG("require: loading \"{}\" as {} for \"{}\"\n", requested, id, parent_id);
  RootedString id_str(cx, new_string(cx, id));
  if (!id_str) {
    return false;
  }
  RootedObject module(cx, create_module(cx, id_str));
  if (!module) {
    return false;
  }

  RootedValue module_val(cx, ObjectValue(*module));
  if (!JS_DefinePropertyById(cx, cache_, key, module_val, JSPROP_ENUMERATE)) {
    return false;
  }

  if (!execute(cx, module, id_str, requested_id, id)) {
    // Evict the half-loaded module, keeping the original exception pending.
    JS::AutoSaveExceptionState saved(cx);
    JS::ObjectOpResult deleted;
    if (!JS_DeletePropertyById(cx, cache_, key, deleted) || !deleted.ok()) {
      JSEMBED_LOG("require: couldn't evict {} from the module cache\n", id);
    }
    return false;
  }

  RootedValue loaded(cx, JS::TrueValue());
  if (!JS_SetProperty(cx, module, "loaded", loaded)) {
    return false;
  }

  return JS_GetProperty(cx, module, "exports", rval);
}

} // namespace core

} // namespace jsembed
