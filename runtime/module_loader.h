#ifndef JSEMBED_CORE_MODULE_LOADER_H
#define JSEMBED_CORE_MODULE_LOADER_H

#include <memory>
#include <string>
#include <string_view>

#include "jsembed/builtin.h"
#include "jsembed/module-loader.h"

namespace jsembed::core {

/// Read a whole file into memory.
Result<std::string> read_file(const std::string &path);

/**
 * Implements CommonJS `require()` on top of a `ModuleResolver`.
 *
 * Module objects are cached in `require.cache`, keyed by resolved id, before their body
 * runs, so cyclic requires observe partially populated exports. A module whose body
 * throws is evicted from the cache again.
 */
class ModuleLoader {
  std::unique_ptr<ModuleResolver> resolver_;
  JS::PersistentRootedObject cache_;

  JSObject *create_require(JSContext *cx, HandleValue id);
  JSObject *create_module(JSContext *cx, HandleString id);
  bool execute(JSContext *cx, HandleObject module, HandleString id_str,
               const std::string &requested, const std::string &id);

public:
  explicit ModuleLoader(std::unique_ptr<ModuleResolver> resolver);

  /// Create the module cache and define the global `require`.
  bool install(JSContext *cx, HandleObject global);

  HandleObject cache() { return cache_; }

  /// Load `requested` on behalf of the module `parent_id`, storing its exports in `rval`.
  bool require(JSContext *cx, std::string_view parent_id, std::string_view requested,
               MutableHandleValue rval);
};

} // namespace jsembed::core

#endif // JSEMBED_CORE_MODULE_LOADER_H
