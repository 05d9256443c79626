#ifndef JSEMBED_MODULE_LOADER_H
#define JSEMBED_MODULE_LOADER_H

#include <map>
#include <string>
#include <string_view>

#include "error.h"

namespace jsembed {

/**
 * Maps `require()` requests to module ids, and module ids to source code.
 *
 * A resolved id is used as the key in `require.cache`, as `module.id` and
 * `module.filename`, and as the parent id for requests made by that module.
 */
class ModuleResolver {
public:
  virtual ~ModuleResolver() = default;

  /// Resolve `requested_id`, as requested by the module `parent_id`.
  ///
  /// The parent id of the global `require` is the empty string.
  virtual Result<std::string> resolve(std::string_view requested_id,
                                      std::string_view parent_id) = 0;

  /// Return the source of the module with the given resolved id.
  virtual Result<std::string> load(const std::string &resolved_id) = 0;
};

/**
 * Resolves modules on the file system.
 *
 * Ids starting with `./` or `../` are resolved relative to the requesting module's
 * directory, all others relative to the root. A `.js` extension is added if the
 * requested path doesn't exist as-is.
 *
 * Resolved ids of files below the root are relative to it, e.g. `lib/util.js`, so they
 * don't depend on where the root lives. Files outside the root get absolute ids.
 */
class FileResolver : public ModuleResolver {
  std::string root_;

  std::string path_of(std::string_view id) const;

public:
  explicit FileResolver(std::string root);

  Result<std::string> resolve(std::string_view requested_id, std::string_view parent_id) override;
  Result<std::string> load(const std::string &resolved_id) override;
};

/// Resolves modules from sources registered in memory, keyed by id plus `.js`.
class MemoryResolver : public ModuleResolver {
  std::map<std::string, std::string, std::less<>> sources_;

public:
  /// Register `source` as the module `id`. A `.js` suffix is added if missing.
  void add(std::string_view id, std::string source);

  Result<std::string> resolve(std::string_view requested_id, std::string_view parent_id) override;
  Result<std::string> load(const std::string &resolved_id) override;
};

} // namespace jsembed

#endif // JSEMBED_MODULE_LOADER_H
