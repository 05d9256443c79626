#include "jsembed/context.h"

#define NS_DEF(ns)                                                                                 \
  namespace jsembed::builtins::ns {                                                                \
  extern bool install(Context *context);                                                           \
  }
#include "builtins.incl"
#undef NS_DEF

namespace jsembed {

bool install_builtins(Context *context) {
#define NS_DEF(ns)                                                                                 \
  if (!builtins::ns::install(context))                                                             \
    return false;
#include "builtins.incl"
#undef NS_DEF

  return true;
}

} // namespace jsembed
