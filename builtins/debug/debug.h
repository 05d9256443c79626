#ifndef JSEMBED_BUILTINS_DEBUG_H
#define JSEMBED_BUILTINS_DEBUG_H

#include "jsembed/builtin.h"
#include "jsembed/context.h"

namespace jsembed::builtins::debug {

bool install(Context *context);

} // namespace jsembed::builtins::debug

#endif
