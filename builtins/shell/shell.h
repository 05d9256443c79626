#ifndef JSEMBED_BUILTINS_SHELL_H
#define JSEMBED_BUILTINS_SHELL_H

#include "jsembed/builtin.h"
#include "jsembed/context.h"

namespace jsembed::builtins::shell {

bool install(Context *context);

} // namespace jsembed::builtins::shell

#endif
