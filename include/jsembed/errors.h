#ifndef JSEMBED_ERRORS_H
#define JSEMBED_ERRORS_H

bool throw_error(JSContext* cx, const JSErrorFormatString &error,
                 const char* arg1 = nullptr,
                 const char* arg2 = nullptr,
                 const char* arg3 = nullptr,
                 const char* arg4 = nullptr);

namespace Errors {
DEF_ERR(WrongType, JSEXN_TYPEERR, "{0}: {1} must {2}", 3)
DEF_ERR(ModuleLoadingError, JSEXN_REFERENCEERR,
        "Error loading module \"{0}\" (resolved path \"{1}\"): {2}", 3)
DEF_ERR(ModuleResolutionError, JSEXN_REFERENCEERR,
        "Cannot resolve module \"{0}\" from \"{1}\": {2}", 3)
DEF_ERR(NoModuleLoader, JSEXN_INTERNALERR, "{0} called after its module loader was replaced", 1)
};     // namespace Errors

#endif // JSEMBED_ERRORS_H
