#include "encode.h"

// TODO: remove these once the warnings are fixed
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Winvalid-offsetof"
#include "js/CharacterEncoding.h"
#include "js/Conversions.h"
#pragma clang diagnostic pop

namespace jsembed::core {

EncodedString encode(JSContext *cx, JS::HandleString str) {
  EncodedString res;
  res.ptr = JS_EncodeStringToUTF8(cx, str);
  if (res.ptr) {
    // This shouldn't fail, since the encode operation ensured `str` is linear.
    JSLinearString *linear = JS_EnsureLinearString(cx, str);
    res.len = JS::GetDeflatedUTF8StringLength(linear);
  }

  return res;
}

EncodedString encode(JSContext *cx, JS::HandleValue val) {
  JS::RootedString str(cx, JS::ToString(cx, val));
  if (!str) {
    return EncodedString{};
  }

  return encode(cx, str);
}

JSString *new_string(JSContext *cx, std::string_view str) {
  return JS_NewStringCopyUTF8N(cx, JS::UTF8Chars(str.data(), str.size()));
}

bool property_id(JSContext *cx, std::string_view name, JS::MutableHandleId id) {
  JS::RootedString name_str(cx, new_string(cx, name));
  if (!name_str) {
    return false;
  }

  return JS_StringToId(cx, name_str, id);
}

} // namespace jsembed::core
