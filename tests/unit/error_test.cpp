#include <gtest/gtest.h>

#include "jsembed/error.h"
#include "test_util.h"

using namespace jsembed;

TEST(Error, Describe) {
  EXPECT_EQ("uncaught exception: foobar", Error::js(ErrorKind::Generic, "foobar").describe());
  EXPECT_EQ("TypeError: xyz", Error::js(ErrorKind::Type, "TypeError: xyz").describe());
  EXPECT_EQ("unsupported type: symbol", Error::unsupported_type("symbol").describe());
  EXPECT_EQ("\"foo\" does not exist", Error::non_existent("foo").describe());
  EXPECT_EQ("can't read \"a.js\": is a directory", Error::io("a.js", "is a directory").describe());
  EXPECT_EQ("engine initialization failed: JS_Init failed",
            Error::init("JS_Init failed").describe());
}

TEST(Error, Equality) {
  EXPECT_EQ(Error::js(ErrorKind::Range, "x"), Error::js(ErrorKind::Range, "x"));
  EXPECT_NE(Error::js(ErrorKind::Range, "x"), Error::js(ErrorKind::Type, "x"));
  EXPECT_NE(Error::non_existent("x"), Error::unsupported_type("x"));
}

TEST(Error, Accessors) {
  auto err = Error::io("lib/a.js", "no such module");
  EXPECT_EQ(Error::Category::Io, err.category());
  EXPECT_FALSE(err.is_js());
  EXPECT_EQ("lib/a.js", err.path());
  EXPECT_EQ("no such module", err.message());
  EXPECT_STREQ("URIError", error_kind_name(ErrorKind::Uri));
}

TEST(Result, HoldsValueOrError) {
  Result<int> ok = 5;
  EXPECT_FALSE(ok.is_err());
  EXPECT_EQ(nullptr, ok.to_err());
  EXPECT_EQ(5, ok.unwrap());

  auto err = Result<int>::err(Error::non_existent("x"));
  ASSERT_TRUE(err.is_err());
  EXPECT_EQ(Error::non_existent("x"), *err.to_err());
  EXPECT_THROW(err.unwrap(), std::bad_variant_access);

  EXPECT_EQ(Result<int>::ok(5), ok);
  EXPECT_NE(Result<int>::ok(5), err);
}
