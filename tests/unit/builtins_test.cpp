#include <string>

#include <gtest/gtest.h>

#include "jsembed/context.h"
#include "test_util.h"

using namespace jsembed;
using jsembed::test::ContextTest;

TEST_F(ContextTest, PrintWritesToStdout) {
  ::testing::internal::CaptureStdout();
  auto value = eval("print('foo', 'bar', 1, 2, 3)");
  EXPECT_EQ("foo bar 1 2 3\n", ::testing::internal::GetCapturedStdout());
  EXPECT_EQ(Value::undefined(), value);
}

TEST_F(ContextTest, PrintWithoutArgumentsWritesNewline) {
  ::testing::internal::CaptureStdout();
  eval("print()");
  EXPECT_EQ("\n", ::testing::internal::GetCapturedStdout());
}

TEST_F(ContextTest, AlertWritesToStderr) {
  ::testing::internal::CaptureStderr();
  eval("alert('foo', 'bar', 1, 2, 3)");
  EXPECT_EQ("foo bar 1 2 3\n", ::testing::internal::GetCapturedStderr());
}

TEST_F(ContextTest, PrintPropagatesToStringErrors) {
  ::testing::internal::CaptureStdout();
  auto err = eval_err("print({toString() { throw new RangeError('nope'); }})");
  ::testing::internal::GetCapturedStdout();
  EXPECT_EQ(Error::js(ErrorKind::Range, "RangeError: nope"), err);
}

class NoBuiltinsTest : public ContextTest {
protected:
  ContextConfig config() override {
    ContextConfig config;
    config.shell_builtins = false;
    return config;
  }
};

TEST_F(NoBuiltinsTest, ShellBuiltinsCanBeDisabled) {
  EXPECT_EQ(Value::string("undefined"), eval("typeof print"));
  EXPECT_EQ(Value::string("undefined"), eval("typeof alert"));
}

#ifdef JSEMBED_ENABLE_DEBUG
TEST_F(ContextTest, DumpValueWritesSourceToStdout) {
  ::testing::internal::CaptureStdout();
  auto value = eval("dumpValue(42, [1, 2])");
  EXPECT_EQ("42\n[1, 2]\n", ::testing::internal::GetCapturedStdout());
  EXPECT_EQ(Value::string("42"), value);
}
#endif
