#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "jsembed/context.h"
#include "jsembed/module-loader.h"
#include "test_util.h"

using namespace jsembed;
using jsembed::test::ContextTest;

class MemoryModulesTest : public ContextTest {
protected:
  void SetUp() override {
    ContextTest::SetUp();
    ASSERT_TRUE(context_);

    auto resolver = std::make_unique<MemoryResolver>();
    resolver->add("pig", "module.exports = 'you\\'re a pig';");
    resolver->add("cow", "var pig = require('pig');\nmodule.exports = 'moo, and ' + pig;");
    resolver->add("ape", "module.exports.module = module;\n"
                         "module.exports.filename = __filename;\n"
                         "module.exports.dirname = __dirname;\n"
                         "module.exports.wasLoaded = module.loaded;\n"
                         "module.exports.thisIsExports = this === exports;\n");
    resolver->add("badger", "exports.foo = 123;\nexports.bar = 234;");
    resolver->add("bad.js", "exports.partial = true;\nthrow new Error('boom');");
    resolver->add("cycle_a", "exports.early = 1;\n"
                             "var b = require('cycle_b');\n"
                             "exports.fromB = b.sawEarly;");
    resolver->add("cycle_b", "var a = require('cycle_a');\nexports.sawEarly = a.early;");
    resolver->add("replace", "module.exports = [1, 2];");
    ASSERT_FALSE(context_->set_module_resolver(std::move(resolver)).is_err());
  }
};

TEST_F(MemoryModulesTest, RequireReturnsString) {
  EXPECT_EQ(Value::string("you're a pig"), eval("require('pig')"));
}

TEST_F(MemoryModulesTest, NestedRequire) {
  EXPECT_EQ(Value::string("moo, and you're a pig"), eval("require('cow')"));
}

TEST_F(MemoryModulesTest, RequireIsCached) {
  EXPECT_EQ(Value::boolean(true), eval("require('ape') === require('ape')"));
  EXPECT_EQ(Value::boolean(true), eval("'ape.js' in require.cache"));
  EXPECT_EQ(Value::boolean(true), eval("require.cache['ape.js'].exports === require('ape')"));
}

TEST_F(MemoryModulesTest, DeletingFromCacheReloads) {
  EXPECT_EQ(Value::boolean(true), eval("var first = require('ape');\n"
                                       "delete require.cache['ape.js'];\n"
                                       "first !== require('ape')"));
}

TEST_F(MemoryModulesTest, ModuleObject) {
  eval("var m = require('ape').module;");
  EXPECT_EQ(Value::string("function"), eval("typeof m.require"));
  EXPECT_EQ(Value::boolean(true), eval("m.exports === require('ape')"));
  EXPECT_EQ(Value::string("ape.js"), eval("m.id"));
  EXPECT_EQ(Value::string("ape.js"), eval("m.filename"));
  EXPECT_EQ(Value::string("ape.js"), eval("m.require.id"));
  EXPECT_EQ(Value::boolean(true), eval("m.require.cache === require.cache"));
}

TEST_F(MemoryModulesTest, LoadedIsSetAfterExecution) {
  EXPECT_EQ(Value::boolean(false), eval("require('ape').wasLoaded"));
  EXPECT_EQ(Value::boolean(true), eval("require('ape').module.loaded"));
}

TEST_F(MemoryModulesTest, WrapperArguments) {
  EXPECT_EQ(Value::string("ape.js"), eval("require('ape').filename"));
  EXPECT_EQ(Value::string("."), eval("require('ape').dirname"));
  EXPECT_EQ(Value::boolean(true), eval("require('ape').thisIsExports"));
}

TEST_F(MemoryModulesTest, ExportsAssignments) {
  Value::Object expected;
  expected.emplace("foo", Value::number(123));
  expected.emplace("bar", Value::number(234));
  EXPECT_EQ(Value::object(expected), eval("require('badger')"));
}

TEST_F(MemoryModulesTest, ReplacedExports) {
  EXPECT_EQ(Value::array({Value::number(1), Value::number(2)}), eval("require('replace')"));
}

TEST_F(MemoryModulesTest, CyclicRequireSeesPartialExports) {
  EXPECT_EQ(Value::number(1), eval("require('cycle_a').fromB"));
}

TEST_F(MemoryModulesTest, GlobalRequire) {
  EXPECT_EQ(Value::string(""), eval("require.id"));
  EXPECT_EQ(Value::string("function"), eval("typeof require"));
}

TEST_F(MemoryModulesTest, ThrowingModuleIsEvicted) {
  EXPECT_EQ(Error::js(ErrorKind::Error, "Error: boom"), eval_err("require('bad')"));
  EXPECT_EQ(Value::boolean(false), eval("'bad.js' in require.cache"));
  EXPECT_EQ(Error::js(ErrorKind::Error, "Error: boom"), eval_err("require('bad')"));
}

TEST_F(MemoryModulesTest, MissingModule) {
  auto err = eval_err("require('nope')");
  EXPECT_EQ(ErrorKind::Reference, err.kind());
  EXPECT_EQ("ReferenceError: Error loading module \"nope\" (resolved path \"nope.js\"): "
            "no such module",
            err.message());
  EXPECT_EQ(Value::boolean(false), eval("'nope.js' in require.cache"));
}

TEST_F(MemoryModulesTest, NonStringIdIsTypeError) {
  EXPECT_EQ(Error::js(ErrorKind::Type, "TypeError: require: module id must be a string"),
            eval_err("require(42)"));
}

TEST_F(MemoryModulesTest, ReplacingResolverDisablesOldRequire) {
  eval("var oldRequire = require;");
  ASSERT_FALSE(context_->set_module_resolver(std::make_unique<MemoryResolver>()).is_err());

  auto err = eval_err("oldRequire('pig')");
  EXPECT_EQ(ErrorKind::Internal, err.kind());
  EXPECT_EQ("InternalError: require called after its module loader was replaced", err.message());
  EXPECT_EQ(Value::boolean(false), eval("'pig.js' in require.cache"));
}

TEST(MemoryResolver, AddsJsSuffix) {
  MemoryResolver resolver;
  resolver.add("a", "1");
  resolver.add("b.js", "2");

  EXPECT_EQ(Result<std::string>("a.js"), resolver.resolve("a", ""));
  EXPECT_EQ(Result<std::string>("b.js"), resolver.resolve("b.js", "a.js"));
  EXPECT_EQ(Result<std::string>("1"), resolver.load("a.js"));
  EXPECT_EQ(Result<std::string>(Error::io("c.js", "no such module")), resolver.load("c.js"));
}

class FileModulesTest : public ContextTest {
protected:
  std::filesystem::path root_;

  void write(const std::filesystem::path &relative, const std::string &source) {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << source;
  }

  void SetUp() override {
    ContextTest::SetUp();
    ASSERT_TRUE(context_);

    auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = std::filesystem::path(::testing::TempDir()) /
            (std::string("jsembed_modules_") + info->name());
    std::filesystem::remove_all(root_);

    write("main.js", "var util = require('./lib/util');\nmodule.exports = util.name;");
    write("lib/util.js", "exports.name = 'util';\nexports.dir = __dirname;");
    write("lib/up.js", "module.exports = require('../leaf');");
    write("leaf.js", "module.exports = 'leaf';");
    write("data.json.js", "module.exports = 'explicit';");

    auto resolver = std::make_unique<FileResolver>(root_.string());
    ASSERT_FALSE(context_->set_module_resolver(std::move(resolver)).is_err());
  }

  void TearDown() override {
    ContextTest::TearDown();
    std::filesystem::remove_all(root_);
  }
};

TEST_F(FileModulesTest, RequireFromRoot) {
  EXPECT_EQ(Value::string("util"), eval("require('main')"));
  EXPECT_EQ(Value::string("leaf"), eval("require('leaf.js')"));
}

TEST_F(FileModulesTest, RelativeToRequiringModule) {
  EXPECT_EQ(Value::string("leaf"), eval("require('lib/up')"));
  EXPECT_EQ(Value::string("lib"), eval("require('lib/util').dir"));
}

TEST_F(FileModulesTest, IdsAreRelativeToRoot) {
  eval("var util = require('lib/util');");
  EXPECT_EQ(Value::boolean(false), eval("'main.js' in require.cache"));
  EXPECT_EQ(Value::string("lib/util.js"), eval("require.cache['lib/util.js'].id"));
  EXPECT_EQ(Value::string("main.js"), eval("require('main'); require.cache['main.js'].filename"));
}

TEST_F(FileModulesTest, ModulesOutsideRootHaveAbsoluteIds) {
  auto lib = (root_ / "lib").string();
  ASSERT_FALSE(context_->set_module_resolver(std::make_unique<FileResolver>(lib)).is_err());

  EXPECT_EQ(Value::string("leaf"), eval("require('up')"));
  auto key = (root_ / "leaf.js").string();
  ASSERT_FALSE(context_->set_global("key", Value::string(key)).is_err());
  EXPECT_EQ(Value::boolean(true), eval("key in require.cache"));
}

TEST_F(FileModulesTest, UnresolvableId) {
  EXPECT_EQ(Error::js(ErrorKind::Reference,
                      "ReferenceError: Cannot resolve module \"\" from \"\": empty module id"),
            eval_err("require('')"));
}

TEST_F(FileModulesTest, ResolvedIdsAreCacheKeys) {
  eval("require('main')");
  EXPECT_EQ(Value::boolean(true), eval("'lib/util.js' in require.cache"));
  EXPECT_EQ(Value::boolean(true), eval("require('./lib/util') === require('lib/util.js')"));
}

TEST_F(FileModulesTest, MissingFile) {
  auto err = eval_err("require('missing')");
  EXPECT_EQ(ErrorKind::Reference, err.kind());
  EXPECT_NE(std::string::npos, err.message().find("Error loading module \"missing\""))
      << err.message();
}

TEST_F(FileModulesTest, AppendsJsExtensionToDottedNames) {
  EXPECT_EQ(Value::string("explicit"), eval("require('data.json')"));
}

TEST(FileResolver, ResolvesPaths) {
  FileResolver resolver("/srv/app");
  EXPECT_EQ(Result<std::string>("a/b"), resolver.resolve("a/./b", ""));
  EXPECT_EQ(Result<std::string>("b"), resolver.resolve("a/../b", ""));
  EXPECT_EQ(Result<std::string>("lib/b"), resolver.resolve("./b", "lib/a.js"));
  EXPECT_EQ(Result<std::string>("/srv/c"), resolver.resolve("../c", "main.js"));
  EXPECT_EQ(Result<std::string>("e"), resolver.resolve("./x//../e", "main.js"));
  EXPECT_EQ(Result<std::string>("/abs/d"), resolver.resolve("/abs/d", "main.js"));
  EXPECT_EQ(Result<std::string>("z"), resolver.resolve("/srv/app/z", ""));
  EXPECT_EQ(Result<std::string>("/other/n"), resolver.resolve("./n", "/other/m.js"));
  EXPECT_TRUE(resolver.resolve("", "").is_err());
}

TEST(FileResolver, RelativeRootIsAnchoredAtWorkingDirectory) {
  FileResolver resolver("");
  EXPECT_EQ(Result<std::string>("a/b"), resolver.resolve("./a/b", ""));
  auto parent = std::filesystem::current_path().parent_path() / "up";
  EXPECT_EQ(Result<std::string>(parent.string()), resolver.resolve("../up", ""));
}
