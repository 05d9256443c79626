#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "jsembed/config-parser.h"
#include "jsembed/context.h"
#include "jsembed/module-loader.h"

namespace {

int report(const jsembed::Error &err) {
  fmt::print(stderr, "Error: {}\n", err.describe());
  return 1;
}

std::string module_root(const jsembed::ShellConfig &config) {
  if (config.module_root) {
    return *config.module_root;
  }
  if (config.script_path && !config.script) {
    auto dir = std::filesystem::path(*config.script_path).parent_path();
    if (!dir.empty()) {
      return dir.string();
    }
  }

  return ".";
}

} // namespace

/**
 * The `jsembed` shell.
 *
 * Configuration is taken first from the env var `JSEMBED_CONFIG`, split into a command line,
 * and then from the actual command line. Without a script, an empty one is run.
 */
int main(int argc, const char *argv[]) {
  std::vector<std::string_view> args(argv, argv + argc);
  auto config_parser = jsembed::ConfigParser();
  config_parser.apply_env()->apply_args(std::move(args));
  auto config = config_parser.take();

  auto context_res = jsembed::Context::create(config->context);
  if (context_res.is_err()) {
    return report(*context_res.to_err());
  }
  auto context = std::move(context_res.unwrap());

  auto resolver = std::make_unique<jsembed::FileResolver>(module_root(*config));
  auto installed = context->set_module_resolver(std::move(resolver));
  if (installed.is_err()) {
    return report(*installed.to_err());
  }

  jsembed::Result<jsembed::Value> result = jsembed::Value();
  if (config->script) {
    result = context->eval_string(*config->script, "<eval>");
  } else if (config->script_path) {
    result = context->eval_file(*config->script_path);
  }

  if (result.is_err()) {
    return report(*result.to_err());
  }

  if (config->print_result) {
    fmt::print("{}\n", jsembed::describe(result.unwrap()));
  }

  return 0;
}
