#ifndef JSEMBED_CONFIG_PARSER_H
#define JSEMBED_CONFIG_PARSER_H

#include "context.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsembed {

/// Configuration of the `jsembed` shell.
struct ShellConfig {
  ContextConfig context;

  /// Path of the script to evaluate. Ignored if `script` is set.
  std::optional<std::string> script_path;
  /// Inline script source, as given with `-e`.
  std::optional<std::string> script;
  /// Root directory for resolving non-relative `require()` ids.
  std::optional<std::string> module_root;
  /// Print the completion value of the script to stdout.
  bool print_result = false;

  ShellConfig() = default;
};

class ConfigParser {
  std::unique_ptr<ShellConfig> config_;

public:
  ConfigParser() : config_(std::make_unique<ShellConfig>()) {}

  /**
   * Read configuration from a given environment variable.
   *
   * The variable's contents are expected to be in the format of a command line, minus the
   * program name, so all the examples for the `apply_args` method apply here, too.
   */
  ConfigParser *apply_env(std::string_view envvar_name = "JSEMBED_CONFIG") {
    if (const char *config = std::getenv(std::string(envvar_name).c_str())) {
      return apply_args(config);
    }

    return this;
  }

  /**
   * Split the given string into arguments and apply them to the configuration.
   *
   * The string contents are expected to be in the format of a command line, minus the
   * program name, so all the examples for the other `apply_args` overload apply here, too.
   */
  ConfigParser *apply_args(std::string_view args_string) {
    std::vector<std::string_view> args = { "jsembed" };
    char last = '\0';
    bool in_quotes = false;
    size_t slice_start = 0;
    for (size_t i = 0; i < args_string.size(); i++) {
      char c = args_string[i];

      if ((!in_quotes && isspace(c)) || (c == '"' && last != '\\')) {
        if (slice_start < i) {
          args.push_back(args_string.substr(slice_start, i - slice_start));
        }
        slice_start = i + 1;
      }
      if (c == '"' && last != '\\') {
        in_quotes = !in_quotes;
      }
      last = c;
    }

    if (slice_start < args_string.size()) {
      args.push_back(args_string.substr(slice_start));
    }

    return apply_args(args);
  }

  /**
   * Parse the given arguments and apply them to the configuration.
   *
   * `args[0]` is the program name. Can be called multiple times, with the values set in the
   * last call taking precedence over values that might have been set in previous calls,
   * including indirectly through `apply_env`.
   *
   * Examples:
   *   jsembed script.js
   *   jsembed -e 'print("foo", "bar", 1, 2, 3)'
   *   jsembed --module-root lib/ --print-result -e 'require("pig")'
   */
  ConfigParser *apply_args(std::vector<std::string_view> args) {
    for (size_t i = 1; i < args.size(); i++) {
      if (args[i] == "-e" || args[i] == "--eval") {
        if (i + 1 < args.size()) {
          config_->script = std::string(args[i + 1]);
          config_->script_path = std::nullopt;
          i++;
        }
      } else if (args[i] == "-v" || args[i] == "--verbose") {
        config_->context.verbose = true;
      } else if (args[i] == "-p" || args[i] == "--print-result") {
        config_->print_result = true;
      } else if (args[i] == "--module-root") {
        if (i + 1 < args.size()) {
          config_->module_root = std::string(args[i + 1]);
          i++;
        }
      } else if (args[i] == "--max-heap-bytes") {
        if (i + 1 < args.size()) {
          auto value = args[i + 1];
          size_t bytes = 0;
          auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), bytes);
          if (ec != std::errc() || end != value.data() + value.size()) {
            std::cerr << "Invalid value for --max-heap-bytes: " << value << std::endl;
            exit(1);
          }
          config_->context.max_heap_bytes = bytes;
          i++;
        }
      } else if (args[i].starts_with("--")) {
        std::cerr << "Unknown option: " << args[i] << std::endl;
        exit(1);
      } else {
        config_->script_path = std::string(args[i]);
        config_->script = std::nullopt;
      }
    }

    return this;
  }

  /**
   * Take the configuration object.
   *
   * This method is meant to be called after all the desired configuration has been applied.
   */
  std::unique_ptr<ShellConfig> take() { return std::move(config_); }
};

} // namespace jsembed

#endif // JSEMBED_CONFIG_PARSER_H
