#ifndef JSEMBED_ERROR_H
#define JSEMBED_ERROR_H

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace jsembed {

/// A type to signal that a result produces no value.
struct Void final {
  bool operator==(const Void &) const = default;
};

/// Kinds of script errors.
enum class ErrorKind : uint8_t {
  /// A thrown value that doesn't inherit from `Error`, like `throw 3.14;`.
  Generic,

  /// An instance of `Error`, or of an engine-specific error type.
  Error,
  /// An instance of `InternalError`, e.g. "too much recursion".
  Internal,
  /// An instance of `AggregateError`.
  Aggregate,
  /// An instance of `EvalError`.
  Eval,
  /// An instance of `RangeError`.
  Range,
  /// An instance of `ReferenceError`.
  Reference,
  /// An instance of `SyntaxError`.
  Syntax,
  /// An instance of `TypeError`.
  Type,
  /// An instance of `URIError`.
  Uri,

  /// The engine ran out of memory.
  OutOfMemory,
  /// Execution was terminated without an exception value.
  Uncatchable,
};

const char *error_kind_name(ErrorKind kind);

/// The type of errors returned from a `Context`.
class Error final {
public:
  enum class Category : uint8_t {
    /// An error that originates from executing script code.
    Js,
    /// The value has no `Value` mapping.
    UnsupportedType,
    /// The specified thing (function, variable, ...) does not exist.
    NonExistent,
    /// A file couldn't be read.
    Io,
    /// The engine couldn't be initialized.
    Init,
  };

  static Error js(ErrorKind kind, std::string message);
  static Error unsupported_type(std::string type_name);
  static Error non_existent(std::string name);
  static Error io(std::string path, std::string reason);
  static Error init(std::string reason);

  Category category() const { return category_; }
  bool is_js() const { return category_ == Category::Js; }

  /// Only meaningful for `Category::Js` errors.
  ErrorKind kind() const { return kind_; }

  /// The script error message, the unsupported type's name, the missing
  /// name, or the I/O or initialization failure reason.
  const std::string &message() const { return message_; }

  /// The path an I/O error refers to.
  const std::string &path() const { return path_; }

  std::string describe() const;

  bool operator==(const Error &other) const = default;

private:
  Error(Category category, ErrorKind kind, std::string message, std::string path = {})
      : category_(category), kind_(kind), message_(std::move(message)), path_(std::move(path)) {}

  Category category_;
  ErrorKind kind_;
  std::string message_;
  std::string path_;
};

template <typename T> class Result final {
  std::variant<T, Error> result;

public:
  Result(T value) : result(std::in_place_index<0>, std::move(value)) {}
  Result(Error err) : result(std::in_place_index<1>, std::move(err)) {}

  /// Explicitly construct an error.
  static Result err(Error err) { return Result(std::move(err)); }

  /// Explicitly construct a successful result.
  template <typename... Args> static Result ok(Args &&...args) {
    return Result(T(std::forward<Args>(args)...));
  }

  /// True when the result contains an error.
  bool is_err() const { return std::holds_alternative<Error>(this->result); }

  /// Return a pointer to the error value of this result, if the call failed.
  const Error *to_err() const { return std::get_if<Error>(&this->result); }

  /// Assume the call was successful, and return a reference to the result.
  ///
  /// Throws `std::bad_variant_access` if it wasn't.
  T &unwrap() { return std::get<T>(this->result); }
  const T &unwrap() const { return std::get<T>(this->result); }

  bool operator==(const Result &other) const = default;
};

} // namespace jsembed

#endif // JSEMBED_ERROR_H
