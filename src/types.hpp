#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Point/Bounds/Direction/Error).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <optional>
#include <string>
#include <utility>
#include <variant>

enum class Mode { Normal, Insert, Command };

// Sibling side relative to a node in its parent's child list.
enum class Dir { Above, Below };

enum class Direction { Left, Right, Up, Down };

struct Point {
  int row = 0;
  int col = 0;
  bool operator==(const Point&) const = default;
};

struct Bounds { int rows = 0; int cols = 0; };

struct Viewport { int top_line = 0; };

enum class ErrorKind { StructuralLimit, UnknownIdentity, OutOfBounds, PredicateUnsatisfied };

struct Error {
  ErrorKind kind;
  std::string message;
};

inline Error make_error(ErrorKind kind, std::string message) { return Error{kind, std::move(message)}; }

// Value or Error. Failed outcomes carry the reason; the value is untouched by the caller.
template <typename T>
class Outcome {
public:
  Outcome(T value) : v_(std::move(value)) {}
  Outcome(Error err) : v_(std::move(err)) {}

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }
  const T& value() const { return std::get<T>(v_); }
  T& value() { return std::get<T>(v_); }
  const Error& error() const { return std::get<Error>(v_); }

private:
  std::variant<T, Error> v_;
};
