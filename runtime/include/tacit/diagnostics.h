#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "tacit/shape.h"

namespace tacit {

struct Span {
  std::size_t start = 0;
  std::size_t end = 0;
  std::size_t line = 1;
  std::size_t column = 1;
};

// Base of every error the core raises. Static errors always carry a span;
// runtime errors get one attached by the interpreter while propagating.
class Diagnostic : public std::runtime_error {
 public:
  Diagnostic(const std::string& message, Span span, bool has_span = true);

  const Span& span() const { return span_; }
  bool has_span() const { return has_span_; }
  const std::string& message() const { return message_; }
  void attach_span(const Span& span);

 private:
  std::string message_;
  Span span_;
  bool has_span_ = true;
};

class LexError : public Diagnostic {
 public:
  LexError(const std::string& reason, Span span);

  std::string reason;
};

class ParseError : public Diagnostic {
 public:
  ParseError(std::string expected, std::string found, Span span);

  std::string expected;
  std::string found;
};

enum class CompileErrorKind {
  UnboundName,
  ArityMismatch,
};

class CompileError : public Diagnostic {
 public:
  CompileError(CompileErrorKind kind, const std::string& message, Span span);

  CompileErrorKind kind;
};

enum class RuntimeErrorKind {
  ShapeMismatch,
  TypeMismatch,
  StackUnderflow,
  IndexOutOfBounds,
  DivisionByZero,
  Interrupted,
};

const char* runtime_error_kind_name(RuntimeErrorKind kind);

struct OperandInfo {
  ElementKind kind = ElementKind::Number;
  Shape shape;
};

class RuntimeError : public Diagnostic {
 public:
  RuntimeError(RuntimeErrorKind kind, const std::string& message,
               std::vector<OperandInfo> operands = {});

  RuntimeErrorKind kind;
  std::vector<OperandInfo> operands;
};

}  // namespace tacit
