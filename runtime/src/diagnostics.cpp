#include "tacit/diagnostics.h"

#include <utility>

namespace tacit {

Diagnostic::Diagnostic(const std::string& message, Span span, bool has_span)
    : std::runtime_error(message), message_(message), span_(span), has_span_(has_span) {}

void Diagnostic::attach_span(const Span& span) {
  span_ = span;
  has_span_ = true;
}

LexError::LexError(const std::string& reason, Span span)
    : Diagnostic(reason, span), reason(reason) {}

ParseError::ParseError(std::string expected, std::string found, Span span)
    : Diagnostic("expected " + expected + ", found " + found, span),
      expected(std::move(expected)),
      found(std::move(found)) {}

CompileError::CompileError(CompileErrorKind kind, const std::string& message, Span span)
    : Diagnostic(message, span), kind(kind) {}

const char* runtime_error_kind_name(RuntimeErrorKind kind) {
  switch (kind) {
    case RuntimeErrorKind::ShapeMismatch:
      return "ShapeMismatch";
    case RuntimeErrorKind::TypeMismatch:
      return "TypeMismatch";
    case RuntimeErrorKind::StackUnderflow:
      return "StackUnderflow";
    case RuntimeErrorKind::IndexOutOfBounds:
      return "IndexOutOfBounds";
    case RuntimeErrorKind::DivisionByZero:
      return "DivisionByZero";
    case RuntimeErrorKind::Interrupted:
      return "Interrupted";
  }
  return "RuntimeError";
}

RuntimeError::RuntimeError(RuntimeErrorKind kind, const std::string& message,
                           std::vector<OperandInfo> operands)
    : Diagnostic(message, Span{}, false), kind(kind), operands(std::move(operands)) {}

}  // namespace tacit
