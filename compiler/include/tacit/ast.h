#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tacit/diagnostics.h"
#include "tacit/primitives.h"

namespace tacit {

struct Term;
struct Stmt;
struct Module;

using TermPtr = std::unique_ptr<Term>;
using TermList = std::vector<TermPtr>;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

struct Node {
  virtual ~Node() = default;

  Span span;
};

struct Term : Node {
  enum class Kind {
    Number,
    Char,
    String,
    Array,
    Strand,
    Identifier,
    Primitive,
    Function,
    Modifier,
  };

  Kind kind;
  explicit Term(Kind kind) : kind(kind) {}
};

struct NumberTerm : Term {
  double value;
  std::string raw_text;

  NumberTerm(double v, std::string raw) : Term(Kind::Number), value(v), raw_text(std::move(raw)) {}
};

struct CharTerm : Term {
  char32_t value;

  explicit CharTerm(char32_t v) : Term(Kind::Char), value(v) {}
};

struct StringTerm : Term {
  std::u32string value;

  explicit StringTerm(std::u32string v) : Term(Kind::String), value(std::move(v)) {}
};

// `[ ... ]` or `{ ... }`: the values produced by the lines become rows.
struct ArrayTerm : Term {
  StmtList lines;
  bool boxed;

  ArrayTerm(StmtList body, bool is_boxed)
      : Term(Kind::Array), lines(std::move(body)), boxed(is_boxed) {}
};

// `a_b_c`, items in written order.
struct StrandTerm : Term {
  TermList items;

  explicit StrandTerm(TermList values) : Term(Kind::Strand), items(std::move(values)) {}
};

struct IdentifierTerm : Term {
  std::string name;

  explicit IdentifierTerm(std::string value) : Term(Kind::Identifier), name(std::move(value)) {}
};

struct PrimitiveTerm : Term {
  Primitive primitive;

  explicit PrimitiveTerm(Primitive p) : Term(Kind::Primitive), primitive(p) {}
};

struct FunctionTerm : Term {
  StmtList lines;

  explicit FunctionTerm(StmtList body) : Term(Kind::Function), lines(std::move(body)) {}
};

struct ModifierTerm : Term {
  Primitive modifier;
  TermList operands;

  ModifierTerm(Primitive p, TermList args)
      : Term(Kind::Modifier), modifier(p), operands(std::move(args)) {}
};

struct Stmt : Node {
  enum class Kind {
    Line,
    Binding,
  };

  Kind kind;
  explicit Stmt(Kind kind) : kind(kind) {}
};

struct LineStmt : Stmt {
  TermList terms;

  explicit LineStmt(TermList values) : Stmt(Kind::Line), terms(std::move(values)) {}
};

struct BindingStmt : Stmt {
  std::string name;
  Span name_span;
  TermList terms;

  BindingStmt(std::string target, TermList values)
      : Stmt(Kind::Binding), name(std::move(target)), terms(std::move(values)) {}
};

struct Module {
  StmtList lines;
};

std::string to_source(const Module& module);
std::string to_source(const Term& term);

}  // namespace tacit
