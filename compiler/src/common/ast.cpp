#include <string>

#include "tacit/ast.h"
#include "tacit/utf8.h"

namespace tacit {

namespace {

bool is_word_char(char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

// Appends without a separator unless two words or numbers would merge.
void append_tight(std::string& out, const std::string& text) {
  if (!out.empty() && !text.empty() && is_word_char(out.back()) && is_word_char(text.front())) {
    out.push_back(' ');
  }
  out += text;
}

void append_escaped(std::string& out, char32_t ch, bool in_string) {
  switch (ch) {
    case U'\n':
      out += "\\n";
      return;
    case U'\t':
      out += "\\t";
      return;
    case U'\r':
      out += "\\r";
      return;
    case U'\0':
      out += "\\0";
      return;
    case U'\\':
      out += "\\\\";
      return;
    case U'"':
      out += in_string ? "\\\"" : "\"";
      return;
    case U' ':
      out += in_string ? " " : "\\s";
      return;
    default:
      append_utf8(out, ch);
      return;
  }
}

std::string source_of_lines(const StmtList& lines);

std::string source_of_terms(const TermList& terms) {
  std::string out;
  for (const auto& term : terms) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += to_source(*term);
  }
  return out;
}

std::string source_of_stmt(const Stmt& stmt) {
  if (stmt.kind == Stmt::Kind::Binding) {
    const auto& binding = static_cast<const BindingStmt&>(stmt);
    return binding.name + " ← " + source_of_terms(binding.terms);
  }
  return source_of_terms(static_cast<const LineStmt&>(stmt).terms);
}

std::string source_of_lines(const StmtList& lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out += source_of_stmt(*lines[i]);
  }
  return out;
}

}  // namespace

std::string to_source(const Term& term) {
  switch (term.kind) {
    case Term::Kind::Number:
      return number_to_string(static_cast<const NumberTerm&>(term).value);
    case Term::Kind::Char: {
      std::string out = "@";
      append_escaped(out, static_cast<const CharTerm&>(term).value, false);
      return out;
    }
    case Term::Kind::String: {
      std::string out = "\"";
      for (const auto ch : static_cast<const StringTerm&>(term).value) {
        append_escaped(out, ch, true);
      }
      out.push_back('"');
      return out;
    }
    case Term::Kind::Array: {
      const auto& array = static_cast<const ArrayTerm&>(term);
      const auto body = source_of_lines(array.lines);
      return array.boxed ? "{" + body + "}" : "[" + body + "]";
    }
    case Term::Kind::Strand: {
      std::string out;
      for (const auto& item : static_cast<const StrandTerm&>(term).items) {
        if (!out.empty()) {
          out.push_back('_');
        }
        out += to_source(*item);
      }
      return out;
    }
    case Term::Kind::Identifier:
      return static_cast<const IdentifierTerm&>(term).name;
    case Term::Kind::Primitive:
      return primitive_display(static_cast<const PrimitiveTerm&>(term).primitive);
    case Term::Kind::Function:
      return "(" + source_of_lines(static_cast<const FunctionTerm&>(term).lines) + ")";
    case Term::Kind::Modifier: {
      const auto& modifier = static_cast<const ModifierTerm&>(term);
      std::string out = primitive_display(modifier.modifier);
      for (const auto& operand : modifier.operands) {
        append_tight(out, to_source(*operand));
      }
      return out;
    }
  }
  return "";
}

std::string to_source(const Module& module) {
  return source_of_lines(module.lines);
}

}  // namespace tacit
