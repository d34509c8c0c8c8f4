#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tacit/ast.h"

namespace tacit {

struct Token {
  enum class Type {
    Number,
    Char,
    String,
    Identifier,
    Primitive,
    Modifier,
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Underscore,
    Arrow,
    Newline,
    End,
  };

  Type type = Type::End;
  std::string text;
  double number = 0.0;
  char32_t character = 0;
  std::u32string string;
  Primitive primitive = Primitive::Identity;
  Span span;
};

const char* token_type_name(Token::Type type);
std::string describe_token(const Token& token);

std::vector<Token> tokenize(std::string_view source);

class Parser {
 public:
  explicit Parser(std::vector<Token> tokens);

  std::unique_ptr<Module> parse_module();

 private:
  std::vector<Token> tokens;
  std::size_t pos = 0;

  const Token& peek() const;
  const Token& advance();
  bool at(Token::Type type) const;
  void skip_newlines();
  const Token& expect(Token::Type type, const char* what);

  StmtList parse_lines(Token::Type closing);
  StmtPtr parse_line();
  TermList parse_terms();
  bool starts_term() const;
  TermPtr parse_term();
  TermPtr parse_primary();
  TermPtr parse_modifier();
  TermPtr parse_group(Token::Type closing, Term::Kind kind, bool boxed);

  [[noreturn]] void fail(const std::string& expected) const;
};

std::unique_ptr<Module> parse(std::string_view source);

}  // namespace tacit
