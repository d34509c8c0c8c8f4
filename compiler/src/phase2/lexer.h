#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "tacit/parser.h"

namespace tacit {

class Lexer {
 public:
  explicit Lexer(std::string_view text);

  std::vector<Token> tokenize();

 private:
  std::string_view source;
  std::size_t offset = 0;
  std::size_t line = 1;
  std::size_t column = 1;

  bool at_end() const { return offset >= source.size(); }
  char32_t peek_code_point(std::size_t ahead = 0) const;
  char32_t advance();
  Span span_from(std::size_t start, std::size_t start_line, std::size_t start_column) const;

  Token lex_number(std::size_t start, std::size_t start_line, std::size_t start_column);
  char32_t lex_escape(const char* literal_kind);
  Token lex_char(std::size_t start, std::size_t start_line, std::size_t start_column);
  Token lex_string(std::size_t start, std::size_t start_line, std::size_t start_column);
  Token lex_word(std::size_t start, std::size_t start_line, std::size_t start_column);
  Token primitive_token(Primitive primitive, std::size_t start, std::size_t start_line,
                        std::size_t start_column);
};

}  // namespace tacit
