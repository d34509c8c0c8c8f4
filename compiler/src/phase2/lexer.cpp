#include "lexer.h"

#include <cstdlib>
#include <string>

#include "tacit/utf8.h"

namespace tacit {

namespace {

bool is_digit(char32_t ch) {
  return ch >= U'0' && ch <= U'9';
}

bool is_letter(char32_t ch) {
  return (ch >= U'a' && ch <= U'z') || (ch >= U'A' && ch <= U'Z');
}

bool is_lowercase_word(const std::string& word) {
  for (const char ch : word) {
    if (ch < 'a' || ch > 'z') {
      return false;
    }
  }
  return !word.empty();
}

std::string code_point_text(char32_t ch) {
  std::string out;
  append_utf8(out, ch);
  return out;
}

}  // namespace

Lexer::Lexer(std::string_view text) : source(text) {}

char32_t Lexer::peek_code_point(std::size_t ahead) const {
  std::size_t cursor = offset;
  char32_t ch = 0;
  for (std::size_t i = 0; i <= ahead; ++i) {
    const auto used = decode_utf8(source, cursor, ch);
    if (used == 0) {
      return 0;
    }
    cursor += used;
  }
  return ch;
}

char32_t Lexer::advance() {
  char32_t ch = 0;
  const auto used = decode_utf8(source, offset, ch);
  if (used == 0) {
    throw LexError("invalid UTF-8 in source", Span{offset, offset + 1, line, column});
  }
  offset += used;
  if (ch == U'\n') {
    ++line;
    column = 1;
  } else {
    ++column;
  }
  return ch;
}

Span Lexer::span_from(std::size_t start, std::size_t start_line, std::size_t start_column) const {
  return Span{start, offset, start_line, start_column};
}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (!at_end()) {
    const auto start = offset;
    const auto start_line = line;
    const auto start_column = column;
    const auto ch = peek_code_point();

    if (ch == U' ' || ch == U'\t' || ch == U'\r') {
      advance();
      continue;
    }
    if (ch == U'#') {
      while (!at_end() && peek_code_point() != U'\n') {
        advance();
      }
      continue;
    }
    if (ch == U'\n') {
      advance();
      Token token;
      token.type = Token::Type::Newline;
      token.text = "\n";
      token.span = span_from(start, start_line, start_column);
      tokens.push_back(std::move(token));
      continue;
    }
    if (is_digit(ch) || ((ch == U'¯' || ch == U'`') && is_digit(peek_code_point(1)))) {
      tokens.push_back(lex_number(start, start_line, start_column));
      continue;
    }
    if (ch == U'@') {
      tokens.push_back(lex_char(start, start_line, start_column));
      continue;
    }
    if (ch == U'"') {
      tokens.push_back(lex_string(start, start_line, start_column));
      continue;
    }
    if (is_letter(ch)) {
      tokens.push_back(lex_word(start, start_line, start_column));
      continue;
    }

    Token::Type bracket = Token::Type::End;
    switch (ch) {
      case U'(':
        bracket = Token::Type::LParen;
        break;
      case U')':
        bracket = Token::Type::RParen;
        break;
      case U'[':
        bracket = Token::Type::LBracket;
        break;
      case U']':
        bracket = Token::Type::RBracket;
        break;
      case U'{':
        bracket = Token::Type::LBrace;
        break;
      case U'}':
        bracket = Token::Type::RBrace;
        break;
      case U'_':
        bracket = Token::Type::Underscore;
        break;
      case U'←':
        bracket = Token::Type::Arrow;
        break;
      default:
        break;
    }
    if (bracket != Token::Type::End) {
      advance();
      Token token;
      token.type = bracket;
      token.text = std::string(source.substr(start, offset - start));
      token.span = span_from(start, start_line, start_column);
      tokens.push_back(std::move(token));
      continue;
    }

    // Two-character ASCII spellings first, then single glyphs.
    if (ch < 0x80 && peek_code_point(1) != 0) {
      std::string pair;
      pair.push_back(static_cast<char>(ch));
      const auto next = peek_code_point(1);
      if (next < 0x80) {
        pair.push_back(static_cast<char>(next));
        if (const auto primitive = primitive_by_ascii(pair)) {
          advance();
          advance();
          tokens.push_back(primitive_token(*primitive, start, start_line, start_column));
          continue;
        }
      }
    }
    if (ch < 0x80) {
      if (const auto primitive = primitive_by_ascii(std::string(1, static_cast<char>(ch)))) {
        advance();
        tokens.push_back(primitive_token(*primitive, start, start_line, start_column));
        continue;
      }
    }
    if (const auto primitive = primitive_by_glyph(ch)) {
      advance();
      tokens.push_back(primitive_token(*primitive, start, start_line, start_column));
      continue;
    }
    advance();
    throw LexError("unrecognised character '" + code_point_text(ch) + "'",
                   span_from(start, start_line, start_column));
  }

  Token end;
  end.type = Token::Type::End;
  end.span = Span{offset, offset, line, column};
  tokens.push_back(std::move(end));
  return tokens;
}

Token Lexer::lex_number(std::size_t start, std::size_t start_line, std::size_t start_column) {
  std::string text;
  if (!is_digit(peek_code_point())) {
    advance();
    text.push_back('-');
  }
  const auto malformed = [&](const char* reason) {
    throw LexError(std::string("malformed number: ") + reason,
                   span_from(start, start_line, start_column));
  };
  while (is_digit(peek_code_point())) {
    text.push_back(static_cast<char>(advance()));
  }
  if (peek_code_point() == U'.') {
    advance();
    text.push_back('.');
    if (!is_digit(peek_code_point())) {
      malformed("expected digits after the decimal point");
    }
    while (is_digit(peek_code_point())) {
      text.push_back(static_cast<char>(advance()));
    }
    if (peek_code_point() == U'.' && is_digit(peek_code_point(1))) {
      advance();
      malformed("more than one decimal point");
    }
  }
  if (peek_code_point() == U'e' || peek_code_point() == U'E') {
    advance();
    text.push_back('e');
    if (peek_code_point() == U'+' || peek_code_point() == U'-' || peek_code_point() == U'¯') {
      const auto sign = advance();
      text.push_back(sign == U'+' ? '+' : '-');
    }
    if (!is_digit(peek_code_point())) {
      malformed("expected digits in the exponent");
    }
    while (is_digit(peek_code_point())) {
      text.push_back(static_cast<char>(advance()));
    }
  }

  Token token;
  token.type = Token::Type::Number;
  token.text = std::string(source.substr(start, offset - start));
  token.number = std::strtod(text.c_str(), nullptr);
  token.span = span_from(start, start_line, start_column);
  return token;
}

char32_t Lexer::lex_escape(const char* literal_kind) {
  if (at_end()) {
    throw LexError(std::string("unterminated ") + literal_kind, Span{offset, offset, line, column});
  }
  const auto escape_start = offset;
  const auto escape_line = line;
  const auto escape_column = column;
  const auto escape = advance();
  switch (escape) {
    case U'n':
      return U'\n';
    case U't':
      return U'\t';
    case U'r':
      return U'\r';
    case U'0':
      return U'\0';
    case U's':
      return U' ';
    case U'\\':
      return U'\\';
    case U'"':
      return U'"';
    case U'\'':
      return U'\'';
    default:
      throw LexError("unknown escape sequence '\\" + code_point_text(escape) + "'",
                     span_from(escape_start - 1, escape_line, escape_column - 1));
  }
}

Token Lexer::lex_char(std::size_t start, std::size_t start_line, std::size_t start_column) {
  advance();
  if (at_end() || peek_code_point() == U'\n') {
    throw LexError("unterminated character literal", span_from(start, start_line, start_column));
  }
  char32_t value = advance();
  if (value == U'\\') {
    value = lex_escape("character literal");
  }
  Token token;
  token.type = Token::Type::Char;
  token.character = value;
  token.text = std::string(source.substr(start, offset - start));
  token.span = span_from(start, start_line, start_column);
  return token;
}

Token Lexer::lex_string(std::size_t start, std::size_t start_line, std::size_t start_column) {
  advance();
  std::u32string value;
  while (true) {
    if (at_end() || peek_code_point() == U'\n') {
      throw LexError("unterminated string literal", span_from(start, start_line, start_column));
    }
    auto ch = advance();
    if (ch == U'"') {
      break;
    }
    if (ch == U'\\') {
      ch = lex_escape("string literal");
    }
    value.push_back(ch);
  }
  Token token;
  token.type = Token::Type::String;
  token.string = std::move(value);
  token.text = std::string(source.substr(start, offset - start));
  token.span = span_from(start, start_line, start_column);
  return token;
}

Token Lexer::lex_word(std::size_t start, std::size_t start_line, std::size_t start_column) {
  std::string word;
  while (is_letter(peek_code_point()) || is_digit(peek_code_point())) {
    word.push_back(static_cast<char>(advance()));
  }
  if (is_lowercase_word(word)) {
    if (const auto primitive = primitive_by_name(word)) {
      return primitive_token(*primitive, start, start_line, start_column);
    }
  }
  Token token;
  token.type = Token::Type::Identifier;
  token.text = word;
  token.span = span_from(start, start_line, start_column);
  return token;
}

Token Lexer::primitive_token(Primitive primitive, std::size_t start, std::size_t start_line,
                             std::size_t start_column) {
  Token token;
  token.type = is_modifier(primitive) ? Token::Type::Modifier : Token::Type::Primitive;
  token.primitive = primitive;
  token.text = std::string(source.substr(start, offset - start));
  token.span = span_from(start, start_line, start_column);
  return token;
}

std::vector<Token> tokenize(std::string_view source) {
  Lexer lexer(source);
  return lexer.tokenize();
}

}  // namespace tacit
