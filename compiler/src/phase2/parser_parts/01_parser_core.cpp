#include <utility>

#include "tacit/parser.h"

namespace tacit {

namespace {

Span join_spans(const Span& first, const Span& last) {
  Span out = first;
  out.end = last.end;
  return out;
}

}  // namespace

const char* token_type_name(Token::Type type) {
  switch (type) {
    case Token::Type::Number:
      return "number";
    case Token::Type::Char:
      return "character";
    case Token::Type::String:
      return "string";
    case Token::Type::Identifier:
      return "identifier";
    case Token::Type::Primitive:
      return "primitive";
    case Token::Type::Modifier:
      return "modifier";
    case Token::Type::LParen:
      return "'('";
    case Token::Type::RParen:
      return "')'";
    case Token::Type::LBracket:
      return "'['";
    case Token::Type::RBracket:
      return "']'";
    case Token::Type::LBrace:
      return "'{'";
    case Token::Type::RBrace:
      return "'}'";
    case Token::Type::Underscore:
      return "'_'";
    case Token::Type::Arrow:
      return "'←'";
    case Token::Type::Newline:
      return "end of line";
    case Token::Type::End:
      return "end of input";
  }
  return "token";
}

std::string describe_token(const Token& token) {
  switch (token.type) {
    case Token::Type::Number:
    case Token::Type::Char:
    case Token::Type::String:
    case Token::Type::Identifier:
    case Token::Type::Primitive:
    case Token::Type::Modifier:
      return std::string(token_type_name(token.type)) + " '" + token.text + "'";
    default:
      return token_type_name(token.type);
  }
}

Parser::Parser(std::vector<Token> token_list) : tokens(std::move(token_list)) {
  if (tokens.empty() || tokens.back().type != Token::Type::End) {
    Token end;
    end.type = Token::Type::End;
    if (!tokens.empty()) {
      end.span = tokens.back().span;
      end.span.start = end.span.end;
    }
    tokens.push_back(std::move(end));
  }
}

std::unique_ptr<Module> Parser::parse_module() {
  pos = 0;
  auto module = std::make_unique<Module>();
  module->lines = parse_lines(Token::Type::End);
  if (!at(Token::Type::End)) {
    fail("end of input");
  }
  return module;
}

const Token& Parser::peek() const {
  return tokens[pos];
}

const Token& Parser::advance() {
  const Token& token = tokens[pos];
  if (pos + 1 < tokens.size()) {
    ++pos;
  }
  return token;
}

bool Parser::at(Token::Type type) const {
  return peek().type == type;
}

void Parser::skip_newlines() {
  while (at(Token::Type::Newline)) {
    advance();
  }
}

const Token& Parser::expect(Token::Type type, const char* what) {
  if (!at(type)) {
    fail(what);
  }
  return advance();
}

void Parser::fail(const std::string& expected) const {
  throw ParseError(expected, describe_token(peek()), peek().span);
}

std::unique_ptr<Module> parse(std::string_view source) {
  Parser parser(tokenize(source));
  return parser.parse_module();
}
