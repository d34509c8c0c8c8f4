#include <cassert>
#include <string>

#include "phase2_support.h"

namespace {

using Type = tacit::Token::Type;

void test_lexer_primitives_and_literals() {
  phase2_test::expect_token_types("+ 1 2", {Type::Primitive, Type::Number, Type::Number});
  phase2_test::expect_token_types("/+ [1 2]", {Type::Modifier, Type::Primitive, Type::LBracket,
                                               Type::Number, Type::Number, Type::RBracket});
  phase2_test::expect_token_types("X ← 5", {Type::Identifier, Type::Arrow, Type::Number});
  phase2_test::expect_token_types("1_2_3", {Type::Number, Type::Underscore, Type::Number,
                                            Type::Underscore, Type::Number});
  phase2_test::expect_token_types("{@a \"bc\"}",
                                  {Type::LBrace, Type::Char, Type::String, Type::RBrace});
}

void test_lexer_newlines_and_comments() {
  phase2_test::expect_token_types("1 # first\n2", {Type::Number, Type::Newline, Type::Number});
  phase2_test::expect_token_types("# only a comment", {});
  phase2_test::expect_token_types("\t1  \r\n", {Type::Number, Type::Newline});
}

void test_lexer_numbers() {
  const auto tokens = phase2_test::lex("42 1.5 ¯3 `4 1.5e3 2e¯2");
  assert(tokens.size() == 7);
  assert(tokens[0].number == 42.0);
  assert(tokens[1].number == 1.5);
  assert(tokens[2].number == -3.0);
  assert(tokens[3].number == -4.0);
  assert(tokens[4].number == 1500.0);
  assert(tokens[5].number == 0.02);
  assert(tokens[2].text == "¯3");
}

void test_lexer_negate_without_digit_is_primitive() {
  const auto tokens = phase2_test::lex("¯ 3");
  assert(tokens.size() == 3);
  assert(tokens[0].type == Type::Primitive);
  assert(tokens[0].primitive == tacit::Primitive::Negate);
  assert(tokens[1].number == 3.0);
}

void test_lexer_words() {
  const auto tokens = phase2_test::lex("reduce add Sum sum cos x2");
  assert(tokens[0].type == Type::Modifier);
  assert(tokens[0].primitive == tacit::Primitive::Reduce);
  assert(tokens[1].type == Type::Primitive);
  assert(tokens[1].primitive == tacit::Primitive::Add);
  assert(tokens[2].type == Type::Identifier);
  assert(tokens[2].text == "Sum");
  assert(tokens[3].type == Type::Identifier);
  assert(tokens[4].type == Type::Primitive);
  assert(tokens[4].primitive == tacit::Primitive::Cosine);
  assert(tokens[5].type == Type::Identifier);
  assert(tokens[5].text == "x2");
}

void test_lexer_ascii_spellings() {
  const auto tokens = phase2_test::lex("!= <= >= < * % : `");
  assert(tokens[0].primitive == tacit::Primitive::NotEqual);
  assert(tokens[1].primitive == tacit::Primitive::LessOrEqual);
  assert(tokens[2].primitive == tacit::Primitive::GreaterOrEqual);
  assert(tokens[3].primitive == tacit::Primitive::Less);
  assert(tokens[4].primitive == tacit::Primitive::Multiply);
  assert(tokens[5].primitive == tacit::Primitive::Divide);
  assert(tokens[6].primitive == tacit::Primitive::Flip);
  assert(tokens[7].primitive == tacit::Primitive::Negate);
}

void test_lexer_glyphs() {
  const auto tokens = phase2_test::lex("⊞× ⍣∘∘ ⬚0⊟ ≠ ⇡");
  assert(tokens[0].type == Type::Modifier);
  assert(tokens[0].primitive == tacit::Primitive::Table);
  assert(tokens[1].primitive == tacit::Primitive::Multiply);
  assert(tokens[2].primitive == tacit::Primitive::Try);
  assert(tokens[3].primitive == tacit::Primitive::Identity);
  assert(tokens[5].primitive == tacit::Primitive::Fill);
  assert(tokens[6].type == Type::Number);
  assert(tokens[7].primitive == tacit::Primitive::Couple);
  assert(tokens[8].primitive == tacit::Primitive::NotEqual);
  assert(tokens[9].primitive == tacit::Primitive::Range);
}

void test_lexer_char_and_string_escapes() {
  const auto tokens = phase2_test::lex("@a @\\n @\\s \"hi\\tthere\\\"\"");
  assert(tokens[0].character == U'a');
  assert(tokens[1].character == U'\n');
  assert(tokens[2].character == U' ');
  assert(tokens[3].type == Type::String);
  assert(tokens[3].string == U"hi\tthere\"");
}

void test_lexer_spans() {
  const auto tokens = phase2_test::lex("+ 1\n  Xy");
  const auto& name = tokens[3];
  assert(name.type == Type::Identifier);
  assert(name.span.start == 6);
  assert(name.span.end == 8);
  assert(name.span.line == 2);
  assert(name.span.column == 3);
}

void test_lexer_errors() {
  phase2_test::expect_lex_error("1.", "malformed number");
  phase2_test::expect_lex_error("1e", "malformed number");
  phase2_test::expect_lex_error("1.2.3", "more than one decimal point");
  phase2_test::expect_lex_error("\"abc", "unterminated string literal");
  phase2_test::expect_lex_error("@", "unterminated character literal");
  phase2_test::expect_lex_error("\"\\q\"", "unknown escape sequence");
  phase2_test::expect_lex_error("1 $ 2", "unrecognised character '$'");
}

void test_lexer_error_span() {
  bool failed = false;
  try {
    phase2_test::lex("1 2\n  $");
  } catch (const tacit::LexError& error) {
    failed = true;
    assert(error.span().line == 2);
    assert(error.span().column == 3);
    assert(error.span().start == 6);
  }
  assert(failed);
}

}  // namespace

namespace phase2_test {

void run_lexer_tests() {
  test_lexer_primitives_and_literals();
  test_lexer_newlines_and_comments();
  test_lexer_numbers();
  test_lexer_negate_without_digit_is_primitive();
  test_lexer_words();
  test_lexer_ascii_spellings();
  test_lexer_glyphs();
  test_lexer_char_and_string_escapes();
  test_lexer_spans();
  test_lexer_errors();
  test_lexer_error_span();
}

}  // namespace phase2_test
