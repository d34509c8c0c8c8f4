#include <cassert>
#include <string>

#include "phase2_support.h"

namespace {

void test_parser_lines_and_terms() {
  phase2_test::expect_snapshot("+ 1 2", "+ 1 2");
  phase2_test::expect_snapshot("\n\n× 2 3\n\n- 1 ¯4\n", "× 2 3\n- 1 ¯4");
  phase2_test::expect_snapshot("* 2 3 # product", "× 2 3");
}

void test_parser_bindings() {
  phase2_test::expect_snapshot("X ← 5\nY = + 1 X", "X ← 5\nY ← + 1 X");
  phase2_test::expect_snapshot("Double ← × 2", "Double ← × 2");
}

void test_parser_arrays_and_strands() {
  phase2_test::expect_snapshot("[1 2 3]", "[1 2 3]");
  phase2_test::expect_snapshot("{1 \"ab\" @c}", "{1 \"ab\" @c}");
  phase2_test::expect_snapshot("[1 2\n3 4]", "[1 2\n3 4]");
  phase2_test::expect_snapshot("1_2_3", "1_2_3");
  phase2_test::expect_snapshot("[]", "[]");
  phase2_test::expect_snapshot("[[1 2] [3 4]]", "[[1 2] [3 4]]");
}

void test_parser_modifiers_take_following_terms() {
  phase2_test::expect_snapshot("/+ [1 2 3]", "/+ [1 2 3]");
  phase2_test::expect_snapshot("reduce add 1_2", "/+ 1_2");
  phase2_test::expect_snapshot("⊞× [1 2] [3 4]", "⊞× [1 2] [3 4]");
  phase2_test::expect_snapshot("∵(+ 1) [1 2]", "∵(+ 1) [1 2]");
  phase2_test::expect_snapshot("⊃+× 1 2", "⊃+× 1 2");
  phase2_test::expect_snapshot("?(1)(2) =1 1", "?(1)(2) = 1 1");
  phase2_test::expect_snapshot("⬚0⊟ [1] [2 3]", "⬚0⊟ [1] [2 3]");
  phase2_test::expect_snapshot("/⊂ {1 2}", "/⊂ {1 2}");
}

void test_parser_nested_modifiers() {
  phase2_test::expect_snapshot("≡/+ [1_2 3_4]", "≡/+ [1_2 3_4]");
  phase2_test::expect_snapshot("⊙⊙+ 1 2 3 4", "⊙⊙+ 1 2 3 4");
}

void test_parser_literal_rendering() {
  phase2_test::expect_snapshot("@\\s @\\n \"a\\tb\"", "@\\s @\\n \"a\\tb\"");
  phase2_test::expect_snapshot("1.5 `2 0.25", "1.5 ¯2 0.25");
}

void test_parser_errors() {
  phase2_test::expect_parse_error("(1 2", "')'");
  phase2_test::expect_parse_error("[1 2", "']'");
  phase2_test::expect_parse_error("/", "a function for /");
  phase2_test::expect_parse_error("1 )", "a term or end of line");
  phase2_test::expect_parse_error("X ←", "an expression after '←'");
  phase2_test::expect_parse_error("1_", "a strand item after '_'");
}

void test_parser_error_reports_found_token() {
  bool failed = false;
  try {
    tacit::parse("+ 1\n  ]");
  } catch (const tacit::ParseError& error) {
    failed = true;
    assert(error.found == "']'");
    assert(error.span().line == 2);
    assert(error.span().column == 3);
    assert(std::string(error.what()).find("expected") != std::string::npos);
  }
  assert(failed);
}

void test_parser_spans() {
  const auto module = tacit::parse("X ← + 1 2");
  assert(module->lines.size() == 1);
  const auto& stmt = *module->lines[0];
  assert(stmt.kind == tacit::Stmt::Kind::Binding);
  const auto& binding = static_cast<const tacit::BindingStmt&>(stmt);
  assert(binding.name == "X");
  assert(binding.name_span.start == 0);
  assert(binding.terms.size() == 3);
  assert(binding.span.end == std::string("X ← + 1 2").size());
}

}  // namespace

namespace phase2_test {

void run_parser_tests() {
  test_parser_lines_and_terms();
  test_parser_bindings();
  test_parser_arrays_and_strands();
  test_parser_modifiers_take_following_terms();
  test_parser_nested_modifiers();
  test_parser_literal_rendering();
  test_parser_errors();
  test_parser_error_reports_found_token();
  test_parser_spans();
}

}  // namespace phase2_test
