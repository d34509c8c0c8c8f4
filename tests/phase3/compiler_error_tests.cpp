#include <cassert>
#include <string>

#include "phase3_support.h"

namespace {

using Kind = tacit::CompileErrorKind;

void test_unbound_names() {
  phase3_test::expect_compile_error("Foo", Kind::UnboundName);
  phase3_test::expect_compile_error("+ 1 Foo", Kind::UnboundName);
  phase3_test::expect_compile_error("F ← + 1 F", Kind::UnboundName);
  phase3_test::expect_compile_error("(X ← 1\nX)\nX", Kind::UnboundName);
  phase3_test::expect_compile_error("X\nX ← 1", Kind::UnboundName);
}

void test_unbound_name_span() {
  bool failed = false;
  try {
    tacit::compile("+ 1 Foo");
  } catch (const tacit::CompileError& error) {
    failed = true;
    assert(error.span().start == 4);
    assert(error.span().end == 7);
    assert(std::string(error.what()).find("Foo") != std::string::npos);
  }
  assert(failed);
}

void test_modifier_arity_mismatches() {
  phase3_test::expect_compile_error("/.", Kind::ArityMismatch);
  phase3_test::expect_compile_error("/¯", Kind::ArityMismatch);
  phase3_test::expect_compile_error("⊞(+ 1)", Kind::ArityMismatch);
  phase3_test::expect_compile_error("∵;", Kind::ArityMismatch);
  phase3_test::expect_compile_error("∵1", Kind::ArityMismatch);
  phase3_test::expect_compile_error("⊕+", Kind::ArityMismatch);
  phase3_test::expect_compile_error("⬚+⊟", Kind::ArityMismatch);
  phase3_test::expect_compile_error("⍣⊔;", Kind::ArityMismatch);
  phase3_test::expect_compile_error("∩(⍥. 2)", Kind::ArityMismatch);
  phase3_test::expect_compile_error("⊃(⍥. 2)+", Kind::ArityMismatch);
}

void test_if_branches_must_agree() {
  phase3_test::expect_compile_error("?(1)(2 3) 1", Kind::ArityMismatch);
  phase3_test::expect_compile_error("?(+)(¯) 1", Kind::ArityMismatch);
}

void test_arity_error_names_modifier() {
  bool failed = false;
  try {
    tacit::compile("1 /. [1 2]");
  } catch (const tacit::CompileError& error) {
    failed = true;
    assert(error.kind == Kind::ArityMismatch);
    assert(error.span().start == 2);
    assert(std::string(error.what()).find("/") != std::string::npos);
  }
  assert(failed);
}

void test_bindings_never_raise_arity_errors() {
  phase3_test::expect_dynamic("F ← ⍥. 2\nF 1");
  phase3_test::expect_signature("F ← .\nF 1", 0, 2);
}

}  // namespace

namespace phase3_test {

void run_compiler_error_tests() {
  test_unbound_names();
  test_unbound_name_span();
  test_modifier_arity_mismatches();
  test_if_branches_must_agree();
  test_arity_error_names_modifier();
  test_bindings_never_raise_arity_errors();
}

}  // namespace phase3_test
