#include <cassert>

#include "phase3_support.h"

namespace {

void test_signature_of_plain_lines() {
  phase3_test::expect_signature("+ 1 2", 0, 1);
  phase3_test::expect_signature("+", 2, 1);
  phase3_test::expect_signature("+ 1", 1, 1);
  phase3_test::expect_signature(".", 1, 2);
  phase3_test::expect_signature(";", 1, 0);
  phase3_test::expect_signature(", 1", 1, 3);
  phase3_test::expect_signature("1\n2", 0, 2);
  phase3_test::expect_signature("+ 1 2\n×", 1, 1);
}

void test_signature_of_arrays() {
  phase3_test::expect_signature("[1 2 3]", 0, 1);
  phase3_test::expect_signature("[+]", 2, 1);
  phase3_test::expect_signature("[. 1]", 0, 1);
  phase3_test::expect_signature("1_2_3", 0, 1);
  phase3_test::expect_signature("{1 \"a\"}", 0, 1);
}

void test_signature_of_modifiers() {
  phase3_test::expect_signature("/+", 1, 1);
  phase3_test::expect_signature("\\+", 1, 1);
  phase3_test::expect_signature("∧+", 2, 1);
  phase3_test::expect_signature("⊞×", 2, 1);
  phase3_test::expect_signature("∺+", 2, 1);
  phase3_test::expect_signature("∵+", 2, 1);
  phase3_test::expect_signature("∵¯", 1, 1);
  phase3_test::expect_signature("≡⇌", 1, 1);
  phase3_test::expect_signature("⍥(+ 1)", 2, 1);
  phase3_test::expect_signature("⊕⧻", 2, 1);
  phase3_test::expect_signature("⊜⧻", 2, 1);
  phase3_test::expect_signature("⊙+", 3, 2);
  phase3_test::expect_signature("∩⇡", 2, 2);
  phase3_test::expect_signature("⊃+×", 2, 2);
  phase3_test::expect_signature("⊃¯+", 2, 2);
  phase3_test::expect_signature("⍣⊔⧻", 1, 1);
  phase3_test::expect_signature("⍣+(⧻ ;)", 2, 1);
  phase3_test::expect_signature("⬚0⊟", 2, 1);
  phase3_test::expect_signature("?(+ 1)(- 1)", 2, 1);
}

void test_signature_of_dynamic_code() {
  phase3_test::expect_dynamic("⍥. 3 1");
  phase3_test::expect_dynamic("[⍥. 2 1]");
  phase3_test::expect_dynamic("⊙(⍥. 2) 1 1");
}

void test_signature_with_bindings() {
  phase3_test::expect_signature("X ← 5", 0, 0);
  phase3_test::expect_signature("X ← 5\nX", 0, 1);
  phase3_test::expect_signature("F ← + 1\nF 2", 0, 1);
  phase3_test::expect_signature("F ← + 1\nF", 1, 1);
  phase3_test::expect_signature("F ← (× 2)\nG ← F F\nG 3", 0, 1);
  phase3_test::expect_signature("(X ← 1\n+ X)", 1, 1);
}

void test_function_table() {
  const auto program = tacit::compile("F ← (+ 1)\nF 2");
  assert(program.functions.size() == 1);
  assert(program.functions[0].name == "F");
  assert(program.functions[0].signature);
  assert(program.functions[0].signature->args == 1);
  assert(!program.functions[0].primitive);
  assert(program.names.size() == 1);
  assert(program.names[0] == "F");

  const auto reduced = tacit::compile("/+ [1 2 3]");
  assert(reduced.functions.size() == 1);
  assert(reduced.functions[0].primitive);
  assert(*reduced.functions[0].primitive == tacit::Primitive::Add);
}

void test_value_binding_is_inlined() {
  const auto program = tacit::compile("X ← + 1 2\nX");
  assert(program.functions.empty());
  assert(program.code.back().op == tacit::Instruction::Op::LoadBinding);
  assert(program.code[program.code.size() - 2].op == tacit::Instruction::Op::Bind);
}

}  // namespace

namespace phase3_test {

void run_compiler_signature_tests() {
  test_signature_of_plain_lines();
  test_signature_of_arrays();
  test_signature_of_modifiers();
  test_signature_of_dynamic_code();
  test_signature_with_bindings();
  test_function_table();
  test_value_binding_is_inlined();
}

}  // namespace phase3_test
