#include <cassert>
#include <cstdio>
#include <string>

#include "tacit/bytecode.h"
#include "tacit/compiler.h"

namespace {

void assert_disassembly(const std::string& source, const std::string& expected) {
  const auto program = tacit::compile(source);
  const auto actual = tacit::disassemble(program);
  if (actual != expected) {
    std::fprintf(stderr, "phase4 disassembly mismatch for:\n%s\nexpected:\n%s\nactual:\n%s\n",
                 source.c_str(), expected.c_str(), actual.c_str());
  }
  assert(actual == expected);
}

void test_bytecode_right_to_left_emission() {
  assert_disassembly("+ 1 2",
                     "main 0->1\n"
                     "  0000 PushConstant 2\n"
                     "  0001 PushConstant 1\n"
                     "  0002 CallPrimitive +\n");
}

void test_bytecode_static_array() {
  assert_disassembly("[1 2]",
                     "main 0->1\n"
                     "  0000 PushConstant 2\n"
                     "  0001 PushConstant 1\n"
                     "  0002 MakeArray 2\n");
  assert_disassembly("{\"ab\"}",
                     "main 0->1\n"
                     "  0000 PushConstant \"ab\"\n"
                     "  0001 MakeArray 1 boxed\n");
}

void test_bytecode_dynamic_array() {
  assert_disassembly("[⍥. 2 1]",
                     "main dynamic\n"
                     "  0000 BeginArray\n"
                     "  0001 PushConstant 1\n"
                     "  0002 PushConstant 2\n"
                     "  0003 CallPrimitive ⍥ f0\n"
                     "  0004 MakeArray dynamic\n"
                     "f0 1->2\n"
                     "  0000 CallPrimitive .\n");
}

void test_bytecode_if_lowers_to_relative_branches() {
  assert_disassembly("?(1)(2) 1",
                     "main 0->1\n"
                     "  0000 PushConstant 1\n"
                     "  0001 BranchUnless +3\n"
                     "  0002 CallFunction f0\n"
                     "  0003 Branch +2\n"
                     "  0004 CallFunction f1\n"
                     "f0 0->1\n"
                     "  0000 PushConstant 1\n"
                     "f1 0->1\n"
                     "  0000 PushConstant 2\n");
}

void test_bytecode_bindings() {
  assert_disassembly("X ← 5\nX",
                     "main 0->1\n"
                     "  0000 PushConstant 5\n"
                     "  0001 Bind X\n"
                     "  0002 LoadBinding X\n");
  assert_disassembly("F ← + 1\nF 2",
                     "main 0->1\n"
                     "  0000 BindFunction F f0(F)\n"
                     "  0001 PushConstant 2\n"
                     "  0002 CallBinding F\n"
                     "f0(F) 1->1\n"
                     "  0000 PushConstant 1\n"
                     "  0001 CallPrimitive +\n");
}

void test_bytecode_constants_and_names_tables() {
  const auto program = tacit::compile("A ← 1\nB ← @x\n⊂ A B");
  assert(program.constants.size() == 2);
  assert(program.constants[0].show() == "1");
  assert(program.constants[1].show() == "@x");
  assert(program.names.size() == 2);
  assert(program.names[0] == "A");
  assert(program.names[1] == "B");
  assert(program.signature);
  assert(program.signature->args == 0);
  assert(program.signature->outputs == 1);
}

void test_bytecode_spans_point_at_source() {
  const auto program = tacit::compile("+ 1 2");
  assert(program.code[0].span.start == 4);
  assert(program.code[1].span.start == 2);
  assert(program.code[2].span.start == 0);
  assert(std::string(tacit::op_name(tacit::Instruction::Op::BranchUnless)) == "BranchUnless");
}

}  // namespace

int main() {
  test_bytecode_right_to_left_emission();
  test_bytecode_static_array();
  test_bytecode_dynamic_array();
  test_bytecode_if_lowers_to_relative_branches();
  test_bytecode_bindings();
  test_bytecode_constants_and_names_tables();
  test_bytecode_spans_point_at_source();
  return 0;
}
