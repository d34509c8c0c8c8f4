#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tacit/array.h"
#include "tacit/diagnostics.h"
#include "tacit/primitives.h"

namespace tacit {

struct Instruction {
  enum class Op : std::uint8_t {
    PushConstant,
    CallPrimitive,
    CallFunction,
    CallBinding,
    Bind,
    BindFunction,
    LoadBinding,
    Branch,
    BranchUnless,
    BeginArray,
    MakeArray,
  };

  static constexpr std::uint32_t kDynamicCount = 0xFFFFFFFFu;

  Op op = Op::PushConstant;
  // Constant index, function index, name id, jump target or row count,
  // depending on `op`.
  std::uint32_t operand = 0;
  // Function index for BindFunction.
  std::uint32_t function = 0;
  Primitive primitive = Primitive::Identity;
  // Modifier operand functions for CallPrimitive.
  std::vector<std::uint32_t> operands;
  bool boxed = false;
  Span span;
};

using Code = std::vector<Instruction>;

struct Function {
  std::string name;
  Code code;
  std::optional<Signature> signature;
  // Set when the body is exactly one operand-free primitive call; modifiers
  // use it to skip the call machinery.
  std::optional<Primitive> primitive;
  Span span;
};

struct Program {
  Code code;
  std::optional<Signature> signature;
  std::vector<Array> constants;
  std::vector<Function> functions;
  std::vector<std::string> names;
};

const char* op_name(Instruction::Op op);
std::string disassemble(const Instruction& instruction, const Program& program);
std::string disassemble(const Program& program);

}  // namespace tacit
