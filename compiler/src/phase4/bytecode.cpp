#include <cstdio>
#include <sstream>
#include <string>

#include "tacit/bytecode.h"

namespace tacit {

namespace {

std::string name_of(const Program& program, std::uint32_t id) {
  if (id < program.names.size()) {
    return program.names[id];
  }
  return "#" + std::to_string(id);
}

std::string function_label(const Program& program, std::uint32_t index) {
  std::string out = "f" + std::to_string(index);
  if (index < program.functions.size() && !program.functions[index].name.empty()) {
    out += "(" + program.functions[index].name + ")";
  }
  return out;
}

void emit_code(std::ostringstream& out, const Code& code, const Program& program, const char* indent) {
  for (std::size_t ip = 0; ip < code.size(); ++ip) {
    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "%04zu ", ip);
    out << indent << prefix << disassemble(code[ip], program) << "\n";
  }
}

}  // namespace

const char* op_name(Instruction::Op op) {
  switch (op) {
    case Instruction::Op::PushConstant:
      return "PushConstant";
    case Instruction::Op::CallPrimitive:
      return "CallPrimitive";
    case Instruction::Op::CallFunction:
      return "CallFunction";
    case Instruction::Op::CallBinding:
      return "CallBinding";
    case Instruction::Op::Bind:
      return "Bind";
    case Instruction::Op::BindFunction:
      return "BindFunction";
    case Instruction::Op::LoadBinding:
      return "LoadBinding";
    case Instruction::Op::Branch:
      return "Branch";
    case Instruction::Op::BranchUnless:
      return "BranchUnless";
    case Instruction::Op::BeginArray:
      return "BeginArray";
    case Instruction::Op::MakeArray:
      return "MakeArray";
  }
  return "?";
}

std::string disassemble(const Instruction& instruction, const Program& program) {
  std::string out = op_name(instruction.op);
  switch (instruction.op) {
    case Instruction::Op::PushConstant:
      out += " ";
      out += instruction.operand < program.constants.size()
                 ? program.constants[instruction.operand].show()
                 : "#" + std::to_string(instruction.operand);
      break;
    case Instruction::Op::CallPrimitive:
      out += " " + primitive_display(instruction.primitive);
      for (const auto operand : instruction.operands) {
        out += " " + function_label(program, operand);
      }
      break;
    case Instruction::Op::CallFunction:
      out += " " + function_label(program, instruction.operand);
      break;
    case Instruction::Op::CallBinding:
    case Instruction::Op::Bind:
    case Instruction::Op::LoadBinding:
      out += " " + name_of(program, instruction.operand);
      break;
    case Instruction::Op::BindFunction:
      out += " " + name_of(program, instruction.operand) + " " +
             function_label(program, instruction.function);
      break;
    case Instruction::Op::Branch:
    case Instruction::Op::BranchUnless:
      out += " +" + std::to_string(instruction.operand);
      break;
    case Instruction::Op::BeginArray:
      break;
    case Instruction::Op::MakeArray:
      out += instruction.operand == Instruction::kDynamicCount
                 ? std::string(" dynamic")
                 : " " + std::to_string(instruction.operand);
      if (instruction.boxed) {
        out += " boxed";
      }
      break;
  }
  return out;
}

std::string disassemble(const Program& program) {
  std::ostringstream out;
  out << "main " << format_signature(program.signature) << "\n";
  emit_code(out, program.code, program, "  ");
  for (std::size_t index = 0; index < program.functions.size(); ++index) {
    const auto& function = program.functions[index];
    out << function_label(program, static_cast<std::uint32_t>(index)) << " "
        << format_signature(function.signature) << "\n";
    emit_code(out, function.code, program, "  ");
  }
  return out.str();
}

}  // namespace tacit
