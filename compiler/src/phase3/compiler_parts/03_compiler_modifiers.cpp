std::uint32_t Compiler::compile_operand(const Term& term) {
  if (term.kind == Term::Kind::Function) {
    return compile_function(static_cast<const FunctionTerm&>(term).lines, std::string(), term.span);
  }
  scopes_.emplace_back();
  Function function;
  function.span = term.span;
  Effect effect;
  compile_term(term, function.code, effect);
  scopes_.pop_back();
  function.signature = effect.signature();
  return add_function(std::move(function));
}

void Compiler::arity_error(const ModifierTerm& modifier, const std::string& message) const {
  throw CompileError(CompileErrorKind::ArityMismatch,
                     primitive_display(modifier.modifier) + " " + message, modifier.span);
}

std::optional<Signature> Compiler::modifier_signature(const ModifierTerm& modifier,
                                                      const std::vector<std::uint32_t>& operands) const {
  const auto operand_signature = [&](std::size_t i) { return program_.functions[operands[i]].signature; };
  const auto require_static = [&](std::size_t i) {
    const auto actual = operand_signature(i);
    if (!actual) {
      arity_error(modifier, "expects a function with a static signature");
    }
    return *actual;
  };
  const auto require = [&](std::size_t i, Signature expected) {
    const auto actual = operand_signature(i);
    if (!actual || *actual != expected) {
      arity_error(modifier, "expects a function with signature " + format_signature(expected) +
                                ", but it has " + format_signature(actual));
    }
  };

  switch (modifier.modifier) {
    case Primitive::Reduce:
    case Primitive::Scan:
      require(0, Signature{2, 1});
      return Signature{1, 1};
    case Primitive::Fold:
    case Primitive::Distribute:
    case Primitive::Table:
      require(0, Signature{2, 1});
      return Signature{2, 1};
    case Primitive::Group:
    case Primitive::Partition:
      require(0, Signature{1, 1});
      return Signature{2, 1};
    case Primitive::Each:
    case Primitive::Rows: {
      const auto f = operand_signature(0);
      if (!f || f->args == 0 || f->outputs != 1) {
        arity_error(modifier, "expects a function with at least one argument and one output, but it has " +
                                  format_signature(f));
      }
      return Signature{f->args, 1};
    }
    case Primitive::Repeat: {
      const auto f = operand_signature(0);
      if (!f || f->args != f->outputs) {
        return std::nullopt;
      }
      return Signature{f->args + 1, f->outputs};
    }
    case Primitive::Dip: {
      const auto f = operand_signature(0);
      if (!f) {
        return std::nullopt;
      }
      return Signature{f->args + 1, f->outputs + 1};
    }
    case Primitive::Both: {
      const auto f = require_static(0);
      return Signature{f.args * 2, f.outputs * 2};
    }
    case Primitive::Fork: {
      const auto f = require_static(0);
      const auto g = require_static(1);
      return Signature{std::max(f.args, g.args), f.outputs + g.outputs};
    }
    case Primitive::Try: {
      const auto f = require_static(0);
      const auto handler = require_static(1);
      if (handler.outputs != f.outputs) {
        arity_error(modifier, "handler must produce as many values as the function (" +
                                  format_signature(f) + " vs " + format_signature(handler) + ")");
      }
      const auto handler_args = handler.args > 0 ? handler.args - 1 : 0;
      return Signature{std::max(f.args, handler_args), f.outputs};
    }
    case Primitive::Fill: {
      require(0, Signature{0, 1});
      return operand_signature(1);
    }
    case Primitive::If: {
      const auto then_branch = operand_signature(0);
      const auto else_branch = operand_signature(1);
      if (!then_branch || !else_branch) {
        return std::nullopt;
      }
      if (*then_branch != *else_branch) {
        arity_error(modifier, "branches must have the same signature, but they are " +
                                  format_signature(then_branch) + " and " +
                                  format_signature(else_branch));
      }
      return Signature{then_branch->args + 1, then_branch->outputs};
    }
    default:
      break;
  }
  arity_error(modifier, "is not a modifier");
}

void Compiler::compile_modifier(const ModifierTerm& modifier, Code& code, Effect& effect) {
  std::vector<std::uint32_t> operands;
  for (const auto& operand : modifier.operands) {
    operands.push_back(compile_operand(*operand));
  }
  const auto signature = modifier_signature(modifier, operands);
  auto instruction = make_instruction(Instruction::Op::CallPrimitive, 0, modifier.span);
  instruction.primitive = modifier.modifier;
  instruction.operands = std::move(operands);
  code.push_back(std::move(instruction));
  effect.apply(signature);
}

// ?then else lowers to:
//   BranchUnless +3; CallFunction then; Branch +2; CallFunction else
// Jump operands are forward offsets from the jumping instruction.
void Compiler::compile_if(const ModifierTerm& modifier, Code& code, Effect& effect) {
  std::vector<std::uint32_t> operands;
  for (const auto& operand : modifier.operands) {
    operands.push_back(compile_operand(*operand));
  }
  const auto signature = modifier_signature(modifier, operands);
  code.push_back(make_instruction(Instruction::Op::BranchUnless, 3, modifier.span));
  code.push_back(make_instruction(Instruction::Op::CallFunction, operands[0], modifier.operands[0]->span));
  code.push_back(make_instruction(Instruction::Op::Branch, 2, modifier.span));
  code.push_back(make_instruction(Instruction::Op::CallFunction, operands[1], modifier.operands[1]->span));
  effect.apply(signature);
}

}  // namespace tacit
