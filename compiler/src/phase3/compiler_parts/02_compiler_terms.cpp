void Compiler::compile_lines(const StmtList& lines, Code& code, Effect& effect) {
  for (const auto& stmt : lines) {
    if (stmt->kind == Stmt::Kind::Binding) {
      compile_binding(static_cast<const BindingStmt&>(*stmt), code, effect);
    } else {
      compile_terms(static_cast<const LineStmt&>(*stmt).terms, code, effect);
    }
  }
}

void Compiler::compile_binding(const BindingStmt& binding, Code& code, Effect& effect) {
  Code body;
  Effect body_effect;
  compile_terms(binding.terms, body, body_effect);
  const auto signature = body_effect.signature();
  const auto name = intern(binding.name);

  BindingInfo info;
  info.name = name;
  if (signature && signature->args == 0 && signature->outputs == 1) {
    info.kind = BindingInfo::Kind::Value;
    for (auto& instruction : body) {
      code.push_back(std::move(instruction));
    }
    code.push_back(make_instruction(Instruction::Op::Bind, name, binding.span));
    effect.apply(Signature{0, 1});
    effect.apply(Signature{1, 0});
  } else {
    info.kind = BindingInfo::Kind::Function;
    info.signature = signature;
    std::uint32_t index = 0;
    if (body.size() == 1 && body[0].op == Instruction::Op::CallFunction) {
      index = body[0].operand;
      program_.functions[index].name = binding.name;
    } else {
      Function function;
      function.name = binding.name;
      function.code = std::move(body);
      function.signature = signature;
      function.span = binding.span;
      index = add_function(std::move(function));
    }
    auto instruction = make_instruction(Instruction::Op::BindFunction, name, binding.span);
    instruction.function = index;
    code.push_back(std::move(instruction));
  }
  scopes_.back().bindings[binding.name] = info;
}

void Compiler::compile_terms(const TermList& terms, Code& code, Effect& effect) {
  for (auto term = terms.rbegin(); term != terms.rend(); ++term) {
    compile_term(**term, code, effect);
  }
}

void Compiler::compile_term(const Term& term, Code& code, Effect& effect) {
  switch (term.kind) {
    case Term::Kind::Number: {
      const auto index = add_constant(Array::number(static_cast<const NumberTerm&>(term).value));
      code.push_back(make_instruction(Instruction::Op::PushConstant, index, term.span));
      effect.apply(Signature{0, 1});
      return;
    }
    case Term::Kind::Char: {
      const auto index = add_constant(Array::character(static_cast<const CharTerm&>(term).value));
      code.push_back(make_instruction(Instruction::Op::PushConstant, index, term.span));
      effect.apply(Signature{0, 1});
      return;
    }
    case Term::Kind::String: {
      const auto& text = static_cast<const StringTerm&>(term).value;
      const auto index =
          add_constant(Array::from_chars(Shape{text.size()}, std::vector<char32_t>(text.begin(), text.end())));
      code.push_back(make_instruction(Instruction::Op::PushConstant, index, term.span));
      effect.apply(Signature{0, 1});
      return;
    }
    case Term::Kind::Identifier: {
      const auto& identifier = static_cast<const IdentifierTerm&>(term);
      const auto* info = resolve(identifier.name);
      if (!info) {
        throw CompileError(CompileErrorKind::UnboundName, "Unknown name " + identifier.name, term.span);
      }
      if (info->kind == BindingInfo::Kind::Value) {
        code.push_back(make_instruction(Instruction::Op::LoadBinding, info->name, term.span));
        effect.apply(Signature{0, 1});
      } else {
        code.push_back(make_instruction(Instruction::Op::CallBinding, info->name, term.span));
        effect.apply(info->signature);
      }
      return;
    }
    case Term::Kind::Primitive: {
      const auto primitive = static_cast<const PrimitiveTerm&>(term).primitive;
      const auto& info = primitive_info(primitive);
      auto instruction = make_instruction(Instruction::Op::CallPrimitive, 0, term.span);
      instruction.primitive = primitive;
      code.push_back(std::move(instruction));
      effect.apply(Signature{info.args, info.outputs});
      return;
    }
    case Term::Kind::Function: {
      const auto index =
          compile_function(static_cast<const FunctionTerm&>(term).lines, std::string(), term.span);
      code.push_back(make_instruction(Instruction::Op::CallFunction, index, term.span));
      effect.apply(program_.functions[index].signature);
      return;
    }
    case Term::Kind::Array:
      compile_array(static_cast<const ArrayTerm&>(term), code, effect);
      return;
    case Term::Kind::Strand:
      compile_strand(static_cast<const StrandTerm&>(term), code, effect);
      return;
    case Term::Kind::Modifier: {
      const auto& modifier = static_cast<const ModifierTerm&>(term);
      if (modifier.modifier == Primitive::If) {
        compile_if(modifier, code, effect);
      } else {
        compile_modifier(modifier, code, effect);
      }
      return;
    }
  }
}

void Compiler::compile_array(const ArrayTerm& array, Code& code, Effect& effect) {
  Code inner;
  Effect inner_effect;
  compile_lines(array.lines, inner, inner_effect);
  emit_array(inner, inner_effect, array.boxed, array.span, code, effect);
}

void Compiler::compile_strand(const StrandTerm& strand, Code& code, Effect& effect) {
  Code inner;
  Effect inner_effect;
  compile_terms(strand.items, inner, inner_effect);
  emit_array(inner, inner_effect, false, strand.span, code, effect);
}

// Static row counts become MakeArray(n); otherwise the rows are counted at
// run time from a BeginArray marker.
void Compiler::emit_array(Code& inner, const Effect& inner_effect, bool boxed, const Span& span,
                          Code& code, Effect& effect) {
  const auto signature = inner_effect.signature();
  if (!signature) {
    auto begin = make_instruction(Instruction::Op::BeginArray, 0, span);
    code.push_back(std::move(begin));
  }
  for (auto& instruction : inner) {
    code.push_back(std::move(instruction));
  }
  auto make = make_instruction(Instruction::Op::MakeArray,
                               signature ? static_cast<std::uint32_t>(signature->outputs)
                                         : Instruction::kDynamicCount,
                               span);
  make.boxed = boxed;
  code.push_back(std::move(make));
  if (signature) {
    effect.apply(Signature{signature->args, 1});
  } else {
    effect.apply(std::nullopt);
  }
}
