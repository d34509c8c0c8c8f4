namespace tacit {

std::vector<Array> Interpreter::run(std::vector<Array> initial_stack) {
  context_.rng.seed(context_.options.random_seed);
  if (program_.signature && program_.signature->args > initial_stack.size()) {
    throw RuntimeError(RuntimeErrorKind::StackUnderflow,
                       "Program needs " + std::to_string(program_.signature->args) +
                           " arguments, but " + std::to_string(initial_stack.size()) +
                           " were given");
  }
  stack_ = std::move(initial_stack);
  frames_.clear();
  fills_.clear();
  array_marks_.clear();
  scopes_.reset();
  sync_fill();

  Frame top;
  top.code = &program_.code;
  top.scope = scopes_.root();
  top.function = kTopLevel;
  frames_.push_back(top);
  execute(0);
  return std::move(stack_);
}

void Interpreter::enter(std::uint32_t function, ScopeHandle parent) {
  const auto& callee = program_.functions.at(function);
  if (callee.signature) {
    require_stack(callee.signature->args,
                  callee.name.empty() ? "function" : callee.name.c_str());
  }
  Frame frame;
  frame.code = &callee.code;
  frame.scope = scopes_.create(parent);
  frame.function = function;
  frames_.push_back(frame);
}

void Interpreter::leave() {
  if (frames_.back().function != kTopLevel) {
    scopes_.release(frames_.back().scope);
  }
  frames_.pop_back();
}

void Interpreter::call(std::uint32_t function) {
  poll_interrupt();
  const auto& callee = program_.functions.at(function);
  if (callee.primitive && !is_modifier(*callee.primitive)) {
    const auto& info = primitive_info(*callee.primitive);
    require_stack(info.args, info.name);
    invoke_primitive(*callee.primitive, *this, Operands{});
    return;
  }
  const auto depth = frames_.size();
  enter(function, frames_.empty() ? scopes_.root() : frames_.back().scope);
  execute(depth);
}

void Interpreter::execute(std::size_t stop_depth) {
  while (frames_.size() > stop_depth) {
    auto& frame = frames_.back();
    if (frame.ip >= frame.code->size()) {
      leave();
      continue;
    }
    poll_interrupt();
    const auto& instruction = (*frame.code)[frame.ip];
    if (vm_trace_enabled()) {
      std::fprintf(stderr, "[tacit-vm] depth=%zu ip=%zu op=%s stack=%zu\n", frames_.size(),
                   frame.ip, op_name(instruction.op), stack_.size());
    }
    ++frame.ip;
    try {
      step(instruction);
    } catch (RuntimeError& error) {
      if (!error.has_span()) {
        error.attach_span(instruction.span);
      }
      throw;
    } catch (const std::bad_alloc&) {
      RuntimeError error(RuntimeErrorKind::ShapeMismatch, "Not enough memory for the result");
      error.attach_span(instruction.span);
      throw error;
    } catch (const std::length_error&) {
      RuntimeError error(RuntimeErrorKind::ShapeMismatch, "Result is too large to allocate");
      error.attach_span(instruction.span);
      throw error;
    }
  }
}

void Interpreter::call_primitive(const Instruction& instruction) {
  const auto& info = primitive_info(instruction.primitive);
  if (info.modifier_args == 0) {
    require_stack(info.args, info.name);
  }
  invoke_primitive(instruction.primitive, *this, instruction.operands);
}

// Jump operands are offsets from the jumping instruction; `ip` has already
// moved past it when step() runs.
void Interpreter::step(const Instruction& instruction) {
  switch (instruction.op) {
    case Instruction::Op::PushConstant:
      push(program_.constants.at(instruction.operand));
      return;
    case Instruction::Op::CallPrimitive:
      call_primitive(instruction);
      return;
    case Instruction::Op::CallFunction:
      enter(instruction.operand, frames_.back().scope);
      return;
    case Instruction::Op::CallBinding: {
      const auto* binding = scopes_.lookup(frames_.back().scope, instruction.operand);
      if (!binding || binding->kind != ScopeBinding::Kind::Function) {
        throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                           "No function is bound to " + program_.names.at(instruction.operand));
      }
      const auto closure = binding->closure;
      enter(closure.function, closure.scope);
      return;
    }
    case Instruction::Op::Bind: {
      ScopeBinding binding;
      binding.kind = ScopeBinding::Kind::Value;
      binding.value = pop("bound value");
      scopes_.bind(frames_.back().scope, instruction.operand, std::move(binding));
      return;
    }
    case Instruction::Op::BindFunction: {
      ScopeBinding binding;
      binding.kind = ScopeBinding::Kind::Function;
      binding.closure.function = instruction.function;
      binding.closure.scope = frames_.back().scope;
      scopes_.bind(frames_.back().scope, instruction.operand, std::move(binding));
      return;
    }
    case Instruction::Op::LoadBinding: {
      const auto* binding = scopes_.lookup(frames_.back().scope, instruction.operand);
      if (!binding || binding->kind != ScopeBinding::Kind::Value) {
        throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                           "No value is bound to " + program_.names.at(instruction.operand));
      }
      push(binding->value);
      return;
    }
    case Instruction::Op::Branch:
      frames_.back().ip += instruction.operand - 1;
      return;
    case Instruction::Op::BranchUnless: {
      const auto condition = pop("condition");
      if (!as_bool(condition, "If condition must be a boolean")) {
        frames_.back().ip += instruction.operand - 1;
      }
      return;
    }
    case Instruction::Op::BeginArray:
      array_marks_.push_back(stack_.size());
      return;
    case Instruction::Op::MakeArray: {
      std::size_t count = instruction.operand;
      if (count == Instruction::kDynamicCount) {
        count = stack_.size() - array_marks_.back();
        array_marks_.pop_back();
      }
      require_stack(count, "array");
      std::vector<Array> rows;
      rows.reserve(count);
      for (std::size_t i = 0; i < count; ++i) {
        rows.push_back(pop("array row"));
      }
      push(instruction.boxed ? from_rows_boxed(std::move(rows))
                             : from_rows(std::move(rows), op_context_.fill));
      return;
    }
  }
}

}  // namespace tacit
