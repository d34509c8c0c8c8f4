namespace tacit {

namespace {

bool compile_trace_enabled() {
  static const bool enabled = env_flag_enabled("TACIT_COMPILE_TRACE", false);
  return enabled;
}

Instruction make_instruction(Instruction::Op op, std::uint32_t operand, const Span& span) {
  Instruction instruction;
  instruction.op = op;
  instruction.operand = operand;
  instruction.span = span;
  return instruction;
}

}  // namespace

void Compiler::Effect::apply(const std::optional<Signature>& signature) {
  if (!signature) {
    dynamic = true;
    return;
  }
  depth -= static_cast<long>(signature->args);
  lowest = std::min(lowest, depth);
  depth += static_cast<long>(signature->outputs);
}

std::optional<Signature> Compiler::Effect::signature() const {
  if (dynamic) {
    return std::nullopt;
  }
  Signature out;
  out.args = static_cast<std::size_t>(-lowest);
  out.outputs = static_cast<std::size_t>(depth - lowest);
  return out;
}

Program Compiler::compile(const Module& module) {
  program_ = Program{};
  scopes_.clear();
  scopes_.emplace_back();
  name_ids_.clear();

  Effect effect;
  compile_lines(module.lines, program_.code, effect);
  program_.signature = effect.signature();
  if (compile_trace_enabled()) {
    std::fprintf(stderr, "[tacit-compile] program signature=%s functions=%zu constants=%zu\n",
                 format_signature(program_.signature).c_str(), program_.functions.size(),
                 program_.constants.size());
  }
  scopes_.clear();
  return std::move(program_);
}

std::uint32_t Compiler::intern(const std::string& name) {
  const auto found = name_ids_.find(name);
  if (found != name_ids_.end()) {
    return found->second;
  }
  const auto id = static_cast<std::uint32_t>(program_.names.size());
  program_.names.push_back(name);
  name_ids_.emplace(name, id);
  return id;
}

std::uint32_t Compiler::add_constant(Array value) {
  program_.constants.push_back(std::move(value));
  return static_cast<std::uint32_t>(program_.constants.size() - 1);
}

const Compiler::BindingInfo* Compiler::resolve(const std::string& name) const {
  for (auto scope = scopes_.rbegin(); scope != scopes_.rend(); ++scope) {
    const auto found = scope->bindings.find(name);
    if (found != scope->bindings.end()) {
      return &found->second;
    }
  }
  return nullptr;
}

std::uint32_t Compiler::add_function(Function function) {
  if (function.code.size() == 1 && function.code[0].op == Instruction::Op::CallPrimitive &&
      function.code[0].operands.empty()) {
    function.primitive = function.code[0].primitive;
  }
  const auto index = static_cast<std::uint32_t>(program_.functions.size());
  if (compile_trace_enabled()) {
    std::fprintf(stderr, "[tacit-compile] function #%u name=%s signature=%s instructions=%zu\n",
                 index, function.name.empty() ? "<anonymous>" : function.name.c_str(),
                 format_signature(function.signature).c_str(), function.code.size());
  }
  program_.functions.push_back(std::move(function));
  return index;
}

std::uint32_t Compiler::compile_function(const StmtList& lines, const std::string& name,
                                         const Span& span) {
  scopes_.emplace_back();
  Function function;
  function.name = name;
  function.span = span;
  Effect effect;
  compile_lines(lines, function.code, effect);
  scopes_.pop_back();
  function.signature = effect.signature();
  return add_function(std::move(function));
}

Program compile(const Module& module) {
  Compiler compiler;
  return compiler.compile(module);
}

Program compile(std::string_view source) {
  const auto module = parse(source);
  return compile(*module);
}
