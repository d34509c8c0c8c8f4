namespace tacit {

Interpreter::Interpreter(const Program& program, ExecutionContext& context)
    : program_(program), context_(context) {
  op_context_.pool = context_.pool();
  op_context_.parallel_min_elements = context_.options.parallel_min_elements;
  op_context_.chunk_elements = context_.options.chunk_elements;
  op_context_.fill.defaults = context_.options.default_fill;
}

Interpreter::~Interpreter() = default;

Array Interpreter::pop(const char* what) {
  if (stack_.empty()) {
    throw RuntimeError(RuntimeErrorKind::StackUnderflow,
                       std::string("Stack was empty when getting ") + what);
  }
  auto value = std::move(stack_.back());
  stack_.pop_back();
  lower_array_marks();
  return value;
}

void Interpreter::push(Array value) {
  stack_.push_back(std::move(value));
}

// Values an array literal consumes from below its marker become part of the
// enclosing stack, so the marker follows the stack down.
void Interpreter::lower_array_marks() {
  for (auto mark = array_marks_.rbegin(); mark != array_marks_.rend() && *mark > stack_.size();
       ++mark) {
    *mark = stack_.size();
  }
}

void Interpreter::push_fill(Array value) {
  fills_.push_back(std::move(value));
  sync_fill();
}

void Interpreter::pop_fill() {
  if (!fills_.empty()) {
    fills_.pop_back();
  }
  sync_fill();
}

void Interpreter::sync_fill() {
  if (fills_.empty()) {
    op_context_.fill.value.reset();
  } else {
    op_context_.fill.value = fills_.back();
  }
}

std::optional<Signature> Interpreter::signature_of(std::uint32_t function) const {
  return program_.functions.at(function).signature;
}

std::optional<Primitive> Interpreter::primitive_of(std::uint32_t function) const {
  return program_.functions.at(function).primitive;
}

CallContext::Checkpoint Interpreter::checkpoint() const {
  Checkpoint out;
  out.stack = stack_;
  out.frames = frames_.size();
  out.fills = fills_.size();
  out.array_marks = array_marks_.size();
  return out;
}

void Interpreter::restore(Checkpoint checkpoint) {
  while (frames_.size() > checkpoint.frames) {
    leave();
  }
  stack_ = std::move(checkpoint.stack);
  fills_.resize(std::min(fills_.size(), checkpoint.fills));
  array_marks_.resize(std::min(array_marks_.size(), checkpoint.array_marks));
  lower_array_marks();
  sync_fill();
}

void Interpreter::require_stack(std::size_t count, const char* what) const {
  if (stack_.size() < count) {
    throw RuntimeError(RuntimeErrorKind::StackUnderflow,
                       std::string(what) + " needs " + std::to_string(count) +
                           " values, but the stack has " + std::to_string(stack_.size()));
  }
}

void Interpreter::poll_interrupt() const {
  if (context_.interrupt_requested()) {
    throw RuntimeError(RuntimeErrorKind::Interrupted, "Execution was interrupted");
  }
}

}  // namespace tacit
