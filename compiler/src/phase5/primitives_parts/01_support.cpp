namespace tacit {

namespace {

[[noreturn]] void fail(RuntimeErrorKind kind, const std::string& message,
                       std::vector<OperandInfo> operands = {}) {
  throw RuntimeError(kind, message, std::move(operands));
}

const FillContext& fill_of(CallContext& ctx) {
  return ctx.op_context().fill;
}

std::size_t static_args(CallContext& ctx, std::uint32_t function, const char* modifier) {
  const auto signature = ctx.signature_of(function);
  if (!signature) {
    fail(RuntimeErrorKind::TypeMismatch,
         std::string(modifier) + " needs a function with a known signature");
  }
  return signature->args;
}

// Calls a 1→1 function. Operand functions that are a single pervasive
// primitive run directly on the arrays.
Array apply1(CallContext& ctx, std::uint32_t function, const Array& a) {
  ctx.poll_interrupt();
  if (const auto primitive = ctx.primitive_of(function)) {
    if (const auto op = monadic_op_of(*primitive)) {
      return pervade_monadic(*op, a, ctx.op_context());
    }
  }
  ctx.push(a);
  ctx.call(function);
  return ctx.pop("function result");
}

// Calls a 2→1 function with `a` as the first argument (top of stack).
Array apply2(CallContext& ctx, std::uint32_t function, const Array& a, const Array& b) {
  ctx.poll_interrupt();
  if (const auto primitive = ctx.primitive_of(function)) {
    if (const auto op = dyadic_op_of(*primitive)) {
      return pervade_dyadic(*op, a, b, ctx.op_context());
    }
  }
  ctx.push(b);
  ctx.push(a);
  ctx.call(function);
  return ctx.pop("function result");
}

// Pops `count` values; element 0 is the former top of the stack.
std::vector<Array> pop_values(CallContext& ctx, std::size_t count, const char* what) {
  std::vector<Array> values;
  values.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    values.push_back(ctx.pop(what));
  }
  return values;
}

// Pushes the first `count` values back so that values[0] ends on top.
void push_values(CallContext& ctx, const std::vector<Array>& values, std::size_t count) {
  for (std::size_t i = count; i > 0; --i) {
    ctx.push(values[i - 1]);
  }
}

Array element_at(const Array& a, std::size_t index) {
  return a.visit([&](const auto& slice) {
    return Array::from_storage(Shape{}, slice.slice(index, index + 1));
  });
}

}  // namespace

}  // namespace tacit
