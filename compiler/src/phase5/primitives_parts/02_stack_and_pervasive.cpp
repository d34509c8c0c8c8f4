namespace tacit {

namespace {

void duplicate_impl(CallContext& ctx, const Operands&) {
  auto a = ctx.pop("value to duplicate");
  ctx.push(a);
  ctx.push(std::move(a));
}

void over_impl(CallContext& ctx, const Operands&) {
  auto a = ctx.pop("first value");
  auto b = ctx.pop("second value");
  ctx.push(b);
  ctx.push(std::move(a));
  ctx.push(std::move(b));
}

void flip_impl(CallContext& ctx, const Operands&) {
  auto a = ctx.pop("first value");
  auto b = ctx.pop("second value");
  ctx.push(std::move(a));
  ctx.push(std::move(b));
}

void pop_impl(CallContext& ctx, const Operands&) {
  ctx.pop("value to pop");
}

void identity_impl(CallContext& ctx, const Operands&) {
  ctx.push(ctx.pop("value"));
}

constexpr double kPi = 3.14159265358979323846;

void pi_impl(CallContext& ctx, const Operands&) {
  ctx.push(Array::number(kPi));
}

void tau_impl(CallContext& ctx, const Operands&) {
  ctx.push(Array::number(2.0 * kPi));
}

void eta_impl(CallContext& ctx, const Operands&) {
  ctx.push(Array::number(kPi / 2.0));
}

void infinity_impl(CallContext& ctx, const Operands&) {
  ctx.push(Array::number(HUGE_VAL));
}

template <MonadicOp Op>
void monadic_impl(CallContext& ctx, const Operands&) {
  const auto a = ctx.pop("argument");
  ctx.push(pervade_monadic(Op, a, ctx.op_context()));
}

template <DyadicOp Op>
void dyadic_impl(CallContext& ctx, const Operands&) {
  const auto a = ctx.pop("first argument");
  const auto b = ctx.pop("second argument");
  ctx.push(pervade_dyadic(Op, a, b, ctx.op_context()));
}

}  // namespace

}  // namespace tacit
