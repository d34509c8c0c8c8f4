namespace tacit {

namespace {

template <Array (*Fn)(const Array&)>
void monadic_structure_impl(CallContext& ctx, const Operands&) {
  const auto a = ctx.pop("argument");
  ctx.push(Fn(a));
}

template <Array (*Fn)(const Array&, const Array&)>
void dyadic_structure_impl(CallContext& ctx, const Operands&) {
  const auto a = ctx.pop("first argument");
  const auto b = ctx.pop("second argument");
  ctx.push(Fn(a, b));
}

template <Array (*Fn)(const Array&, const Array&, const FillContext&)>
void filled_structure_impl(CallContext& ctx, const Operands&) {
  const auto a = ctx.pop("first argument");
  const auto b = ctx.pop("second argument");
  ctx.push(Fn(a, b, fill_of(ctx)));
}

void first_impl(CallContext& ctx, const Operands&) {
  const auto a = ctx.pop("argument");
  ctx.push(first(a, fill_of(ctx)));
}

void random_impl(CallContext& ctx, const Operands&) {
  ctx.push(random_scalar(ctx.rng()));
}

}  // namespace

}  // namespace tacit
