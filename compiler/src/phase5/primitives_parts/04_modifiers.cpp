namespace tacit {

namespace {

// args[0] is the first argument (top of stack).
Array apply_n(CallContext& ctx, std::uint32_t function, const std::vector<Array>& args) {
  if (args.size() == 1) {
    return apply1(ctx, function, args[0]);
  }
  if (args.size() == 2) {
    return apply2(ctx, function, args[0], args[1]);
  }
  push_values(ctx, args, args.size());
  ctx.call(function);
  return ctx.pop("function result");
}

// Empty results keep the element kind of `kind_source`.
Array assemble(std::vector<Array> results, const Shape& outer, const Array& kind_source,
               const FillContext& fill) {
  if (results.empty()) {
    return kind_source.visit([&outer](const auto& slice) {
      using T = typename std::decay_t<decltype(slice)>::value_type;
      return Array::from_storage(outer, CowSlice<T>(std::vector<T>{}));
    });
  }
  if (outer.empty()) {
    return std::move(results.front());
  }
  const auto combined = from_rows(std::move(results), fill);
  Shape shape = outer;
  const auto inner = combined.row_shape();
  shape.insert(shape.end(), inner.begin(), inner.end());
  return combined.reshaped(std::move(shape));
}

Array reduce_identity(CallContext& ctx, std::uint32_t function, const Array& a) {
  double identity = 0.0;
  const auto primitive = ctx.primitive_of(function);
  const auto op = primitive ? dyadic_op_of(*primitive) : std::nullopt;
  if (!op || !dyadic_identity(*op, identity)) {
    fail(RuntimeErrorKind::TypeMismatch,
         "Cannot reduce an empty array with a function that has no identity", {operand_info(a)});
  }
  const auto row_shape = a.row_shape();
  return Array::from_numbers(row_shape, std::vector<double>(shape_product(row_shape), identity));
}

void reduce_impl(CallContext& ctx, const Operands& operands) {
  const auto a = ctx.pop("array to reduce");
  if (a.is_scalar()) {
    ctx.push(a);
    return;
  }
  if (a.row_count() == 0) {
    ctx.push(reduce_identity(ctx, operands[0], a));
    return;
  }
  auto acc = a.row(0);
  for (std::size_t i = 1; i < a.row_count(); ++i) {
    acc = apply2(ctx, operands[0], acc, a.row(i));
  }
  ctx.push(std::move(acc));
}

void fold_impl(CallContext& ctx, const Operands& operands) {
  const auto a = ctx.pop("array to fold");
  auto acc = ctx.pop("initial value");
  for (std::size_t i = 0; i < a.row_count(); ++i) {
    acc = apply2(ctx, operands[0], acc, a.row(i));
  }
  ctx.push(std::move(acc));
}

void scan_impl(CallContext& ctx, const Operands& operands) {
  const auto a = ctx.pop("array to scan");
  if (a.is_scalar() || a.row_count() == 0) {
    ctx.push(a);
    return;
  }
  std::vector<Array> out;
  out.reserve(a.row_count());
  out.push_back(a.row(0));
  for (std::size_t i = 1; i < a.row_count(); ++i) {
    out.push_back(apply2(ctx, operands[0], out.back(), a.row(i)));
  }
  ctx.push(from_rows(std::move(out), fill_of(ctx)));
}

void each_impl(CallContext& ctx, const Operands& operands) {
  const auto count = static_args(ctx, operands[0], "each");
  const auto args = pop_values(ctx, count, "each argument");
  Shape outer;
  std::size_t deepest = 0;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i].rank() > outer.size()) {
      outer = args[i].shape();
      deepest = i;
    }
  }
  std::vector<std::size_t> strides;
  std::vector<OperandInfo> infos;
  for (const auto& arg : args) {
    infos.push_back(operand_info(arg));
    strides.push_back(shape_product(outer, arg.rank()));
  }
  for (const auto& arg : args) {
    if (!shape_has_prefix(outer, arg.shape())) {
      fail(RuntimeErrorKind::ShapeMismatch,
           "Cannot each over shapes " + format_shape(arg.shape()) + " and " + format_shape(outer),
           infos);
    }
  }
  const auto total = shape_product(outer);
  std::vector<Array> results;
  results.reserve(total);
  std::vector<Array> elements(args.size());
  for (std::size_t index = 0; index < total; ++index) {
    for (std::size_t i = 0; i < args.size(); ++i) {
      elements[i] = element_at(args[i], index / strides[i]);
    }
    results.push_back(apply_n(ctx, operands[0], elements));
  }
  ctx.push(assemble(std::move(results), outer, args[deepest], fill_of(ctx)));
}

void rows_impl(CallContext& ctx, const Operands& operands) {
  const auto count = static_args(ctx, operands[0], "rows");
  const auto args = pop_values(ctx, count, "rows argument");
  std::optional<std::size_t> row_count;
  std::size_t first_array = 0;
  std::vector<OperandInfo> infos;
  for (const auto& arg : args) {
    infos.push_back(operand_info(arg));
  }
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.is_scalar()) {
      continue;
    }
    if (!row_count) {
      first_array = i;
    } else if (*row_count != arg.row_count()) {
      fail(RuntimeErrorKind::ShapeMismatch,
           "Cannot rows over arrays with " + std::to_string(*row_count) + " and " +
               std::to_string(arg.row_count()) + " rows",
           infos);
    }
    row_count = arg.row_count();
  }
  if (!row_count) {
    ctx.push(apply_n(ctx, operands[0], args));
    return;
  }
  std::vector<Array> results;
  results.reserve(*row_count);
  std::vector<Array> row_args(args.size());
  for (std::size_t r = 0; r < *row_count; ++r) {
    for (std::size_t i = 0; i < args.size(); ++i) {
      row_args[i] = args[i].row(r);
    }
    results.push_back(apply_n(ctx, operands[0], row_args));
  }
  ctx.push(assemble(std::move(results), Shape{*row_count}, args[first_array], fill_of(ctx)));
}

void distribute_impl(CallContext& ctx, const Operands& operands) {
  const auto a = ctx.pop("array to distribute over");
  const auto b = ctx.pop("distributed value");
  if (a.is_scalar()) {
    ctx.push(apply2(ctx, operands[0], a, b));
    return;
  }
  std::vector<Array> results;
  results.reserve(a.row_count());
  for (std::size_t r = 0; r < a.row_count(); ++r) {
    results.push_back(apply2(ctx, operands[0], a.row(r), b));
  }
  ctx.push(assemble(std::move(results), Shape{a.row_count()}, a, fill_of(ctx)));
}

void table_impl(CallContext& ctx, const Operands& operands) {
  const auto a = ctx.pop("first table argument");
  const auto b = ctx.pop("second table argument");
  const auto rows_a = a.row_count();
  const auto rows_b = b.row_count();
  std::vector<Array> results;
  results.reserve(checked_element_count(Shape{rows_a, rows_b}));
  for (std::size_t i = 0; i < rows_a; ++i) {
    const auto row_a = a.row(i);
    for (std::size_t j = 0; j < rows_b; ++j) {
      results.push_back(apply2(ctx, operands[0], row_a, b.row(j)));
    }
  }
  ctx.push(assemble(std::move(results), Shape{rows_a, rows_b}, rows_a == 0 ? a : b,
                    fill_of(ctx)));
}

void repeat_impl(CallContext& ctx, const Operands& operands) {
  const auto count = as_natural(ctx.pop("repetition count"),
                                "Repetitions must be a natural number");
  for (std::size_t i = 0; i < count; ++i) {
    ctx.call(operands[0]);
  }
}

template <std::vector<Array> (*Split)(const Array&, const Array&)>
void grouping_impl(CallContext& ctx, const Operands& operands) {
  const auto indices = ctx.pop("group indices");
  const auto values = ctx.pop("values to group");
  auto groups = Split(indices, values);
  std::vector<Array> results;
  results.reserve(groups.size());
  for (const auto& group : groups) {
    results.push_back(apply1(ctx, operands[0], group));
  }
  if (results.empty()) {
    ctx.push(Array());
    return;
  }
  ctx.push(from_rows(std::move(results), fill_of(ctx)));
}

void dip_impl(CallContext& ctx, const Operands& operands) {
  auto kept = ctx.pop("value to dip");
  ctx.call(operands[0]);
  ctx.push(std::move(kept));
}

void both_impl(CallContext& ctx, const Operands& operands) {
  const auto count = static_args(ctx, operands[0], "both");
  const auto second = pop_values(ctx, count, "both argument");
  ctx.call(operands[0]);
  push_values(ctx, second, count);
  ctx.call(operands[0]);
}

void fork_impl(CallContext& ctx, const Operands& operands) {
  const auto f_args = static_args(ctx, operands[0], "fork");
  const auto g_args = static_args(ctx, operands[1], "fork");
  const auto args = pop_values(ctx, std::max(f_args, g_args), "fork argument");
  push_values(ctx, args, g_args);
  ctx.call(operands[1]);
  push_values(ctx, args, f_args);
  ctx.call(operands[0]);
}

void try_impl(CallContext& ctx, const Operands& operands) {
  const auto f_args = static_args(ctx, operands[0], "try");
  const auto handler_args = static_args(ctx, operands[1], "try");
  auto saved = ctx.checkpoint();
  try {
    ctx.call(operands[0]);
  } catch (const RuntimeError& error) {
    if (error.kind == RuntimeErrorKind::Interrupted) {
      throw;
    }
    ctx.restore(std::move(saved));
    const auto passed = handler_args > 0 ? handler_args - 1 : 0;
    const auto args = pop_values(ctx, std::max(f_args, passed), "try argument");
    push_values(ctx, args, passed);
    if (handler_args > 0) {
      ctx.push(Array::from_string(error.message()));
    }
    ctx.call(operands[1]);
  }
}

class FillScope {
 public:
  FillScope(CallContext& ctx, Array value) : ctx_(ctx) { ctx_.push_fill(std::move(value)); }
  ~FillScope() { ctx_.pop_fill(); }
  FillScope(const FillScope&) = delete;
  FillScope& operator=(const FillScope&) = delete;

 private:
  CallContext& ctx_;
};

void fill_impl(CallContext& ctx, const Operands& operands) {
  ctx.call(operands[0]);
  FillScope scope(ctx, ctx.pop("fill value"));
  ctx.call(operands[1]);
}

}  // namespace

}  // namespace tacit
