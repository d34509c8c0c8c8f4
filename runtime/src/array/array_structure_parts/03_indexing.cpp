Array range(const Array& a) {
  if (a.is_scalar()) {
    const auto count = checked_element_count(
        Shape{as_natural(a, "Range max must be a natural number")});
    std::vector<double> out(count);
    for (std::size_t i = 0; i < count; ++i) {
      out[i] = static_cast<double>(i);
    }
    return Array::number_list(std::move(out));
  }
  const auto dims = as_natural_list(a, "Range max must be a natural number or list of natural numbers");
  Shape shape(dims.begin(), dims.end());
  shape.push_back(dims.size());
  const auto cells = shape_product(Shape(dims.begin(), dims.end()));
  std::vector<double> out;
  out.reserve(checked_element_count(shape));
  std::vector<std::size_t> index(dims.size(), 0);
  for (std::size_t cell = 0; cell < cells; ++cell) {
    for (const auto coordinate : index) {
      out.push_back(static_cast<double>(coordinate));
    }
    for (std::size_t axis = dims.size(); axis-- > 0;) {
      if (++index[axis] < dims[axis]) {
        break;
      }
      index[axis] = 0;
    }
  }
  return Array::from_numbers(std::move(shape), std::move(out));
}

Array select(const Array& indices, const Array& b, const FillContext& fill) {
  if (b.is_scalar()) {
    shape_error("Cannot select from a scalar", {operand_info(indices), operand_info(b)});
  }
  if (indices.holds<char32_t>() || indices.holds<Array>()) {
    type_error("Indices must be integers", {operand_info(indices)});
  }
  const auto numbers = indices.as_numbers();
  const auto& raw = numbers.elements<double>();
  const auto rows = b.row_count();
  std::vector<std::size_t> order;
  order.reserve(raw.size());
  bool all_in_bounds = true;
  std::vector<bool> in_bounds(raw.size(), true);
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const auto value = raw[i];
    if (std::floor(value) != value) {
      type_error("Indices must be integers, but one is " + number_to_string(value),
                 {operand_info(indices)});
    }
    bool ok = false;
    // Anything this large is outside every array.
    if (std::fabs(value) < 9007199254740992.0) {
      order.push_back(normalize_index(static_cast<long long>(value), rows, ok));
    } else {
      order.push_back(0);
    }
    in_bounds[i] = ok;
    all_in_bounds = all_in_bounds && ok;
  }
  if (all_in_bounds) {
    return gather_rows(b, order, indices.shape());
  }

  std::vector<Array> picked;
  picked.reserve(order.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    if (in_bounds[i]) {
      picked.push_back(b.row(order[i]));
      continue;
    }
    picked.push_back(fill_like(b, b.row_shape(), fill,
                               ("Index " + number_to_string(raw[i]) + " is out of bounds of length " +
                                std::to_string(rows))
                                   .c_str()));
  }
  auto combined = from_rows(std::move(picked), FillContext{});
  Shape shape = indices.shape();
  const auto row_shape = b.row_shape();
  shape.insert(shape.end(), row_shape.begin(), row_shape.end());
  return combined.reshaped(std::move(shape));
}

Array pick(const Array& index, const Array& b, const FillContext& fill) {
  if (index.rank() >= 2) {
    std::vector<Array> picked;
    for (const auto& row : index.rows()) {
      picked.push_back(pick(row, b, fill));
    }
    if (picked.empty()) {
      return Array();
    }
    return from_rows(std::move(picked), fill);
  }
  const auto coordinates = as_integer_list(index, "Index must be an integer or list of integers");
  if (coordinates.size() > b.rank()) {
    shape_error("Cannot pick with " + std::to_string(coordinates.size()) +
                    " indices from a rank " + std::to_string(b.rank()) + " array",
                {operand_info(index), operand_info(b)});
  }
  std::size_t offset = 0;
  for (std::size_t axis = 0; axis < coordinates.size(); ++axis) {
    bool ok = false;
    const auto position = normalize_index(coordinates[axis], b.shape()[axis], ok);
    if (!ok) {
      const Shape rest(b.shape().begin() + static_cast<std::ptrdiff_t>(coordinates.size()),
                       b.shape().end());
      return fill_like(b, rest, fill,
                       ("Index " + std::to_string(coordinates[axis]) + " is out of bounds of length " +
                        std::to_string(b.shape()[axis]))
                           .c_str());
    }
    offset = offset * b.shape()[axis] + position;
  }
  Shape rest(b.shape().begin() + static_cast<std::ptrdiff_t>(coordinates.size()), b.shape().end());
  const auto len = shape_product(rest);
  return b.visit([&](const auto& slice) {
    return Array::from_storage(std::move(rest), slice.slice(offset * len, (offset + 1) * len));
  });
}

Array keep(const Array& counts, const Array& b) {
  const auto rows = b.row_count();
  std::vector<std::size_t> order;
  if (counts.is_scalar()) {
    const auto times = as_natural(counts, "Keep amount must be a natural number or list of natural numbers");
    order.reserve(checked_element_count(Shape{rows, times}));
    for (std::size_t i = 0; i < rows; ++i) {
      order.insert(order.end(), times, i);
    }
  } else {
    const auto amounts =
        as_natural_list(counts, "Keep amount must be a natural number or list of natural numbers");
    if (amounts.size() != rows) {
      shape_error("Cannot keep with " + std::to_string(amounts.size()) + " counts for " +
                      std::to_string(rows) + " rows",
                  {operand_info(counts), operand_info(b)});
    }
    std::size_t total = 0;
    for (const auto amount : amounts) {
      total = checked_element_count(Shape{total + std::min(amount, kMaxElementCount + 1)});
    }
    order.reserve(total);
    for (std::size_t i = 0; i < rows; ++i) {
      order.insert(order.end(), amounts[i], i);
    }
  }
  const Array source = b.is_scalar() ? b.reshaped(Shape{1}) : b;
  return gather_rows(source, order, {order.size()});
}

Array where(const Array& a) {
  const auto counts = as_natural_list(a, "Argument to where must be a list of natural numbers");
  std::size_t total = 0;
  for (const auto count : counts) {
    total = checked_element_count(Shape{total + std::min(count, kMaxElementCount + 1)});
  }
  std::vector<double> out;
  out.reserve(total);
  for (std::size_t i = 0; i < counts.size(); ++i) {
    out.insert(out.end(), counts[i], static_cast<double>(i));
  }
  return Array::number_list(std::move(out));
}
