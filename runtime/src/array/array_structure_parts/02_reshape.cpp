Array reshape(const Array& shape_value, const Array& b, const FillContext& fill) {
  Shape target = natural_shape_argument(shape_value);
  const auto target_count = checked_element_count(target);
  const auto source_count = b.element_count();
  if (target_count == source_count) {
    return b.reshaped(std::move(target));
  }
  return b.visit([&](const auto& slice) -> Array {
    using T = typename std::decay_t<decltype(slice)>::value_type;
    const auto fill_value = fill.get<T>();
    if (source_count == 0) {
      if (!fill_value) {
        shape_error("Cannot reshape an empty array to shape " + format_shape(target),
                    {operand_info(shape_value), operand_info(b)});
      }
      return filled_array<T>(std::move(target), *fill_value);
    }
    if (target_count < source_count) {
      return Array::from_storage(std::move(target), slice.slice(0, target_count));
    }
    std::vector<T> out;
    out.reserve(target_count);
    out.insert(out.end(), slice.begin(), slice.end());
    if (fill_value) {
      out.resize(target_count, *fill_value);
    } else {
      for (std::size_t i = source_count; i < target_count; ++i) {
        out.push_back(slice[i % source_count]);
      }
    }
    return Array::from_storage(std::move(target), CowSlice<T>(std::move(out)));
  });
}

Array deshape(const Array& a) {
  return a.reshaped(Shape{a.element_count()});
}

Array transpose(const Array& a) {
  if (a.rank() < 2) {
    return a;
  }
  const auto leading = a.shape()[0];
  const auto rest = a.row_len();
  Shape shape(a.shape().begin() + 1, a.shape().end());
  shape.push_back(leading);
  return a.visit([&](const auto& slice) {
    using T = typename std::decay_t<decltype(slice)>::value_type;
    std::vector<T> out;
    out.reserve(slice.size());
    for (std::size_t j = 0; j < rest; ++j) {
      for (std::size_t i = 0; i < leading; ++i) {
        out.push_back(slice[i * rest + j]);
      }
    }
    return Array::from_storage(std::move(shape), CowSlice<T>(std::move(out)));
  });
}

Array take(const Array& count, const Array& b, const FillContext& fill) {
  const auto counts = as_integer_list(count, "Take amount must be an integer or list of integers");
  if (counts.size() > b.rank()) {
    shape_error("Cannot take along " + std::to_string(counts.size()) + " axes of a rank " +
                    std::to_string(b.rank()) + " array",
                {operand_info(count), operand_info(b)});
  }

  // Leading-axis take within bounds keeps sharing storage.
  if (counts.size() == 1 && counts[0] >= 0 &&
      static_cast<std::size_t>(counts[0]) <= b.row_count()) {
    const auto rows = static_cast<std::size_t>(counts[0]);
    const auto len = b.row_len();
    Shape shape = b.shape();
    shape[0] = rows;
    return b.visit([&](const auto& slice) {
      return Array::from_storage(std::move(shape), slice.slice(0, rows * len));
    });
  }

  Shape shape = b.shape();
  std::vector<std::size_t> src_start(b.rank(), 0);
  std::vector<std::size_t> dst_start(b.rank(), 0);
  std::vector<std::size_t> copies(b.shape());
  bool needs_fill = false;
  for (std::size_t axis = 0; axis < counts.size(); ++axis) {
    const auto length = b.shape()[axis];
    const auto wanted = static_cast<std::size_t>(counts[axis] < 0 ? -counts[axis] : counts[axis]);
    shape[axis] = wanted;
    copies[axis] = std::min(wanted, length);
    needs_fill = needs_fill || wanted > length;
    if (counts[axis] < 0) {
      src_start[axis] = length > wanted ? length - wanted : 0;
      dst_start[axis] = wanted > length ? wanted - length : 0;
    }
  }
  return b.visit([&](const auto& slice) -> Array {
    using T = typename std::decay_t<decltype(slice)>::value_type;
    T fill_value{};
    if (needs_fill) {
      const auto value = fill.get<T>();
      if (!value) {
        index_error("Cannot take " + std::to_string(counts[0]) + " rows from an array of shape " +
                        format_shape(b.shape()),
                    {operand_info(count), operand_info(b)});
      }
      fill_value = *value;
    }
    return resize_region<T>(b, shape, src_start, dst_start, copies, fill_value);
  });
}

Array drop(const Array& count, const Array& b) {
  const auto counts = as_integer_list(count, "Drop amount must be an integer or list of integers");
  if (counts.size() > b.rank()) {
    shape_error("Cannot drop along " + std::to_string(counts.size()) + " axes of a rank " +
                    std::to_string(b.rank()) + " array",
                {operand_info(count), operand_info(b)});
  }
  Shape shape = b.shape();
  std::vector<std::size_t> src_start(b.rank(), 0);
  std::vector<std::size_t> dst_start(b.rank(), 0);
  for (std::size_t axis = 0; axis < counts.size(); ++axis) {
    const auto length = b.shape()[axis];
    const auto amount = static_cast<std::size_t>(counts[axis] < 0 ? -counts[axis] : counts[axis]);
    shape[axis] = amount >= length ? 0 : length - amount;
    if (counts[axis] > 0) {
      src_start[axis] = std::min(amount, length);
    }
  }
  if (counts.size() == 1) {
    const auto len = b.row_len();
    return b.visit([&](const auto& slice) {
      const auto begin = src_start[0] * len;
      const auto finish = begin + shape[0] * len;
      return Array::from_storage(std::move(shape), slice.slice(begin, finish));
    });
  }
  return b.visit([&](const auto& slice) {
    using T = typename std::decay_t<decltype(slice)>::value_type;
    return resize_region<T>(b, shape, src_start, dst_start, shape, T{});
  });
}

namespace {

Array rotate_axes(const Array& b, const std::vector<long long>& counts, std::size_t axis) {
  if (axis == counts.size() || b.rank() == 0) {
    return b;
  }
  const auto rows = b.row_count();
  std::vector<std::size_t> order(rows);
  if (rows > 0) {
    const auto signed_rows = static_cast<long long>(rows);
    const auto shift = ((counts[axis] % signed_rows) + signed_rows) % signed_rows;
    for (std::size_t i = 0; i < rows; ++i) {
      order[i] = (i + static_cast<std::size_t>(shift)) % rows;
    }
  }
  auto rotated = gather_rows(b, order, {rows});
  if (axis + 1 == counts.size()) {
    return rotated;
  }
  std::vector<Array> inner;
  inner.reserve(rows);
  for (const auto& row : rotated.rows()) {
    inner.push_back(rotate_axes(row, counts, axis + 1));
  }
  if (inner.empty()) {
    return rotated;
  }
  return from_rows(std::move(inner), FillContext{});
}

}  // namespace

Array rotate(const Array& count, const Array& b) {
  const auto counts = as_integer_list(count, "Rotation amount must be an integer or list of integers");
  if (counts.size() > b.rank()) {
    shape_error("Cannot rotate along " + std::to_string(counts.size()) + " axes of a rank " +
                    std::to_string(b.rank()) + " array",
                {operand_info(count), operand_info(b)});
  }
  return rotate_axes(b, counts, 0);
}

Array first(const Array& a, const FillContext& fill) {
  if (a.is_scalar()) {
    type_error("Cannot take the first row of a scalar", {operand_info(a)});
  }
  if (a.row_count() == 0) {
    return fill_like(a, a.row_shape(), fill, "Cannot take the first row of an empty array");
  }
  return a.row(0);
}

Array reverse(const Array& a) {
  if (a.is_scalar()) {
    return a;
  }
  const auto rows = a.row_count();
  std::vector<std::size_t> order(rows);
  for (std::size_t i = 0; i < rows; ++i) {
    order[i] = rows - 1 - i;
  }
  return gather_rows(a, order, {rows});
}
