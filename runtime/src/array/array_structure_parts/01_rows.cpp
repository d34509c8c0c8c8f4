namespace {

// Lifts lower-rank rows with leading unit axes and pads every row to the
// elementwise maximum shape.
std::vector<Array> pad_rows(std::vector<Array> rows, const FillContext& fill) {
  std::size_t max_rank = 0;
  for (const auto& row : rows) {
    max_rank = std::max(max_rank, row.rank());
  }
  Shape target(max_rank, 0);
  for (auto& row : rows) {
    if (row.rank() < max_rank) {
      Shape lifted(max_rank - row.rank(), 1);
      lifted.insert(lifted.end(), row.shape().begin(), row.shape().end());
      row = row.reshaped(std::move(lifted));
    }
    for (std::size_t axis = 0; axis < max_rank; ++axis) {
      target[axis] = std::max(target[axis], row.shape()[axis]);
    }
  }
  for (auto& row : rows) {
    if (row.shape() == target) {
      continue;
    }
    row = row.visit([&](const auto& slice) -> Array {
      using T = typename std::decay_t<decltype(slice)>::value_type;
      const auto value = fill.get<T>();
      if (!value) {
        std::vector<OperandInfo> infos;
        for (const auto& other : rows) {
          infos.push_back(operand_info(other));
        }
        shape_error("Cannot combine arrays of shapes " + format_shape(row.shape()) + " and " +
                        format_shape(target),
                    std::move(infos));
      }
      return pad_to_shape<T>(row, target, *value);
    });
  }
  return rows;
}

}  // namespace

Array from_rows(std::vector<Array> rows, const FillContext& fill) {
  if (rows.empty()) {
    return Array();
  }
  unify_kinds(rows);
  bool uniform = true;
  for (const auto& row : rows) {
    uniform = uniform && row.shape() == rows.front().shape();
  }
  if (!uniform) {
    if (!fill.active()) {
      std::vector<OperandInfo> infos;
      for (const auto& row : rows) {
        infos.push_back(operand_info(row));
      }
      shape_error("Cannot combine arrays of shapes " + format_shape(rows.front().shape()) +
                      " and " + format_shape(rows.back().shape()),
                  std::move(infos));
    }
    rows = pad_rows(std::move(rows), fill);
  }
  Shape shape{rows.size()};
  const auto& row_shape = rows.front().shape();
  shape.insert(shape.end(), row_shape.begin(), row_shape.end());
  return concat_elements(rows, std::move(shape));
}

Array from_rows_boxed(std::vector<Array> rows) {
  std::vector<Array> boxes;
  boxes.reserve(rows.size());
  for (auto& row : rows) {
    boxes.push_back(Array::boxed(std::move(row)));
  }
  Shape shape{boxes.size()};
  return Array::from_boxes(std::move(shape), std::move(boxes));
}

Array couple(const Array& a, const Array& b, const FillContext& fill) {
  return from_rows({a, b}, fill);
}

Array join(const Array& a, const Array& b, const FillContext& fill) {
  if (a.rank() == 0 && b.rank() == 0) {
    return from_rows({a, b}, fill);
  }
  if (a.rank() + 1 == b.rank()) {
    std::vector<Array> rows{a};
    for (auto& row : b.rows()) {
      rows.push_back(std::move(row));
    }
    return from_rows(std::move(rows), fill);
  }
  if (a.rank() == b.rank() + 1) {
    auto rows = a.rows();
    rows.push_back(b);
    return from_rows(std::move(rows), fill);
  }
  if (a.rank() != b.rank()) {
    shape_error("Cannot join arrays of rank " + std::to_string(a.rank()) + " and " +
                    std::to_string(b.rank()),
                {operand_info(a), operand_info(b)});
  }

  std::vector<Array> parts{a, b};
  unify_kinds(parts);
  if (a.row_shape() != b.row_shape()) {
    if (!fill.active()) {
      shape_error("Cannot join arrays of shapes " + format_shape(a.shape()) + " and " +
                      format_shape(b.shape()),
                  {operand_info(a), operand_info(b)});
    }
    Shape row_target(a.rank() - 1, 0);
    for (std::size_t axis = 0; axis + 1 < a.rank(); ++axis) {
      row_target[axis] = std::max(a.shape()[axis + 1], b.shape()[axis + 1]);
    }
    for (auto& part : parts) {
      Shape target{part.row_count()};
      target.insert(target.end(), row_target.begin(), row_target.end());
      part = part.visit([&](const auto& slice) -> Array {
        using T = typename std::decay_t<decltype(slice)>::value_type;
        const auto value = fill.get<T>();
        if (!value) {
          shape_error("No fill value for " + std::string(element_kind_name(part.kind())) +
                          " arrays",
                      {operand_info(part)});
        }
        return pad_to_shape<T>(part, target, *value);
      });
    }
  }
  Shape shape{parts[0].row_count() + parts[1].row_count()};
  const auto row_shape = parts[0].row_shape();
  shape.insert(shape.end(), row_shape.begin(), row_shape.end());
  return concat_elements(parts, std::move(shape));
}
