namespace {

std::vector<std::size_t> sorted_row_order(const Array& a, bool descending) {
  const auto rows = a.rows();
  std::vector<std::size_t> order(rows.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    order[i] = i;
  }
  std::stable_sort(order.begin(), order.end(), [&rows, descending](std::size_t x, std::size_t y) {
    const auto cmp = compare_arrays(rows[x], rows[y]);
    return descending ? cmp > 0 : cmp < 0;
  });
  return order;
}

Array index_list(const std::vector<std::size_t>& values) {
  std::vector<double> out(values.begin(), values.end());
  return Array::number_list(std::move(out));
}

// Splits `a` into items shaped like the rows of `haystack`; `leading`
// receives the shape the per-item results are arranged in.
bool split_items(const Array& a, const Array& haystack, Shape& leading, std::vector<Array>& items) {
  const auto item_rank = haystack.rank() - 1;
  if (a.rank() < item_rank) {
    shape_error("Cannot look for a rank " + std::to_string(a.rank()) + " array in the rows of a rank " +
                    std::to_string(haystack.rank()) + " array",
                {operand_info(a), operand_info(haystack)});
  }
  const auto split = a.rank() - item_rank;
  leading.assign(a.shape().begin(), a.shape().begin() + static_cast<std::ptrdiff_t>(split));
  const Shape item_shape(a.shape().begin() + static_cast<std::ptrdiff_t>(split), a.shape().end());
  if (item_shape != haystack.row_shape()) {
    return false;
  }
  Shape flat{shape_product(leading)};
  flat.insert(flat.end(), item_shape.begin(), item_shape.end());
  items = a.reshaped(std::move(flat)).rows();
  return true;
}

}  // namespace

Array rise(const Array& a) {
  if (a.is_scalar()) {
    type_error("Cannot rise a scalar", {operand_info(a)});
  }
  return index_list(sorted_row_order(a, false));
}

Array fall(const Array& a) {
  if (a.is_scalar()) {
    type_error("Cannot fall a scalar", {operand_info(a)});
  }
  return index_list(sorted_row_order(a, true));
}

Array classify(const Array& a) {
  if (a.is_scalar()) {
    type_error("Cannot classify a scalar", {operand_info(a)});
  }
  std::map<Array, std::size_t, ArrayLess> classes;
  std::vector<std::size_t> out;
  for (const auto& row : a.rows()) {
    const auto found = classes.emplace(row, classes.size());
    out.push_back(found.first->second);
  }
  return index_list(out);
}

Array deduplicate(const Array& a) {
  if (a.is_scalar()) {
    return a;
  }
  std::map<Array, std::size_t, ArrayLess> seen;
  std::vector<std::size_t> order;
  const auto rows = a.rows();
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (seen.emplace(rows[i], i).second) {
      order.push_back(i);
    }
  }
  return gather_rows(a, order, {order.size()});
}

Array member(const Array& a, const Array& b) {
  const Array haystack = b.is_scalar() ? b.reshaped(Shape{1}) : b;
  Shape leading;
  std::vector<Array> items;
  if (!split_items(a, haystack, leading, items)) {
    return filled_array<std::uint8_t>(std::move(leading), 0);
  }
  std::map<Array, std::size_t, ArrayLess> rows;
  for (const auto& row : haystack.rows()) {
    rows.emplace(row, 0);
  }
  std::vector<std::uint8_t> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    out.push_back(rows.count(item) ? 1 : 0);
  }
  return Array::from_bytes(std::move(leading), std::move(out));
}

Array index_of(const Array& a, const Array& b) {
  const Array haystack = b.is_scalar() ? b.reshaped(Shape{1}) : b;
  const auto missing = static_cast<double>(haystack.row_count());
  Shape leading;
  std::vector<Array> items;
  if (!split_items(a, haystack, leading, items)) {
    return filled_array<double>(std::move(leading), missing);
  }
  std::map<Array, std::size_t, ArrayLess> first_row;
  const auto rows = haystack.rows();
  for (std::size_t i = 0; i < rows.size(); ++i) {
    first_row.emplace(rows[i], i);
  }
  std::vector<double> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    const auto found = first_row.find(item);
    out.push_back(found == first_row.end() ? missing : static_cast<double>(found->second));
  }
  return Array::from_numbers(std::move(leading), std::move(out));
}

Array find(const Array& pattern, const Array& b) {
  std::vector<Array> parts{pattern, b};
  const bool comparable =
      (pattern.kind() == b.kind()) ||
      ((pattern.holds<double>() || pattern.holds<std::uint8_t>()) &&
       (b.holds<double>() || b.holds<std::uint8_t>()));
  Shape result_shape = b.shape();
  if (!comparable || pattern.rank() > b.rank()) {
    return filled_array<std::uint8_t>(std::move(result_shape), 0);
  }
  unify_kinds(parts);
  Shape window(b.rank() - pattern.rank(), 1);
  window.insert(window.end(), pattern.shape().begin(), pattern.shape().end());
  const auto needle = parts[0].reshaped(window);
  const auto& haystack = parts[1];

  std::vector<std::uint8_t> out(b.element_count(), 0);
  haystack.visit([&](const auto& slice) {
    using T = typename std::decay_t<decltype(slice)>::value_type;
    const auto& pattern_elements = needle.elements<T>();
    const auto rank = haystack.rank();
    std::vector<std::size_t> position(rank, 0);
    for (std::size_t flat = 0; flat < out.size(); ++flat) {
      bool fits = true;
      for (std::size_t axis = 0; axis < rank; ++axis) {
        fits = fits && position[axis] + window[axis] <= haystack.shape()[axis];
      }
      if (fits) {
        bool matches = true;
        std::vector<std::size_t> offset(rank, 0);
        for (std::size_t k = 0; k < pattern_elements.size() && matches; ++k) {
          std::size_t source = 0;
          for (std::size_t axis = 0; axis < rank; ++axis) {
            source = source * haystack.shape()[axis] + position[axis] + offset[axis];
          }
          if constexpr (std::is_same_v<T, Array>) {
            matches = arrays_match(slice[source], pattern_elements[k]);
          } else {
            matches = slice[source] == pattern_elements[k];
          }
          for (std::size_t axis = rank; axis-- > 0;) {
            if (++offset[axis] < window[axis]) {
              break;
            }
            offset[axis] = 0;
          }
        }
        out[flat] = matches ? 1 : 0;
      }
      for (std::size_t axis = rank; axis-- > 0;) {
        if (++position[axis] < haystack.shape()[axis]) {
          break;
        }
        position[axis] = 0;
      }
    }
  });
  return Array::from_bytes(std::move(result_shape), std::move(out));
}

std::vector<Array> group_rows(const Array& indices, const Array& values) {
  const auto groups = as_integer_list(indices, "Group indices must be a list of integers");
  if (groups.size() != values.row_count() || values.is_scalar()) {
    shape_error("Cannot group " + std::to_string(values.row_count()) + " rows with " +
                    std::to_string(groups.size()) + " indices",
                {operand_info(indices), operand_info(values)});
  }
  long long max_group = -1;
  for (const auto group : groups) {
    max_group = std::max(max_group, group);
  }
  std::vector<std::vector<std::size_t>> members(
      checked_element_count(Shape{static_cast<std::size_t>(max_group + 1)}));
  for (std::size_t i = 0; i < groups.size(); ++i) {
    if (groups[i] >= 0) {
      members[static_cast<std::size_t>(groups[i])].push_back(i);
    }
  }
  std::vector<Array> out;
  out.reserve(members.size());
  for (const auto& rows : members) {
    out.push_back(gather_rows(values, rows, {rows.size()}));
  }
  return out;
}

std::vector<Array> partition_rows(const Array& markers, const Array& values) {
  const auto marks = as_integer_list(markers, "Partition markers must be a list of integers");
  if (marks.size() != values.row_count() || values.is_scalar()) {
    shape_error("Cannot partition " + std::to_string(values.row_count()) + " rows with " +
                    std::to_string(marks.size()) + " markers",
                {operand_info(markers), operand_info(values)});
  }
  std::vector<Array> out;
  std::vector<std::size_t> run;
  for (std::size_t i = 0; i <= marks.size(); ++i) {
    const bool continues = i < marks.size() && marks[i] > 0 && !run.empty() && marks[i] == marks[run.back()];
    if (continues) {
      run.push_back(i);
      continue;
    }
    if (!run.empty()) {
      out.push_back(gather_rows(values, run, {run.size()}));
      run.clear();
    }
    if (i < marks.size() && marks[i] > 0) {
      run.push_back(i);
    }
  }
  return out;
}
