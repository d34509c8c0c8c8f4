// Structural array operations. This file only holds the shared helpers;
// each operation family lives in array_structure_parts/ and is compiled as
// part of this translation unit.
//
// Parts:
//   01_rows.cpp      from_rows, couple, join
//   02_reshape.cpp   reshape, deshape, transpose, take, drop, rotate, first, reverse
//   03_indexing.cpp  range, select, pick, keep, where
//   04_search.cpp    rise, fall, classify, deduplicate, member, index_of, find, grouping
//   05_boxing.cpp    box, unbox, match, length, shape, rank, random

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "tacit/array_ops.h"
#include "tacit/diagnostics.h"

namespace tacit {

namespace {

[[noreturn]] void shape_error(const std::string& message, std::vector<OperandInfo> operands = {}) {
  throw RuntimeError(RuntimeErrorKind::ShapeMismatch, message, std::move(operands));
}

[[noreturn]] void type_error(const std::string& message, std::vector<OperandInfo> operands = {}) {
  throw RuntimeError(RuntimeErrorKind::TypeMismatch, message, std::move(operands));
}

[[noreturn]] void index_error(const std::string& message, std::vector<OperandInfo> operands = {}) {
  throw RuntimeError(RuntimeErrorKind::IndexOutOfBounds, message, std::move(operands));
}

struct ArrayLess {
  bool operator()(const Array& a, const Array& b) const { return compare_arrays(a, b) < 0; }
};

template <typename T>
Array filled_array(Shape shape, const T& fill) {
  const auto count = checked_element_count(shape);
  return Array::from_storage(std::move(shape), CowSlice<T>(std::vector<T>(count, fill)));
}

// Brings every value to one element kind: any box boxes everything, bytes
// widen to numbers, characters never mix with numbers.
void unify_kinds(std::vector<Array>& values) {
  bool any_box = false;
  bool any_char = false;
  bool any_numeric = false;
  bool any_number = false;
  for (const auto& value : values) {
    switch (value.kind()) {
      case ElementKind::Box:
        any_box = true;
        break;
      case ElementKind::Char:
        any_char = true;
        break;
      case ElementKind::Number:
        any_number = true;
        any_numeric = true;
        break;
      case ElementKind::Byte:
        any_numeric = true;
        break;
    }
  }
  if (any_box) {
    for (auto& value : values) {
      value = value.as_boxes();
    }
    return;
  }
  if (any_char && any_numeric) {
    std::vector<OperandInfo> infos;
    for (const auto& value : values) {
      infos.push_back(operand_info(value));
    }
    type_error("Cannot combine character and number arrays", std::move(infos));
  }
  if (any_number) {
    for (auto& value : values) {
      value = value.as_numbers();
    }
  }
}

// Copies the region of `src` described by per-axis starts and counts into
// `dst` at per-axis starts. Both buffers have the same rank.
template <typename T>
void copy_region(const T* src, const Shape& src_shape, const std::vector<std::size_t>& src_start,
                 T* dst, const Shape& dst_shape, const std::vector<std::size_t>& dst_start,
                 const std::vector<std::size_t>& counts, std::size_t axis, std::size_t src_offset,
                 std::size_t dst_offset) {
  if (axis == src_shape.size()) {
    dst[dst_offset] = src[src_offset];
    return;
  }
  const auto src_stride = shape_product(src_shape, axis + 1);
  const auto dst_stride = shape_product(dst_shape, axis + 1);
  for (std::size_t i = 0; i < counts[axis]; ++i) {
    copy_region(src, src_shape, src_start, dst, dst_shape, dst_start, counts, axis + 1,
                src_offset + (src_start[axis] + i) * src_stride,
                dst_offset + (dst_start[axis] + i) * dst_stride);
  }
}

template <typename T>
Array resize_region(const Array& source, const Shape& dst_shape,
                    const std::vector<std::size_t>& src_start,
                    const std::vector<std::size_t>& dst_start,
                    const std::vector<std::size_t>& counts, const T& fill) {
  std::vector<T> out(checked_element_count(dst_shape), fill);
  bool any = true;
  for (const auto count : counts) {
    any = any && count > 0;
  }
  if (any && !out.empty()) {
    copy_region(source.elements<T>().data(), source.shape(), src_start, out.data(), dst_shape,
                dst_start, counts, 0, 0, 0);
  }
  return Array::from_storage(dst_shape, CowSlice<T>(std::move(out)));
}

// Pads (or truncates) `source` to `dst_shape` of the same rank, anchored at
// the origin.
template <typename T>
Array pad_to_shape(const Array& source, const Shape& dst_shape, const T& fill) {
  std::vector<std::size_t> zeros(dst_shape.size(), 0);
  std::vector<std::size_t> counts(dst_shape.size(), 0);
  for (std::size_t axis = 0; axis < dst_shape.size(); ++axis) {
    counts[axis] = std::min(source.shape()[axis], dst_shape[axis]);
  }
  return resize_region<T>(source, dst_shape, zeros, zeros, counts, fill);
}

// Concatenates the element buffers of same-kind arrays into one array.
Array concat_elements(const std::vector<Array>& parts, Shape shape) {
  return parts.front().visit([&](const auto& first) {
    using T = typename std::decay_t<decltype(first)>::value_type;
    std::vector<T> out;
    out.reserve(shape_product(shape));
    for (const auto& part : parts) {
      const auto& slice = part.elements<T>();
      out.insert(out.end(), slice.begin(), slice.end());
    }
    return Array::from_storage(std::move(shape), CowSlice<T>(std::move(out)));
  });
}

// Builds an array from selected rows of `source`; result shape is
// `leading ++ row_shape(source)`.
Array gather_rows(const Array& source, const std::vector<std::size_t>& indices, Shape leading) {
  Shape shape = std::move(leading);
  const auto row_shape = source.row_shape();
  shape.insert(shape.end(), row_shape.begin(), row_shape.end());
  const auto len = source.row_len();
  return source.visit([&](const auto& slice) {
    using T = typename std::decay_t<decltype(slice)>::value_type;
    std::vector<T> out;
    out.reserve(indices.size() * len);
    for (const auto index : indices) {
      const auto* begin = slice.data() + index * len;
      out.insert(out.end(), begin, begin + len);
    }
    return Array::from_storage(std::move(shape), CowSlice<T>(std::move(out)));
  });
}

// Array of `shape` filled with the active fill for the kind of `like`.
Array fill_like(const Array& like, const Shape& shape, const FillContext& fill, const char* what) {
  return like.visit([&](const auto& slice) -> Array {
    using T = typename std::decay_t<decltype(slice)>::value_type;
    const auto value = fill.get<T>();
    if (!value) {
      index_error(what, {operand_info(like)});
    }
    return filled_array<T>(shape, *value);
  });
}

std::vector<std::size_t> natural_shape_argument(const Array& value) {
  return as_natural_list(value, "Shape must be a list of natural numbers");
}

std::size_t normalize_index(long long index, std::size_t length, bool& in_bounds) {
  const auto signed_length = static_cast<long long>(length);
  if (index < 0) {
    index += signed_length;
  }
  in_bounds = index >= 0 && index < signed_length;
  return in_bounds ? static_cast<std::size_t>(index) : 0;
}

}  // namespace

#include "array_structure_parts/01_rows.cpp"
#include "array_structure_parts/02_reshape.cpp"
#include "array_structure_parts/03_indexing.cpp"
#include "array_structure_parts/04_search.cpp"
#include "array_structure_parts/05_boxing.cpp"

}  // namespace tacit
