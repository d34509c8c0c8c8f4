#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tacit {

using Shape = std::vector<std::size_t>;

enum class ElementKind {
  Byte,
  Number,
  Char,
  Box,
};

const char* element_kind_name(ElementKind kind);

// Largest element count an operation may allocate.
constexpr std::size_t kMaxElementCount = std::size_t{1} << 32;

// Throws RuntimeError{ShapeMismatch} when the product overflows.
std::size_t shape_product(const Shape& shape);
std::size_t shape_product(const Shape& shape, std::size_t first_axis);
// shape_product that also rejects counts above kMaxElementCount. Called
// before allocating a new buffer for `shape`.
std::size_t checked_element_count(const Shape& shape);
Shape row_shape_of(const Shape& shape);
bool shape_has_prefix(const Shape& shape, const Shape& prefix);
std::string format_shape(const Shape& shape);

}  // namespace tacit
