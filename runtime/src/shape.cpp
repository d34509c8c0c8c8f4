#include "tacit/shape.h"

#include <limits>
#include <sstream>
#include <string>

#include "tacit/diagnostics.h"

namespace tacit {

const char* element_kind_name(ElementKind kind) {
  switch (kind) {
    case ElementKind::Byte:
      return "byte";
    case ElementKind::Number:
      return "number";
    case ElementKind::Char:
      return "character";
    case ElementKind::Box:
      return "box";
  }
  return "unknown";
}

std::size_t shape_product(const Shape& shape) {
  return shape_product(shape, 0);
}

std::size_t shape_product(const Shape& shape, std::size_t first_axis) {
  for (std::size_t i = first_axis; i < shape.size(); ++i) {
    if (shape[i] == 0) {
      return 0;
    }
  }
  std::size_t product = 1;
  for (std::size_t i = first_axis; i < shape.size(); ++i) {
    if (product > std::numeric_limits<std::size_t>::max() / shape[i]) {
      throw RuntimeError(RuntimeErrorKind::ShapeMismatch,
                         "Shape " + format_shape(shape) + " has too many elements");
    }
    product *= shape[i];
  }
  return product;
}

std::size_t checked_element_count(const Shape& shape) {
  const auto count = shape_product(shape);
  if (count > kMaxElementCount) {
    throw RuntimeError(RuntimeErrorKind::ShapeMismatch,
                       "Shape " + format_shape(shape) + " has " + std::to_string(count) +
                           " elements, more than the limit of " +
                           std::to_string(kMaxElementCount));
  }
  return count;
}

Shape row_shape_of(const Shape& shape) {
  if (shape.empty()) {
    return {};
  }
  return Shape(shape.begin() + 1, shape.end());
}

bool shape_has_prefix(const Shape& shape, const Shape& prefix) {
  if (prefix.size() > shape.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (shape[i] != prefix[i]) {
      return false;
    }
  }
  return true;
}

std::string format_shape(const Shape& shape) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) {
      out << " × ";
    }
    out << shape[i];
  }
  out << "]";
  return out.str();
}

}  // namespace tacit
