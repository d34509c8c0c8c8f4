#include <cmath>
#include <cstdint>

#include "tacit/array_ops.h"

namespace tacit {

namespace {

int kind_rank(ElementKind kind) {
  switch (kind) {
    case ElementKind::Byte:
    case ElementKind::Number:
      return 0;
    case ElementKind::Char:
      return 1;
    case ElementKind::Box:
      return 2;
  }
  return 3;
}

int compare_numbers(double a, double b) {
  const bool a_nan = std::isnan(a);
  const bool b_nan = std::isnan(b);
  if (a_nan || b_nan) {
    return a_nan == b_nan ? 0 : (a_nan ? 1 : -1);
  }
  return a < b ? -1 : (a > b ? 1 : 0);
}

double numeric_at(const Array& value, std::size_t index) {
  if (value.holds<std::uint8_t>()) {
    return value.elements<std::uint8_t>()[index];
  }
  return value.elements<double>()[index];
}

}  // namespace

int compare_arrays(const Array& a, const Array& b) {
  const auto a_rank = kind_rank(a.kind());
  const auto b_rank = kind_rank(b.kind());
  if (a_rank != b_rank) {
    return a_rank < b_rank ? -1 : 1;
  }
  if (a.rank() != b.rank()) {
    return a.rank() < b.rank() ? -1 : 1;
  }
  for (std::size_t axis = 0; axis < a.rank(); ++axis) {
    if (a.shape()[axis] != b.shape()[axis]) {
      return a.shape()[axis] < b.shape()[axis] ? -1 : 1;
    }
  }

  const auto count = a.element_count();
  if (a_rank == 0) {
    if (a.holds<std::uint8_t>() && b.holds<std::uint8_t>()) {
      const auto& x = a.elements<std::uint8_t>();
      const auto& y = b.elements<std::uint8_t>();
      for (std::size_t i = 0; i < count; ++i) {
        if (x[i] != y[i]) {
          return x[i] < y[i] ? -1 : 1;
        }
      }
      return 0;
    }
    for (std::size_t i = 0; i < count; ++i) {
      const auto cmp = compare_numbers(numeric_at(a, i), numeric_at(b, i));
      if (cmp != 0) {
        return cmp;
      }
    }
    return 0;
  }
  if (a_rank == 1) {
    const auto& x = a.elements<char32_t>();
    const auto& y = b.elements<char32_t>();
    for (std::size_t i = 0; i < count; ++i) {
      if (x[i] != y[i]) {
        return x[i] < y[i] ? -1 : 1;
      }
    }
    return 0;
  }
  const auto& x = a.elements<Array>();
  const auto& y = b.elements<Array>();
  for (std::size_t i = 0; i < count; ++i) {
    const auto cmp = compare_arrays(x[i], y[i]);
    if (cmp != 0) {
      return cmp;
    }
  }
  return 0;
}

bool arrays_match(const Array& a, const Array& b) {
  return compare_arrays(a, b) == 0;
}

}  // namespace tacit
