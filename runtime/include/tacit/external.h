#pragma once

#include <cstdint>
#include <vector>

#include "tacit/array.h"

namespace tacit {

// Storage-independent view of an array for code outside the core. Only the
// vector matching `kind` is populated.
struct ExternalArray {
  ElementKind kind = ElementKind::Number;
  Shape shape;
  std::vector<std::uint8_t> bytes;
  std::vector<double> numbers;
  std::vector<char32_t> chars;
  std::vector<ExternalArray> boxes;
};

ExternalArray export_array(const Array& value);
Array import_array(const ExternalArray& value);

}  // namespace tacit
