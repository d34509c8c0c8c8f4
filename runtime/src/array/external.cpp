#include "tacit/external.h"

#include <utility>

namespace tacit {

ExternalArray export_array(const Array& value) {
  ExternalArray out;
  out.kind = value.kind();
  out.shape = value.shape();
  switch (out.kind) {
    case ElementKind::Byte:
      out.bytes = value.elements<std::uint8_t>().to_vector();
      break;
    case ElementKind::Number:
      out.numbers = value.elements<double>().to_vector();
      break;
    case ElementKind::Char:
      out.chars = value.elements<char32_t>().to_vector();
      break;
    case ElementKind::Box:
      for (const auto& inner : value.elements<Array>()) {
        out.boxes.push_back(export_array(inner));
      }
      break;
  }
  return out;
}

Array import_array(const ExternalArray& value) {
  switch (value.kind) {
    case ElementKind::Byte:
      return Array::from_bytes(value.shape, value.bytes);
    case ElementKind::Number:
      return Array::from_numbers(value.shape, value.numbers);
    case ElementKind::Char:
      return Array::from_chars(value.shape, value.chars);
    case ElementKind::Box: {
      std::vector<Array> boxes;
      boxes.reserve(value.boxes.size());
      for (const auto& inner : value.boxes) {
        boxes.push_back(import_array(inner));
      }
      return Array::from_boxes(value.shape, std::move(boxes));
    }
  }
  return Array();
}

}  // namespace tacit
