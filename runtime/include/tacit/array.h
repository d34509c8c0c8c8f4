#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "tacit/cow_slice.h"
#include "tacit/shape.h"

namespace tacit {

class WorkerPool;

// A rank-polymorphic array: a shape plus a flat row-major buffer of exactly
// one element kind. Arrays never change once built; storage is shared and
// copy-on-write, so rows, reshapes and copies are O(1).
class Array {
 public:
  Array();

  static Array number(double value);
  static Array byte(std::uint8_t value);
  static Array character(char32_t value);
  static Array boxed(Array value);

  static Array from_numbers(Shape shape, std::vector<double> values);
  static Array from_bytes(Shape shape, std::vector<std::uint8_t> values);
  static Array from_chars(Shape shape, std::vector<char32_t> values);
  static Array from_boxes(Shape shape, std::vector<Array> values);
  static Array number_list(std::vector<double> values);
  static Array from_string(std::string_view utf8);

  template <typename T>
  static Array from_storage(Shape shape, CowSlice<T> storage);

  ElementKind kind() const;
  const Shape& shape() const { return shape_; }
  std::size_t rank() const { return shape_.size(); }
  std::size_t element_count() const;
  std::size_t row_count() const { return shape_.empty() ? 1 : shape_[0]; }
  std::size_t row_len() const { return shape_product(shape_, 1); }
  Shape row_shape() const { return row_shape_of(shape_); }
  bool is_scalar() const { return shape_.empty(); }

  template <typename T>
  bool holds() const {
    return std::holds_alternative<CowSlice<T>>(storage_);
  }

  template <typename T>
  const CowSlice<T>& elements() const {
    return std::get<CowSlice<T>>(storage_);
  }

  template <typename T>
  T* mutable_elements() {
    return std::get<CowSlice<T>>(storage_).make_mut();
  }

  template <typename F>
  decltype(auto) visit(F&& fn) const {
    return std::visit(std::forward<F>(fn), storage_);
  }

  Array row(std::size_t index) const;
  std::vector<Array> rows() const;
  Array reshaped(Shape shape) const;
  Array as_numbers() const;
  Array as_boxes() const;

  bool shares_storage_with(const Array& other) const;
  std::string show() const;

 private:
  using Storage = std::variant<CowSlice<std::uint8_t>, CowSlice<double>, CowSlice<char32_t>,
                               CowSlice<Array>>;

  Array(Shape shape, Storage storage);

  Shape shape_;
  Storage storage_;
};

template <typename T>
struct ElementTraits;

template <>
struct ElementTraits<std::uint8_t> {
  static constexpr ElementKind kind = ElementKind::Byte;
};

template <>
struct ElementTraits<double> {
  static constexpr ElementKind kind = ElementKind::Number;
};

template <>
struct ElementTraits<char32_t> {
  static constexpr ElementKind kind = ElementKind::Char;
};

template <>
struct ElementTraits<Array> {
  static constexpr ElementKind kind = ElementKind::Box;
};

// Fill state consulted by ragged structural operations and by pervasion
// across mismatched shapes. `value` is the explicit ⬚ fill; `defaults`
// enables 0 / NUL / empty box for kinds the explicit fill does not cover.
struct FillContext {
  std::optional<Array> value;
  bool defaults = false;

  template <typename T>
  std::optional<T> get() const;

  bool active() const { return value.has_value() || defaults; }
};

template <>
std::optional<double> FillContext::get<double>() const;
template <>
std::optional<std::uint8_t> FillContext::get<std::uint8_t>() const;
template <>
std::optional<char32_t> FillContext::get<char32_t>() const;
template <>
std::optional<Array> FillContext::get<Array>() const;

// Everything an array operation may consult besides its operands.
struct OpContext {
  FillContext fill;
  WorkerPool* pool = nullptr;
  std::size_t parallel_min_elements = 0;
  std::size_t chunk_elements = 0;
};

template <typename T>
Array Array::from_storage(Shape shape, CowSlice<T> storage) {
  return Array(std::move(shape), Storage(std::move(storage)));
}

std::string number_to_string(double value);

}  // namespace tacit
