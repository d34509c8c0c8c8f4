#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

#include "tacit/array.h"
#include "tacit/diagnostics.h"
#include "tacit/utf8.h"

namespace tacit {

namespace {

template <typename T>
CowSlice<T> make_storage(std::vector<T> values) {
  return CowSlice<T>(std::move(values));
}

void append_char_literal(std::string& out, char32_t ch, char quote) {
  switch (ch) {
    case U'\n':
      out += "\\n";
      return;
    case U'\t':
      out += "\\t";
      return;
    case U'\r':
      out += "\\r";
      return;
    case U'\0':
      out += "\\0";
      return;
    case U'\\':
      out += "\\\\";
      return;
    default:
      break;
  }
  if (quote != 0 && ch == static_cast<char32_t>(quote)) {
    out.push_back('\\');
  }
  append_utf8(out, ch);
}

void show_into(const Array& value, std::string& out);

template <typename T>
void show_element(const T& element, std::string& out) {
  out += number_to_string(static_cast<double>(element));
}

template <>
void show_element<char32_t>(const char32_t& element, std::string& out) {
  out += "@";
  if (element == U' ') {
    out += "\\s";
    return;
  }
  append_char_literal(out, element, 0);
}

template <>
void show_element<Array>(const Array& element, std::string& out) {
  out += "□";
  show_into(element, out);
}

void show_into(const Array& value, std::string& out) {
  if (value.is_scalar()) {
    value.visit([&out](const auto& slice) { show_element(slice[0], out); });
    return;
  }
  if (value.rank() == 1 && value.holds<char32_t>()) {
    out.push_back('"');
    for (const auto ch : value.elements<char32_t>()) {
      append_char_literal(out, ch, '"');
    }
    out.push_back('"');
    return;
  }
  out.push_back('[');
  const auto count = value.row_count();
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    show_into(value.row(i), out);
  }
  out.push_back(']');
}

}  // namespace

Array::Array() : shape_{0}, storage_(CowSlice<double>(std::vector<double>{})) {}

Array::Array(Shape shape, Storage storage) : shape_(std::move(shape)), storage_(std::move(storage)) {
  const auto count = std::visit([](const auto& slice) { return slice.size(); }, storage_);
  if (count != shape_product(shape_)) {
    throw RuntimeError(RuntimeErrorKind::ShapeMismatch,
                       "Shape " + format_shape(shape_) + " does not match " + std::to_string(count) +
                           " elements");
  }
}

Array Array::number(double value) {
  return Array({}, make_storage(std::vector<double>{value}));
}

Array Array::byte(std::uint8_t value) {
  return Array({}, make_storage(std::vector<std::uint8_t>{value}));
}

Array Array::character(char32_t value) {
  return Array({}, make_storage(std::vector<char32_t>{value}));
}

Array Array::boxed(Array value) {
  std::vector<Array> inner;
  inner.push_back(std::move(value));
  return Array({}, make_storage(std::move(inner)));
}

Array Array::from_numbers(Shape shape, std::vector<double> values) {
  return Array(std::move(shape), make_storage(std::move(values)));
}

Array Array::from_bytes(Shape shape, std::vector<std::uint8_t> values) {
  return Array(std::move(shape), make_storage(std::move(values)));
}

Array Array::from_chars(Shape shape, std::vector<char32_t> values) {
  return Array(std::move(shape), make_storage(std::move(values)));
}

Array Array::from_boxes(Shape shape, std::vector<Array> values) {
  return Array(std::move(shape), make_storage(std::move(values)));
}

Array Array::number_list(std::vector<double> values) {
  Shape shape{values.size()};
  return from_numbers(std::move(shape), std::move(values));
}

Array Array::from_string(std::string_view utf8) {
  auto text = tacit::from_utf8(utf8);
  Shape shape{text.size()};
  return from_chars(std::move(shape), std::vector<char32_t>(text.begin(), text.end()));
}

ElementKind Array::kind() const {
  return std::visit(
      [](const auto& slice) {
        using T = typename std::decay_t<decltype(slice)>::value_type;
        return ElementTraits<T>::kind;
      },
      storage_);
}

std::size_t Array::element_count() const {
  return std::visit([](const auto& slice) { return slice.size(); }, storage_);
}

Array Array::row(std::size_t index) const {
  if (is_scalar()) {
    return *this;
  }
  const auto len = row_len();
  return std::visit(
      [&](const auto& slice) {
        return Array(row_shape(), Storage(slice.slice(index * len, (index + 1) * len)));
      },
      storage_);
}

std::vector<Array> Array::rows() const {
  std::vector<Array> out;
  const auto count = row_count();
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(row(i));
  }
  return out;
}

Array Array::reshaped(Shape shape) const {
  return Array(std::move(shape), storage_);
}

Array Array::as_numbers() const {
  if (!holds<std::uint8_t>()) {
    return *this;
  }
  const auto& bytes = elements<std::uint8_t>();
  return from_numbers(shape_, std::vector<double>(bytes.begin(), bytes.end()));
}

Array Array::as_boxes() const {
  if (holds<Array>()) {
    return *this;
  }
  std::vector<Array> boxes;
  boxes.reserve(element_count());
  std::visit(
      [&boxes](const auto& slice) {
        using T = typename std::decay_t<decltype(slice)>::value_type;
        for (const auto& element : slice) {
          boxes.push_back(Array({}, Storage(CowSlice<T>(std::vector<T>{element}))));
        }
      },
      storage_);
  return from_boxes(shape_, std::move(boxes));
}

bool Array::shares_storage_with(const Array& other) const {
  if (storage_.index() != other.storage_.index()) {
    return false;
  }
  return std::visit(
      [&other](const auto& slice) {
        using Slice = std::decay_t<decltype(slice)>;
        return slice.shares_storage_with(std::get<Slice>(other.storage_));
      },
      storage_);
}

std::string Array::show() const {
  std::string out;
  show_into(*this, out);
  return out;
}

template <>
std::optional<double> FillContext::get<double>() const {
  if (value && value->is_scalar()) {
    if (value->holds<double>()) {
      return value->elements<double>()[0];
    }
    if (value->holds<std::uint8_t>()) {
      return static_cast<double>(value->elements<std::uint8_t>()[0]);
    }
  }
  if (defaults) {
    return 0.0;
  }
  return std::nullopt;
}

template <>
std::optional<std::uint8_t> FillContext::get<std::uint8_t>() const {
  if (value && value->is_scalar()) {
    if (value->holds<std::uint8_t>()) {
      return value->elements<std::uint8_t>()[0];
    }
    if (value->holds<double>()) {
      const auto number = value->elements<double>()[0];
      if (number >= 0.0 && number <= 255.0 && std::floor(number) == number) {
        return static_cast<std::uint8_t>(number);
      }
    }
  }
  if (defaults) {
    return static_cast<std::uint8_t>(0);
  }
  return std::nullopt;
}

template <>
std::optional<char32_t> FillContext::get<char32_t>() const {
  if (value && value->is_scalar() && value->holds<char32_t>()) {
    return value->elements<char32_t>()[0];
  }
  if (defaults) {
    return U'\0';
  }
  return std::nullopt;
}

template <>
std::optional<Array> FillContext::get<Array>() const {
  if (value && value->is_scalar() && value->holds<Array>()) {
    return value->elements<Array>()[0];
  }
  if (defaults) {
    return Array();
  }
  return std::nullopt;
}

std::string number_to_string(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value < 0 ? "¯∞" : "∞";
  }
  const bool negative = value < 0;
  const double magnitude = negative ? -value : value;
  std::string digits;
  if (std::floor(magnitude) == magnitude && magnitude <= 9007199254740992.0) {
    std::ostringstream stream;
    stream << static_cast<long long>(magnitude);
    digits = stream.str();
  } else {
    std::ostringstream stream;
    stream << std::setprecision(std::numeric_limits<double>::max_digits10) << magnitude;
    std::string raw = stream.str();
    // Shortest representation that still round-trips.
    for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
      std::ostringstream shorter;
      shorter << std::setprecision(precision) << magnitude;
      if (std::stod(shorter.str()) == magnitude) {
        raw = shorter.str();
        break;
      }
    }
    digits = raw;
  }
  return negative ? "¯" + digits : digits;
}

}  // namespace tacit
