#include "phase5_support.h"

#include <string>
#include <utility>

namespace phase5_test {

tacit::Array numbers(tacit::Shape shape, std::vector<double> values) {
  return tacit::Array::from_numbers(std::move(shape), std::move(values));
}

tacit::Array list(std::vector<double> values) {
  return tacit::Array::number_list(std::move(values));
}

tacit::FillContext fill_with(double value) {
  tacit::FillContext fill;
  fill.value = tacit::Array::number(value);
  return fill;
}

void expect_show(const tacit::Array& value, std::string_view expected, const char* label) {
  const auto actual = value.show();
  if (actual != expected) {
    std::fprintf(stderr, "phase5 show mismatch: case=%s expected=%.*s actual=%s\n", label,
                 static_cast<int>(expected.size()), expected.data(), actual.c_str());
  }
  assert(actual == expected);
}

void expect_shape(const tacit::Array& value, const tacit::Shape& expected, const char* label) {
  if (value.shape() != expected) {
    std::fprintf(stderr, "phase5 shape mismatch: case=%s expected=%s actual=%s\n", label,
                 tacit::format_shape(expected).c_str(), tacit::format_shape(value.shape()).c_str());
  }
  assert(value.shape() == expected);
}

}  // namespace phase5_test
