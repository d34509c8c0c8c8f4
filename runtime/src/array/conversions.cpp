#include <cmath>
#include <string>

#include "tacit/array_ops.h"
#include "tacit/diagnostics.h"

namespace tacit {

namespace {

[[noreturn]] void fail_requirement(const Array& value, const char* requirement) {
  throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                     std::string(requirement) + ", but it is " + value.show(),
                     {operand_info(value)});
}

bool numeric_element(const Array& value, std::size_t index, double& out) {
  if (value.holds<double>()) {
    out = value.elements<double>()[index];
    return true;
  }
  if (value.holds<std::uint8_t>()) {
    out = value.elements<std::uint8_t>()[index];
    return true;
  }
  return false;
}

// Integers beyond 2^53 are not exact in a double.
constexpr double kMaxExactInteger = 9007199254740992.0;

bool is_exact_integer(double number) {
  return std::isfinite(number) && std::floor(number) == number &&
         std::fabs(number) <= kMaxExactInteger;
}

}  // namespace

OperandInfo operand_info(const Array& value) {
  OperandInfo info;
  info.kind = value.kind();
  info.shape = value.shape();
  return info;
}

double as_number(const Array& value, const char* requirement) {
  double out = 0.0;
  if (!value.is_scalar() || !numeric_element(value, 0, out)) {
    fail_requirement(value, requirement);
  }
  return out;
}

long long as_integer(const Array& value, const char* requirement) {
  const auto number = as_number(value, requirement);
  if (!is_exact_integer(number)) {
    fail_requirement(value, requirement);
  }
  return static_cast<long long>(number);
}

std::size_t as_natural(const Array& value, const char* requirement) {
  const auto integer = as_integer(value, requirement);
  if (integer < 0) {
    fail_requirement(value, requirement);
  }
  return static_cast<std::size_t>(integer);
}

bool as_bool(const Array& value, const char* requirement) {
  const auto number = as_number(value, requirement);
  if (number != 0.0 && number != 1.0) {
    fail_requirement(value, requirement);
  }
  return number == 1.0;
}

std::vector<long long> as_integer_list(const Array& value, const char* requirement) {
  if (value.rank() > 1) {
    fail_requirement(value, requirement);
  }
  std::vector<long long> out;
  const auto count = value.element_count();
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    double number = 0.0;
    if (!numeric_element(value, i, number) || !is_exact_integer(number)) {
      fail_requirement(value, requirement);
    }
    out.push_back(static_cast<long long>(number));
  }
  return out;
}

std::vector<std::size_t> as_natural_list(const Array& value, const char* requirement) {
  std::vector<std::size_t> out;
  for (const auto integer : as_integer_list(value, requirement)) {
    if (integer < 0) {
      fail_requirement(value, requirement);
    }
    out.push_back(static_cast<std::size_t>(integer));
  }
  return out;
}

}  // namespace tacit
