#include "tacit/pervade.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "tacit/array_ops.h"
#include "tacit/diagnostics.h"
#include "tacit/worker_pool.h"
#include "transcendental.h"

namespace tacit {

namespace {

bool is_comparison(DyadicOp op) {
  switch (op) {
    case DyadicOp::Equal:
    case DyadicOp::NotEqual:
    case DyadicOp::Less:
    case DyadicOp::LessOrEqual:
    case DyadicOp::Greater:
    case DyadicOp::GreaterOrEqual:
      return true;
    default:
      return false;
  }
}

bool is_numeric(const Array& value) {
  return value.holds<double>() || value.holds<std::uint8_t>();
}

[[noreturn]] void kind_error(DyadicOp op, const Array& a, const Array& b) {
  throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                     std::string("Cannot ") + dyadic_op_name(op) + " " + element_kind_name(a.kind()) +
                         " and " + element_kind_name(b.kind()) + " arrays",
                     {operand_info(a), operand_info(b)});
}

// Splits [0, count) into chunks on the pool when the operation is large
// enough, otherwise runs the body inline.
void run_chunks(std::size_t count, const OpContext& ctx,
                const std::function<void(std::size_t, std::size_t)>& body) {
  if (count == 0) {
    return;
  }
  if (ctx.pool != nullptr && count >= ctx.parallel_min_elements) {
    const auto chunk = default_chunk_size(count, ctx.chunk_elements);
    if (chunk < count) {
      ctx.pool->parallel_for(count, chunk, body);
      return;
    }
  }
  body(0, count);
}

template <typename R, typename T, typename Fn>
Array map_elements(const Array& a, const OpContext& ctx, Fn fn) {
  const auto& x = a.elements<T>();
  std::vector<R> out(x.size());
  run_chunks(x.size(), ctx, [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      out[i] = fn(x[i]);
    }
  });
  return Array::from_storage(a.shape(), CowSlice<R>(std::move(out)));
}

// Both shapes share a prefix; each element of the shorter array covers a
// contiguous block of the longer one.
template <typename R, typename A, typename B, typename Fn>
Array zip_elements(const Array& a, const Array& b, const OpContext& ctx, Fn fn) {
  const auto& x = a.elements<A>();
  const auto& y = b.elements<B>();
  const Shape& shape = a.rank() >= b.rank() ? a.shape() : b.shape();
  const auto count = shape_product(shape);
  const auto x_block = x.size() == 0 ? 1 : count / x.size();
  const auto y_block = y.size() == 0 ? 1 : count / y.size();
  std::vector<R> out(count);
  run_chunks(count, ctx, [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      out[i] = fn(x[i / x_block], y[i / y_block]);
    }
  });
  return Array::from_storage(shape, CowSlice<R>(std::move(out)));
}

template <typename T>
Array pad_axes(const Array& value, const Shape& target, std::size_t axes, const T& fill) {
  Shape shape(target.begin(), target.begin() + static_cast<std::ptrdiff_t>(axes));
  shape.insert(shape.end(), value.shape().begin() + static_cast<std::ptrdiff_t>(axes),
               value.shape().end());
  if (shape == value.shape()) {
    return value;
  }
  const auto& src = value.elements<T>();
  std::vector<T> out(checked_element_count(shape), fill);
  std::vector<std::size_t> index(shape.size(), 0);
  for (std::size_t flat = 0; flat < src.size(); ++flat) {
    std::size_t dst = 0;
    for (std::size_t axis = 0; axis < shape.size(); ++axis) {
      dst = dst * shape[axis] + index[axis];
    }
    out[dst] = src[flat];
    for (std::size_t axis = shape.size(); axis-- > 0;) {
      if (++index[axis] < value.shape()[axis]) {
        break;
      }
      index[axis] = 0;
    }
  }
  return Array::from_storage(std::move(shape), CowSlice<T>(std::move(out)));
}

// Makes the two shapes prefix-compatible, padding the mismatched leading
// axes with the active fill.
void align_shapes(Array& a, Array& b, DyadicOp op, const OpContext& ctx) {
  if (shape_has_prefix(a.shape(), b.shape()) || shape_has_prefix(b.shape(), a.shape())) {
    return;
  }
  const auto mismatch = [&]() {
    throw RuntimeError(RuntimeErrorKind::ShapeMismatch,
                       std::string("Shapes ") + format_shape(a.shape()) + " and " +
                           format_shape(b.shape()) + " do not match for " + dyadic_op_name(op),
                       {operand_info(a), operand_info(b)});
  };
  if (!ctx.fill.active()) {
    mismatch();
  }
  const auto axes = std::min(a.rank(), b.rank());
  Shape target(axes, 0);
  for (std::size_t axis = 0; axis < axes; ++axis) {
    target[axis] = std::max(a.shape()[axis], b.shape()[axis]);
  }
  for (Array* side : {&a, &b}) {
    *side = side->visit([&](const auto& slice) -> Array {
      using T = typename std::decay_t<decltype(slice)>::value_type;
      const auto fill = ctx.fill.get<T>();
      if (!fill) {
        mismatch();
      }
      return pad_axes<T>(*side, target, axes, *fill);
    });
  }
}

template <typename T>
bool compare_elements(DyadicOp op, T x, T y) {
  switch (op) {
    case DyadicOp::Equal:
      return y == x;
    case DyadicOp::NotEqual:
      return y != x;
    case DyadicOp::Less:
      return y < x;
    case DyadicOp::LessOrEqual:
      return y <= x;
    case DyadicOp::Greater:
      return y > x;
    case DyadicOp::GreaterOrEqual:
      return y >= x;
    default:
      return false;
  }
}

template <>
bool compare_elements<double>(DyadicOp op, double x, double y) {
  const bool both_nan = std::isnan(x) && std::isnan(y);
  switch (op) {
    case DyadicOp::Equal:
      return both_nan || y == x;
    case DyadicOp::NotEqual:
      return !both_nan && y != x;
    case DyadicOp::Less:
      return y < x;
    case DyadicOp::LessOrEqual:
      return both_nan || y <= x;
    case DyadicOp::Greater:
      return y > x;
    case DyadicOp::GreaterOrEqual:
      return both_nan || y >= x;
    default:
      return false;
  }
}

double modulus(double x, double y) {
  if (x == 0.0) {
    throw RuntimeError(RuntimeErrorKind::DivisionByZero, "Cannot take modulus by zero");
  }
  auto result = std::fmod(y, x);
  if (result != 0.0 && ((result < 0.0) != (x < 0.0))) {
    result += x;
  }
  return result;
}

// `x` is the first argument (top of stack), `y` the second.
double apply_number(DyadicOp op, double x, double y) {
  switch (op) {
    case DyadicOp::Add:
      return y + x;
    case DyadicOp::Subtract:
      return y - x;
    case DyadicOp::Multiply:
      return y * x;
    case DyadicOp::Divide:
      return y / x;
    case DyadicOp::Modulus:
      return modulus(x, y);
    case DyadicOp::Power:
      return transcendental::pow(y, x);
    case DyadicOp::Logarithm:
      return transcendental::log_base(x, y);
    case DyadicOp::Minimum:
      return std::min(x, y);
    case DyadicOp::Maximum:
      return std::max(x, y);
    case DyadicOp::Atan2:
      return transcendental::atan2(x, y);
    default:
      return compare_elements<double>(op, x, y) ? 1.0 : 0.0;
  }
}

constexpr long long kMaxCodePoint = 0x10FFFF;

char32_t shift_char(char32_t ch, double amount) {
  if (!std::isfinite(amount) || std::fabs(amount) > static_cast<double>(kMaxCodePoint) + 1.0) {
    throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                       "Cannot shift a character by " + number_to_string(amount));
  }
  const auto shifted = static_cast<long long>(ch) + static_cast<long long>(amount);
  if (shifted < 0 || shifted > kMaxCodePoint) {
    throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                       "Character arithmetic gives " + std::to_string(shifted) +
                           ", which is not a code point");
  }
  return static_cast<char32_t>(shifted);
}

Array numeric_dyadic(DyadicOp op, const Array& a, const Array& b, const OpContext& ctx) {
  if (a.holds<std::uint8_t>() && b.holds<std::uint8_t>()) {
    if (is_comparison(op)) {
      return zip_elements<std::uint8_t, std::uint8_t, std::uint8_t>(
          a, b, ctx, [op](std::uint8_t x, std::uint8_t y) {
            return static_cast<std::uint8_t>(compare_elements(op, x, y) ? 1 : 0);
          });
    }
    if (op == DyadicOp::Minimum || op == DyadicOp::Maximum) {
      const bool minimum = op == DyadicOp::Minimum;
      return zip_elements<std::uint8_t, std::uint8_t, std::uint8_t>(
          a, b, ctx, [minimum](std::uint8_t x, std::uint8_t y) {
            return minimum ? std::min(x, y) : std::max(x, y);
          });
    }
  }
  const auto x = a.as_numbers();
  const auto y = b.as_numbers();
  if (is_comparison(op)) {
    return zip_elements<std::uint8_t, double, double>(x, y, ctx, [op](double lhs, double rhs) {
      return static_cast<std::uint8_t>(compare_elements(op, lhs, rhs) ? 1 : 0);
    });
  }
  return zip_elements<double, double, double>(
      x, y, ctx, [op](double lhs, double rhs) { return apply_number(op, lhs, rhs); });
}

Array char_dyadic(DyadicOp op, const Array& a, const Array& b, const OpContext& ctx) {
  if (is_comparison(op)) {
    return zip_elements<std::uint8_t, char32_t, char32_t>(a, b, ctx, [op](char32_t x, char32_t y) {
      return static_cast<std::uint8_t>(compare_elements(op, x, y) ? 1 : 0);
    });
  }
  switch (op) {
    case DyadicOp::Subtract:
      return zip_elements<double, char32_t, char32_t>(a, b, ctx, [](char32_t x, char32_t y) {
        return static_cast<double>(y) - static_cast<double>(x);
      });
    case DyadicOp::Minimum:
      return zip_elements<char32_t, char32_t, char32_t>(
          a, b, ctx, [](char32_t x, char32_t y) { return std::min(x, y); });
    case DyadicOp::Maximum:
      return zip_elements<char32_t, char32_t, char32_t>(
          a, b, ctx, [](char32_t x, char32_t y) { return std::max(x, y); });
    default:
      kind_error(op, a, b);
  }
}

// One side is characters, the other numeric.
Array mixed_dyadic(DyadicOp op, const Array& a, const Array& b, const OpContext& ctx) {
  const bool a_char = a.holds<char32_t>();
  if (is_comparison(op)) {
    // Numbers order before characters.
    const int order = a_char ? -1 : 1;  // sign of (b compared to a)
    const bool result = [&]() {
      switch (op) {
        case DyadicOp::Equal:
          return false;
        case DyadicOp::NotEqual:
          return true;
        case DyadicOp::Less:
        case DyadicOp::LessOrEqual:
          return order < 0;
        default:
          return order > 0;
      }
    }();
    const Shape& shape = a.rank() >= b.rank() ? a.shape() : b.shape();
    return Array::from_bytes(shape, std::vector<std::uint8_t>(shape_product(shape), result ? 1 : 0));
  }
  if (op == DyadicOp::Add) {
    if (a_char) {
      const auto y = b.as_numbers();
      return zip_elements<char32_t, char32_t, double>(
          a, y, ctx, [](char32_t x, double amount) { return shift_char(x, amount); });
    }
    const auto x = a.as_numbers();
    return zip_elements<char32_t, double, char32_t>(
        x, b, ctx, [](double amount, char32_t y) { return shift_char(y, amount); });
  }
  if (op == DyadicOp::Subtract && !a_char) {
    const auto x = a.as_numbers();
    return zip_elements<char32_t, double, char32_t>(
        x, b, ctx, [](double amount, char32_t y) { return shift_char(y, -amount); });
  }
  kind_error(op, a, b);
}

Array box_dyadic(DyadicOp op, const Array& a, const Array& b, const OpContext& ctx) {
  OpContext inner = ctx;
  inner.pool = nullptr;
  return zip_elements<Array, Array, Array>(
      a, b, OpContext{}, [op, &inner](const Array& x, const Array& y) {
        return pervade_dyadic(op, x, y, inner);
      });
}

double apply_monadic(MonadicOp op, double x) {
  switch (op) {
    case MonadicOp::Not:
      return 1.0 - x;
    case MonadicOp::Sign:
      return x > 0.0 ? 1.0 : (x < 0.0 ? -1.0 : (std::isnan(x) ? x : 0.0));
    case MonadicOp::Negate:
      return -x;
    case MonadicOp::Absolute:
      return std::fabs(x);
    case MonadicOp::Sqrt:
      return std::sqrt(x);
    case MonadicOp::Sine:
      return transcendental::sin(x);
    case MonadicOp::Cosine:
      return transcendental::cos(x);
    case MonadicOp::Tangent:
      return transcendental::tan(x);
    case MonadicOp::Asin:
      return transcendental::asin(x);
    case MonadicOp::Acos:
      return transcendental::acos(x);
    case MonadicOp::Floor:
      return std::floor(x);
    case MonadicOp::Ceiling:
      return std::ceil(x);
    case MonadicOp::Round:
      return std::round(x);
    case MonadicOp::Exp:
      return transcendental::exp(x);
  }
  return x;
}

}  // namespace

const char* monadic_op_name(MonadicOp op) {
  switch (op) {
    case MonadicOp::Not:
      return "not";
    case MonadicOp::Sign:
      return "sign";
    case MonadicOp::Negate:
      return "negate";
    case MonadicOp::Absolute:
      return "absolute value";
    case MonadicOp::Sqrt:
      return "sqrt";
    case MonadicOp::Sine:
      return "sine";
    case MonadicOp::Cosine:
      return "cosine";
    case MonadicOp::Tangent:
      return "tangent";
    case MonadicOp::Asin:
      return "asin";
    case MonadicOp::Acos:
      return "acos";
    case MonadicOp::Floor:
      return "floor";
    case MonadicOp::Ceiling:
      return "ceiling";
    case MonadicOp::Round:
      return "round";
    case MonadicOp::Exp:
      return "exp";
  }
  return "?";
}

const char* dyadic_op_name(DyadicOp op) {
  switch (op) {
    case DyadicOp::Equal:
      return "compare";
    case DyadicOp::NotEqual:
      return "compare";
    case DyadicOp::Less:
      return "compare";
    case DyadicOp::LessOrEqual:
      return "compare";
    case DyadicOp::Greater:
      return "compare";
    case DyadicOp::GreaterOrEqual:
      return "compare";
    case DyadicOp::Add:
      return "add";
    case DyadicOp::Subtract:
      return "subtract";
    case DyadicOp::Multiply:
      return "multiply";
    case DyadicOp::Divide:
      return "divide";
    case DyadicOp::Modulus:
      return "take the modulus of";
    case DyadicOp::Power:
      return "raise";
    case DyadicOp::Logarithm:
      return "take the logarithm of";
    case DyadicOp::Minimum:
      return "take the minimum of";
    case DyadicOp::Maximum:
      return "take the maximum of";
    case DyadicOp::Atan2:
      return "take atan2 of";
  }
  return "?";
}

Array pervade_monadic(MonadicOp op, const Array& a, const OpContext& ctx) {
  if (a.holds<Array>()) {
    OpContext inner = ctx;
    inner.pool = nullptr;
    return map_elements<Array, Array>(
        a, OpContext{}, [op, &inner](const Array& x) { return pervade_monadic(op, x, inner); });
  }
  if (a.holds<char32_t>()) {
    throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                       std::string("Cannot ") + monadic_op_name(op) + " a character array",
                       {operand_info(a)});
  }
  if (a.holds<std::uint8_t>()) {
    switch (op) {
      case MonadicOp::Not: {
        const auto& bytes = a.elements<std::uint8_t>();
        const bool boolean = std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t x) { return x <= 1; });
        if (boolean) {
          return map_elements<std::uint8_t, std::uint8_t>(
              a, ctx, [](std::uint8_t x) { return static_cast<std::uint8_t>(1 - x); });
        }
        break;
      }
      case MonadicOp::Sign:
        return map_elements<std::uint8_t, std::uint8_t>(
            a, ctx, [](std::uint8_t x) { return static_cast<std::uint8_t>(x > 0 ? 1 : 0); });
      case MonadicOp::Absolute:
      case MonadicOp::Floor:
      case MonadicOp::Ceiling:
      case MonadicOp::Round:
        return a;
      default:
        break;
    }
  }
  const auto numbers = a.as_numbers();
  return map_elements<double, double>(numbers, ctx, [op](double x) { return apply_monadic(op, x); });
}

Array pervade_dyadic(DyadicOp op, const Array& a, const Array& b, const OpContext& ctx) {
  Array x = a;
  Array y = b;
  align_shapes(x, y, op, ctx);
  if (x.holds<Array>() || y.holds<Array>()) {
    return box_dyadic(op, x.as_boxes(), y.as_boxes(), ctx);
  }
  if (is_numeric(x) && is_numeric(y)) {
    return numeric_dyadic(op, x, y, ctx);
  }
  if (x.holds<char32_t>() && y.holds<char32_t>()) {
    return char_dyadic(op, x, y, ctx);
  }
  return mixed_dyadic(op, x, y, ctx);
}

bool dyadic_identity(DyadicOp op, double& out) {
  switch (op) {
    case DyadicOp::Add:
    case DyadicOp::Subtract:
      out = 0.0;
      return true;
    case DyadicOp::Multiply:
    case DyadicOp::Divide:
      out = 1.0;
      return true;
    case DyadicOp::Minimum:
      out = std::numeric_limits<double>::infinity();
      return true;
    case DyadicOp::Maximum:
      out = -std::numeric_limits<double>::infinity();
      return true;
    default:
      return false;
  }
}

}  // namespace tacit
