#include <cmath>
#include <limits>

#include "phase5_support.h"

namespace {

using tacit::Array;
using tacit::DyadicOp;
using tacit::MonadicOp;
using tacit::OpContext;
using tacit::RuntimeErrorKind;
using phase5_test::expect_runtime_error;
using phase5_test::expect_show;
using phase5_test::fill_with;
using phase5_test::list;
using phase5_test::numbers;

const OpContext kPlain{};

Array dyadic(DyadicOp op, const Array& a, const Array& b) {
  return tacit::pervade_dyadic(op, a, b, kPlain);
}

void expect_near(const Array& value, double expected, const char* label) {
  const auto actual = tacit::as_number(value, label);
  if (std::fabs(actual - expected) > 1e-12) {
    std::fprintf(stderr, "phase5 numeric mismatch: case=%s expected=%.17g actual=%.17g\n", label,
                 expected, actual);
  }
  assert(std::fabs(actual - expected) <= 1e-12);
}

void test_elementwise_and_broadcast() {
  expect_show(dyadic(DyadicOp::Add, list({1, 2, 3}), list({10, 20, 30})), "[11 22 33]",
              "add lists");
  expect_show(dyadic(DyadicOp::Add, Array::number(1), list({1, 2})), "[2 3]", "scalar broadcast");
  expect_show(dyadic(DyadicOp::Add, list({10, 20}), numbers({2, 2}, {1, 2, 3, 4})),
              "[[11 12] [23 24]]", "prefix broadcast");
  expect_show(dyadic(DyadicOp::Multiply, numbers({2, 2}, {1, 2, 3, 4}), list({2, 3})),
              "[[2 4] [9 12]]", "prefix broadcast on second argument");
}

void test_argument_order() {
  expect_show(dyadic(DyadicOp::Subtract, Array::number(1), Array::number(5)), "4", "subtract");
  expect_show(dyadic(DyadicOp::Divide, Array::number(2), Array::number(10)), "5", "divide");
  expect_show(dyadic(DyadicOp::Power, Array::number(2), Array::number(3)), "9", "power");
  expect_near(dyadic(DyadicOp::Logarithm, Array::number(2), Array::number(8)), 3.0, "logarithm");
  expect_show(dyadic(DyadicOp::Minimum, Array::number(2), Array::number(7)), "2", "minimum");
  expect_show(dyadic(DyadicOp::Maximum, Array::number(2), Array::number(7)), "7", "maximum");
}

void test_shape_mismatch_and_fill() {
  expect_runtime_error([] { dyadic(DyadicOp::Add, list({1, 2}), list({1, 2, 3})); },
                       RuntimeErrorKind::ShapeMismatch, "mismatched lists");
  OpContext filled;
  filled.fill = fill_with(0);
  expect_show(tacit::pervade_dyadic(DyadicOp::Add, list({1, 2}), list({1, 2, 3}), filled),
              "[2 4 3]", "filled lists");
  OpContext defaults;
  defaults.fill.defaults = true;
  expect_show(tacit::pervade_dyadic(DyadicOp::Multiply, list({2, 2, 2}), list({1, 2}), defaults),
              "[2 4 0]", "default fill");
}

void test_comparisons() {
  const auto less = dyadic(DyadicOp::Less, Array::number(1), list({0, 1, 2}));
  assert(less.holds<std::uint8_t>());
  expect_show(less, "[1 0 0]", "less");
  expect_show(dyadic(DyadicOp::GreaterOrEqual, Array::number(1), list({0, 1, 2})), "[0 1 1]",
              "greater or equal");
  const auto nan = Array::number(std::nan(""));
  expect_show(dyadic(DyadicOp::Equal, nan, nan), "1", "nan equals nan");
  expect_show(dyadic(DyadicOp::NotEqual, Array::number(1), Array::number(1)), "0", "not equal");
  expect_show(dyadic(DyadicOp::Equal, Array::from_string("ab"), Array::from_string("ac")), "[1 0]",
              "character equality");
  expect_show(dyadic(DyadicOp::Equal, Array::number(97), Array::character(U'a')), "0",
              "number never equals character");
}

void test_modulus() {
  expect_show(dyadic(DyadicOp::Modulus, Array::number(3), Array::number(-7)), "2",
              "modulus positive divisor");
  expect_show(dyadic(DyadicOp::Modulus, Array::number(-3), Array::number(7)), "¯2",
              "modulus negative divisor");
  expect_runtime_error([] { dyadic(DyadicOp::Modulus, Array::number(0), list({1, 2})); },
                       RuntimeErrorKind::DivisionByZero, "modulus by zero");
  expect_show(dyadic(DyadicOp::Divide, Array::number(0), Array::number(1)), "∞", "divide by zero");
}

void test_characters() {
  expect_show(dyadic(DyadicOp::Add, Array::number(1), Array::character(U'a')), "@b",
              "number plus character");
  expect_show(dyadic(DyadicOp::Add, Array::character(U'a'), Array::number(2)), "@c",
              "character plus number");
  expect_show(dyadic(DyadicOp::Subtract, Array::character(U'a'), Array::character(U'c')), "2",
              "character difference");
  expect_show(dyadic(DyadicOp::Subtract, Array::number(1), Array::character(U'b')), "@a",
              "character minus number");
  expect_show(dyadic(DyadicOp::Add, Array::number(1), Array::from_string("HAL")), "\"IBM\"",
              "shift string");
  expect_runtime_error(
      [] { dyadic(DyadicOp::Subtract, Array::character(U'a'), Array::number(5)); },
      RuntimeErrorKind::TypeMismatch, "number minus character");
  expect_runtime_error(
      [] { dyadic(DyadicOp::Subtract, Array::number(200), Array::character(U'a')); },
      RuntimeErrorKind::TypeMismatch, "character below code point zero");
  expect_runtime_error(
      [] { dyadic(DyadicOp::Subtract, Array::number(1e300), Array::character(U'a')); },
      RuntimeErrorKind::TypeMismatch, "huge character shift");
  expect_runtime_error(
      [] { dyadic(DyadicOp::Add, Array::number(0x110000), Array::character(U'a')); },
      RuntimeErrorKind::TypeMismatch, "character above the last code point");
  expect_runtime_error(
      [] {
        dyadic(DyadicOp::Add, Array::character(U'a'),
               Array::number(std::numeric_limits<double>::infinity()));
      },
      RuntimeErrorKind::TypeMismatch, "infinite character shift");
  expect_runtime_error(
      [] { dyadic(DyadicOp::Multiply, Array::character(U'a'), Array::character(U'b')); },
      RuntimeErrorKind::TypeMismatch, "multiply characters");
  expect_runtime_error(
      [] { tacit::pervade_monadic(MonadicOp::Negate, Array::from_string("ab"), kPlain); },
      RuntimeErrorKind::TypeMismatch, "negate characters");
}

void test_bytes_stay_compact() {
  const auto bytes_a = Array::from_bytes({2}, {1, 0});
  const auto bytes_b = Array::from_bytes({2}, {0, 1});
  const auto minimum = dyadic(DyadicOp::Minimum, bytes_a, bytes_b);
  assert(minimum.holds<std::uint8_t>());
  expect_show(minimum, "[0 0]", "byte minimum");
  const auto sum = dyadic(DyadicOp::Add, bytes_a, bytes_b);
  assert(sum.holds<double>());
  expect_show(sum, "[1 1]", "byte sum widens");
  const auto negated = tacit::pervade_monadic(MonadicOp::Not, bytes_a, kPlain);
  assert(negated.holds<std::uint8_t>());
  expect_show(negated, "[0 1]", "byte not");
}

void test_boxes() {
  const auto boxes = tacit::from_rows_boxed({list({1, 2}), Array::number(5)});
  expect_show(dyadic(DyadicOp::Add, Array::number(1), boxes), "[□[2 3] □6]", "add into boxes");
  expect_show(tacit::pervade_monadic(MonadicOp::Negate, boxes, kPlain), "[□[¯1 ¯2] □¯5]",
              "negate boxes");
}

void test_monadic() {
  expect_show(tacit::pervade_monadic(MonadicOp::Negate, list({1, -2}), kPlain), "[¯1 2]", "negate");
  expect_show(tacit::pervade_monadic(MonadicOp::Absolute, Array::number(-3), kPlain), "3",
              "absolute");
  expect_show(tacit::pervade_monadic(MonadicOp::Sign, list({-4, 0, 9}), kPlain), "[¯1 0 1]",
              "sign");
  expect_show(tacit::pervade_monadic(MonadicOp::Sqrt, Array::number(16), kPlain), "4", "sqrt");
  expect_show(tacit::pervade_monadic(MonadicOp::Floor, list({1.5, -1.5}), kPlain), "[1 ¯2]",
              "floor");
  expect_show(tacit::pervade_monadic(MonadicOp::Ceiling, list({1.5, -1.5}), kPlain), "[2 ¯1]",
              "ceiling");
  expect_show(tacit::pervade_monadic(MonadicOp::Round, Array::number(2.5), kPlain), "3", "round");
  expect_show(tacit::pervade_monadic(MonadicOp::Not, Array::number(0.25), kPlain), "0.75",
              "not of number");
  expect_near(tacit::pervade_monadic(MonadicOp::Sine, Array::number(0), kPlain), 0.0, "sine");
  expect_near(tacit::pervade_monadic(MonadicOp::Exp, Array::number(0), kPlain), 1.0, "exp");
}

void test_identities() {
  double identity = -1;
  assert(tacit::dyadic_identity(DyadicOp::Add, identity) && identity == 0.0);
  assert(tacit::dyadic_identity(DyadicOp::Multiply, identity) && identity == 1.0);
  assert(tacit::dyadic_identity(DyadicOp::Minimum, identity) &&
         identity == std::numeric_limits<double>::infinity());
  assert(tacit::dyadic_identity(DyadicOp::Maximum, identity) &&
         identity == -std::numeric_limits<double>::infinity());
  assert(!tacit::dyadic_identity(DyadicOp::Power, identity));
  assert(!tacit::dyadic_identity(DyadicOp::Equal, identity));
}

}  // namespace

namespace phase5_test {

void run_pervade_tests() {
  test_elementwise_and_broadcast();
  test_argument_order();
  test_shape_mismatch_and_fill();
  test_comparisons();
  test_modulus();
  test_characters();
  test_bytes_stay_compact();
  test_boxes();
  test_monadic();
  test_identities();
}

}  // namespace phase5_test
