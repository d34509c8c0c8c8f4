#pragma once

#include "tacit/array.h"

namespace tacit {

enum class MonadicOp {
  Not,
  Sign,
  Negate,
  Absolute,
  Sqrt,
  Sine,
  Cosine,
  Tangent,
  Asin,
  Acos,
  Floor,
  Ceiling,
  Round,
  Exp,
};

enum class DyadicOp {
  Equal,
  NotEqual,
  Less,
  LessOrEqual,
  Greater,
  GreaterOrEqual,
  Add,
  Subtract,
  Multiply,
  Divide,
  Modulus,
  Power,
  Logarithm,
  Minimum,
  Maximum,
  Atan2,
};

const char* monadic_op_name(MonadicOp op);
const char* dyadic_op_name(DyadicOp op);

// Elementwise application, recursing into boxes.
Array pervade_monadic(MonadicOp op, const Array& a, const OpContext& ctx);

// `a` is the first argument (top of stack). Shapes broadcast along the
// leading axes; mismatches are padded with the active fill or rejected.
Array pervade_dyadic(DyadicOp op, const Array& a, const Array& b, const OpContext& ctx);

// Identity element used by reduce over zero rows, if the operator has one.
bool dyadic_identity(DyadicOp op, double& out);

}  // namespace tacit
