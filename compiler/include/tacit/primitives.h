#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "tacit/array.h"
#include "tacit/pervade.h"

namespace tacit {

enum class Primitive : std::uint8_t {
  // Stack
  Duplicate,
  Over,
  Flip,
  Pop,
  Identity,
  // Constants
  Pi,
  Tau,
  Eta,
  Infinity,
  // Monadic pervasive
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
  // Dyadic pervasive
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
  // Monadic array
  Length,
  Shape,
  Rank,
  Range,
  First,
  Reverse,
  Deshape,
  Transpose,
  Rise,
  Fall,
  Where,
  Classify,
  Deduplicate,
  Box,
  Unbox,
  Random,
  // Dyadic array
  Match,
  Couple,
  Join,
  Select,
  Pick,
  Reshape,
  Take,
  Drop,
  Rotate,
  Keep,
  Member,
  IndexOf,
  Find,
  // Modifiers
  Reduce,
  Fold,
  Scan,
  Each,
  Rows,
  Distribute,
  Table,
  Repeat,
  Group,
  Partition,
  Dip,
  Both,
  Fork,
  If,
  Try,
  Fill,
};

constexpr std::size_t kPrimitiveCount = static_cast<std::size_t>(Primitive::Fill) + 1;

struct Signature {
  std::size_t args = 0;
  std::size_t outputs = 0;

  bool operator==(const Signature& other) const {
    return args == other.args && outputs == other.outputs;
  }
  bool operator!=(const Signature& other) const { return !(*this == other); }
};

std::string format_signature(const std::optional<Signature>& signature);

// Interpreter state visible to primitive implementations. Modifiers call
// their operand functions back through call().
class CallContext {
 public:
  struct Checkpoint {
    std::vector<Array> stack;
    std::size_t frames = 0;
    std::size_t fills = 0;
    std::size_t array_marks = 0;
  };

  virtual ~CallContext() = default;

  virtual Array pop(const char* what) = 0;
  virtual void push(Array value) = 0;
  virtual std::size_t stack_size() const = 0;

  virtual void call(std::uint32_t function) = 0;
  virtual std::optional<Signature> signature_of(std::uint32_t function) const = 0;
  virtual std::optional<Primitive> primitive_of(std::uint32_t function) const = 0;

  virtual const OpContext& op_context() const = 0;
  virtual void push_fill(Array value) = 0;
  virtual void pop_fill() = 0;
  virtual std::mt19937_64& rng() = 0;

  virtual Checkpoint checkpoint() const = 0;
  virtual void restore(Checkpoint checkpoint) = 0;
  // Throws RuntimeError{Interrupted} once an interrupt was requested.
  virtual void poll_interrupt() const = 0;
};

using Operands = std::vector<std::uint32_t>;
using PrimitiveImpl = void (*)(CallContext& ctx, const Operands& operands);

struct PrimitiveInfo {
  Primitive id;
  const char* name;
  const char* glyph;
  const char* ascii;
  std::size_t args;
  std::size_t outputs;
  std::size_t modifier_args;
  PrimitiveImpl impl;
};

const PrimitiveInfo& primitive_info(Primitive id);
std::optional<Primitive> primitive_by_name(std::string_view name);
std::optional<Primitive> primitive_by_glyph(char32_t glyph);
std::optional<Primitive> primitive_by_ascii(std::string_view text);

bool is_modifier(Primitive id);
std::string primitive_display(Primitive id);

std::optional<MonadicOp> monadic_op_of(Primitive id);
std::optional<DyadicOp> dyadic_op_of(Primitive id);

// Direct index into the dispatch table.
void invoke_primitive(Primitive id, CallContext& ctx, const Operands& operands);

}  // namespace tacit
