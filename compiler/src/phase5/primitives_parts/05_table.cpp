namespace tacit {

namespace {

using P = Primitive;

// Indexed by Primitive. `ascii` is the alternative spelling the lexer
// accepts for a glyph outside ASCII; ASCII glyphs are their own spelling.
constexpr std::array<PrimitiveInfo, kPrimitiveCount> kPrimitives = {{
    {P::Duplicate, "duplicate", ".", nullptr, 1, 2, 0, duplicate_impl},
    {P::Over, "over", ",", nullptr, 2, 3, 0, over_impl},
    {P::Flip, "flip", "∶", ":", 2, 2, 0, flip_impl},
    {P::Pop, "pop", ";", nullptr, 1, 0, 0, pop_impl},
    {P::Identity, "identity", "∘", nullptr, 1, 1, 0, identity_impl},
    {P::Pi, "pi", "π", nullptr, 0, 1, 0, pi_impl},
    {P::Tau, "tau", "τ", nullptr, 0, 1, 0, tau_impl},
    {P::Eta, "eta", "η", nullptr, 0, 1, 0, eta_impl},
    {P::Infinity, "infinity", "∞", nullptr, 0, 1, 0, infinity_impl},
    {P::Not, "not", "¬", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Not>},
    {P::Sign, "sign", "±", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Sign>},
    {P::Negate, "negate", "¯", "`", 1, 1, 0, monadic_impl<MonadicOp::Negate>},
    {P::Absolute, "absolute", "⌵", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Absolute>},
    {P::Sqrt, "sqrt", "√", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Sqrt>},
    {P::Sine, "sine", "○", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Sine>},
    {P::Cosine, "cos", nullptr, nullptr, 1, 1, 0, monadic_impl<MonadicOp::Cosine>},
    {P::Tangent, "tan", nullptr, nullptr, 1, 1, 0, monadic_impl<MonadicOp::Tangent>},
    {P::Asin, "asin", nullptr, nullptr, 1, 1, 0, monadic_impl<MonadicOp::Asin>},
    {P::Acos, "acos", nullptr, nullptr, 1, 1, 0, monadic_impl<MonadicOp::Acos>},
    {P::Floor, "floor", "⌊", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Floor>},
    {P::Ceiling, "ceiling", "⌈", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Ceiling>},
    {P::Round, "round", "⁅", nullptr, 1, 1, 0, monadic_impl<MonadicOp::Round>},
    {P::Exp, "exp", nullptr, nullptr, 1, 1, 0, monadic_impl<MonadicOp::Exp>},
    {P::Equal, "equals", "=", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Equal>},
    {P::NotEqual, "notequals", "≠", "!=", 2, 1, 0, dyadic_impl<DyadicOp::NotEqual>},
    {P::Less, "less", "<", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Less>},
    {P::LessOrEqual, "lessorequal", "≤", "<=", 2, 1, 0, dyadic_impl<DyadicOp::LessOrEqual>},
    {P::Greater, "greater", ">", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Greater>},
    {P::GreaterOrEqual, "greaterorequal", "≥", ">=", 2, 1, 0,
     dyadic_impl<DyadicOp::GreaterOrEqual>},
    {P::Add, "add", "+", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Add>},
    {P::Subtract, "subtract", "-", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Subtract>},
    {P::Multiply, "multiply", "×", "*", 2, 1, 0, dyadic_impl<DyadicOp::Multiply>},
    {P::Divide, "divide", "÷", "%", 2, 1, 0, dyadic_impl<DyadicOp::Divide>},
    {P::Modulus, "modulus", "◿", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Modulus>},
    {P::Power, "power", "ⁿ", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Power>},
    {P::Logarithm, "logarithm", "ₙ", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Logarithm>},
    {P::Minimum, "minimum", "↧", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Minimum>},
    {P::Maximum, "maximum", "↥", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Maximum>},
    {P::Atan2, "atan", "∠", nullptr, 2, 1, 0, dyadic_impl<DyadicOp::Atan2>},
    {P::Length, "length", "⧻", nullptr, 1, 1, 0, monadic_structure_impl<length_of>},
    {P::Shape, "shape", "△", nullptr, 1, 1, 0, monadic_structure_impl<shape_of>},
    {P::Rank, "rank", "∴", nullptr, 1, 1, 0, monadic_structure_impl<rank_of>},
    {P::Range, "range", "⇡", nullptr, 1, 1, 0, monadic_structure_impl<range>},
    {P::First, "first", "⊢", nullptr, 1, 1, 0, first_impl},
    {P::Reverse, "reverse", "⇌", nullptr, 1, 1, 0, monadic_structure_impl<reverse>},
    {P::Deshape, "deshape", "♭", nullptr, 1, 1, 0, monadic_structure_impl<deshape>},
    {P::Transpose, "transpose", "⍉", nullptr, 1, 1, 0, monadic_structure_impl<transpose>},
    {P::Rise, "rise", "⍏", nullptr, 1, 1, 0, monadic_structure_impl<rise>},
    {P::Fall, "fall", "⍖", nullptr, 1, 1, 0, monadic_structure_impl<fall>},
    {P::Where, "where", "⊚", nullptr, 1, 1, 0, monadic_structure_impl<where>},
    {P::Classify, "classify", "⊛", nullptr, 1, 1, 0, monadic_structure_impl<classify>},
    {P::Deduplicate, "deduplicate", "⊝", nullptr, 1, 1, 0, monadic_structure_impl<deduplicate>},
    {P::Box, "box", "□", nullptr, 1, 1, 0, monadic_structure_impl<box>},
    {P::Unbox, "unbox", "⊔", nullptr, 1, 1, 0, monadic_structure_impl<unbox>},
    {P::Random, "random", "⚂", nullptr, 0, 1, 0, random_impl},
    {P::Match, "match", "≅", nullptr, 2, 1, 0, dyadic_structure_impl<match>},
    {P::Couple, "couple", "⊟", nullptr, 2, 1, 0, filled_structure_impl<couple>},
    {P::Join, "join", "⊂", nullptr, 2, 1, 0, filled_structure_impl<join>},
    {P::Select, "select", "⊏", nullptr, 2, 1, 0, filled_structure_impl<select>},
    {P::Pick, "pick", "⊡", nullptr, 2, 1, 0, filled_structure_impl<pick>},
    {P::Reshape, "reshape", "↯", nullptr, 2, 1, 0, filled_structure_impl<reshape>},
    {P::Take, "take", "↙", nullptr, 2, 1, 0, filled_structure_impl<take>},
    {P::Drop, "drop", "↘", nullptr, 2, 1, 0, dyadic_structure_impl<drop>},
    {P::Rotate, "rotate", "↻", nullptr, 2, 1, 0, dyadic_structure_impl<rotate>},
    {P::Keep, "keep", "▽", nullptr, 2, 1, 0, dyadic_structure_impl<keep>},
    {P::Member, "member", "∊", nullptr, 2, 1, 0, dyadic_structure_impl<member>},
    {P::IndexOf, "indexof", "⊗", nullptr, 2, 1, 0, dyadic_structure_impl<index_of>},
    {P::Find, "find", "⌕", nullptr, 2, 1, 0, dyadic_structure_impl<find>},
    {P::Reduce, "reduce", "/", nullptr, 1, 1, 1, reduce_impl},
    {P::Fold, "fold", "∧", nullptr, 2, 1, 1, fold_impl},
    {P::Scan, "scan", "\\", nullptr, 1, 1, 1, scan_impl},
    {P::Each, "each", "∵", nullptr, 1, 1, 1, each_impl},
    {P::Rows, "rows", "≡", nullptr, 1, 1, 1, rows_impl},
    {P::Distribute, "distribute", "∺", nullptr, 2, 1, 1, distribute_impl},
    {P::Table, "table", "⊞", nullptr, 2, 1, 1, table_impl},
    {P::Repeat, "repeat", "⍥", nullptr, 1, 0, 1, repeat_impl},
    {P::Group, "group", "⊕", nullptr, 2, 1, 1, grouping_impl<group_rows>},
    {P::Partition, "partition", "⊜", nullptr, 2, 1, 1, grouping_impl<partition_rows>},
    {P::Dip, "dip", "⊙", nullptr, 1, 1, 1, dip_impl},
    {P::Both, "both", "∩", nullptr, 2, 2, 1, both_impl},
    {P::Fork, "fork", "⊃", nullptr, 1, 2, 2, fork_impl},
    {P::If, "if", "?", nullptr, 1, 1, 2, nullptr},
    {P::Try, "try", "⍣", nullptr, 1, 1, 2, try_impl},
    {P::Fill, "fill", "⬚", nullptr, 0, 1, 2, fill_impl},
}};

constexpr bool table_in_order() {
  for (std::size_t i = 0; i < kPrimitives.size(); ++i) {
    if (static_cast<std::size_t>(kPrimitives[i].id) != i) {
      return false;
    }
  }
  return true;
}

static_assert(table_in_order(), "primitive table must be indexed by Primitive");

template <typename Key>
std::unordered_map<Key, Primitive> build_index(Key (*key_of)(const PrimitiveInfo&)) {
  std::unordered_map<Key, Primitive> index;
  for (const auto& info : kPrimitives) {
    const auto key = key_of(info);
    if (key != Key{}) {
      index.emplace(key, info.id);
    }
  }
  return index;
}

char32_t glyph_code_point(const PrimitiveInfo& info) {
  if (!info.glyph) {
    return 0;
  }
  const std::string_view glyph(info.glyph);
  char32_t code_point = 0;
  if (decode_utf8(glyph, 0, code_point) != glyph.size()) {
    return 0;
  }
  return code_point;
}

std::string name_key(const PrimitiveInfo& info) {
  return info.name;
}

std::string ascii_key(const PrimitiveInfo& info) {
  if (info.ascii) {
    return info.ascii;
  }
  if (info.glyph && static_cast<unsigned char>(info.glyph[0]) < 0x80) {
    return info.glyph;
  }
  return std::string();
}

}  // namespace

std::string format_signature(const std::optional<Signature>& signature) {
  if (!signature) {
    return "dynamic";
  }
  return std::to_string(signature->args) + "->" + std::to_string(signature->outputs);
}

const PrimitiveInfo& primitive_info(Primitive id) {
  return kPrimitives[static_cast<std::size_t>(id)];
}

std::optional<Primitive> primitive_by_name(std::string_view name) {
  static const auto index = build_index<std::string>(name_key);
  const auto found = index.find(std::string(name));
  if (found == index.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::optional<Primitive> primitive_by_glyph(char32_t glyph) {
  static const auto index = build_index<char32_t>(glyph_code_point);
  const auto found = index.find(glyph);
  if (found == index.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::optional<Primitive> primitive_by_ascii(std::string_view text) {
  static const auto index = build_index<std::string>(ascii_key);
  const auto found = index.find(std::string(text));
  if (found == index.end()) {
    return std::nullopt;
  }
  return found->second;
}

bool is_modifier(Primitive id) {
  return primitive_info(id).modifier_args > 0;
}

std::string primitive_display(Primitive id) {
  const auto& info = primitive_info(id);
  return info.glyph ? info.glyph : info.name;
}

std::optional<MonadicOp> monadic_op_of(Primitive id) {
  if (id < P::Not || id > P::Exp) {
    return std::nullopt;
  }
  return static_cast<MonadicOp>(static_cast<int>(id) - static_cast<int>(P::Not));
}

std::optional<DyadicOp> dyadic_op_of(Primitive id) {
  if (id < P::Equal || id > P::Atan2) {
    return std::nullopt;
  }
  return static_cast<DyadicOp>(static_cast<int>(id) - static_cast<int>(P::Equal));
}

void invoke_primitive(Primitive id, CallContext& ctx, const Operands& operands) {
  const auto& info = primitive_info(id);
  if (!info.impl) {
    throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                       std::string(info.name) + " cannot be called as a function");
  }
  info.impl(ctx, operands);
}

}  // namespace tacit
