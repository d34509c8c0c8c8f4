// Primitive parts:
// - 01: shared helpers for implementations
// - 02: stack, constants and pervasive arithmetic
// - 03: structural array primitives
// - 04: modifiers, calling operand functions back through CallContext
// - 05: the dispatch table and lookups

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tacit/array_ops.h"
#include "tacit/diagnostics.h"
#include "tacit/primitives.h"
#include "tacit/utf8.h"

#include "primitives_parts/01_support.cpp"
#include "primitives_parts/02_stack_and_pervasive.cpp"
#include "primitives_parts/03_structure.cpp"
#include "primitives_parts/04_modifiers.cpp"
#include "primitives_parts/05_table.cpp"
