// Compiler parts:
// - 01: entry points, name interning, scopes, stack effects
// - 02: lines, bindings and plain terms
// - 03: modifiers, operand functions and `?` branches

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

#include "tacit/compiler.h"
#include "tacit/env_config.h"
#include "tacit/parser.h"

#include "compiler_parts/01_compiler_core.cpp"
#include "compiler_parts/02_compiler_terms.cpp"
#include "compiler_parts/03_compiler_modifiers.cpp"
