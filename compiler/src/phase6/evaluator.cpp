// Evaluator parts:
// - 01: run options, execution context and the public run() entry points
// - 02: stack, fill and checkpoint state exposed to primitives
// - 03: the instruction loop, calls and frames

#include <algorithm>
#include <cstdio>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

#include "tacit/array_ops.h"
#include "tacit/diagnostics.h"
#include "tacit/env_config.h"
#include "tacit/evaluator.h"

#include "evaluator_parts/01_context.cpp"
#include "evaluator_parts/02_state.cpp"
#include "evaluator_parts/03_execute.cpp"
