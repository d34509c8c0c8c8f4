#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "tacit/compiler.h"
#include "tacit/evaluator.h"
#include "tacit/worker_pool.h"

namespace phase7_test {

tacit::RunOptions sequential_options();
// Splits anything above a handful of elements across a small pool.
tacit::RunOptions eager_parallel_options(std::size_t threads = 4);

std::vector<std::string> run_shown(std::string_view source, tacit::ExecutionContext& context);
void expect_same_results(std::string_view source);

void run_worker_pool_tests();
void run_parallel_determinism_tests();

}  // namespace phase7_test
