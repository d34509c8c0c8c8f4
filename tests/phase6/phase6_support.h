#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tacit/compiler.h"
#include "tacit/diagnostics.h"
#include "tacit/evaluator.h"

namespace phase6_test {

// Options that ignore the environment and never start worker threads.
tacit::RunOptions sequential_options();

std::vector<tacit::Array> run_source(std::string_view source, tacit::ExecutionContext& context,
                                     std::vector<tacit::Array> initial_stack = {});
std::vector<std::string> shown_stack(std::string_view source);

// `expected` lists the final stack from bottom to top.
void expect_stack(std::string_view source, const std::vector<std::string>& expected);
void expect_result(std::string_view source, std::string_view expected);

std::optional<tacit::RuntimeError> capture_runtime_error(std::string_view source);
void expect_runtime_error(std::string_view source, tacit::RuntimeErrorKind kind);

void run_vm_tests();
void run_primitive_tests();
void run_modifier_tests();

}  // namespace phase6_test
