#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "tacit/compiler.h"

namespace phase3_test {

std::optional<tacit::Signature> program_signature(std::string_view source);

void expect_signature(std::string_view source, std::size_t args, std::size_t outputs);
void expect_dynamic(std::string_view source);
void expect_compile_error(std::string_view source, tacit::CompileErrorKind kind);

void run_compiler_signature_tests();
void run_compiler_error_tests();

}  // namespace phase3_test
