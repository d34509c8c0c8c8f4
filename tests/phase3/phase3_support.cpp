#include <cassert>
#include <cstdio>

#include "phase3_support.h"

namespace phase3_test {

std::optional<tacit::Signature> program_signature(std::string_view source) {
  return tacit::compile(source).signature;
}

void expect_signature(std::string_view source, std::size_t args, std::size_t outputs) {
  const auto actual = program_signature(source);
  const bool ok = actual && actual->args == args && actual->outputs == outputs;
  if (!ok) {
    std::fprintf(stderr, "phase3 signature assert failed: source=%.*s expected=%zu->%zu actual=%s\n",
                 static_cast<int>(source.size()), source.data(), args, outputs,
                 tacit::format_signature(actual).c_str());
  }
  assert(ok);
}

void expect_dynamic(std::string_view source) {
  const auto actual = program_signature(source);
  if (actual) {
    std::fprintf(stderr, "phase3 dynamic assert failed: source=%.*s actual=%s\n",
                 static_cast<int>(source.size()), source.data(),
                 tacit::format_signature(actual).c_str());
  }
  assert(!actual);
}

void expect_compile_error(std::string_view source, tacit::CompileErrorKind kind) {
  bool failed = false;
  try {
    tacit::compile(source);
  } catch (const tacit::CompileError& error) {
    failed = true;
    if (error.kind != kind) {
      std::fprintf(stderr, "phase3 compile error kind mismatch: source=%.*s message=%s\n",
                   static_cast<int>(source.size()), source.data(), error.what());
    }
    assert(error.kind == kind);
  }
  if (!failed) {
    std::fprintf(stderr, "phase3 expected a compile error: source=%.*s\n",
                 static_cast<int>(source.size()), source.data());
  }
  assert(failed);
}

}  // namespace phase3_test
