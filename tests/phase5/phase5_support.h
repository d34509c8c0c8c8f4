#pragma once

#include <cassert>
#include <cstdio>
#include <string_view>
#include <vector>

#include "tacit/array.h"
#include "tacit/array_ops.h"
#include "tacit/diagnostics.h"
#include "tacit/pervade.h"

namespace phase5_test {

tacit::Array numbers(tacit::Shape shape, std::vector<double> values);
tacit::Array list(std::vector<double> values);
tacit::FillContext fill_with(double value);

void expect_show(const tacit::Array& value, std::string_view expected, const char* label);
void expect_shape(const tacit::Array& value, const tacit::Shape& expected, const char* label);

template <typename Fn>
void expect_runtime_error(Fn&& fn, tacit::RuntimeErrorKind kind, const char* label) {
  bool failed = false;
  try {
    fn();
  } catch (const tacit::RuntimeError& error) {
    failed = true;
    if (error.kind != kind) {
      std::fprintf(stderr, "phase5 error kind mismatch: case=%s expected=%s actual=%s message=%s\n",
                   label, tacit::runtime_error_kind_name(kind),
                   tacit::runtime_error_kind_name(error.kind), error.what());
    }
    assert(error.kind == kind);
  }
  if (!failed) {
    std::fprintf(stderr, "phase5 expected a runtime error: case=%s\n", label);
  }
  assert(failed);
}

void run_array_model_tests();
void run_structure_tests();
void run_pervade_tests();

}  // namespace phase5_test
