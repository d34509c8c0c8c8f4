#include <cassert>
#include <vector>

#include "phase7_support.h"
#include "tacit/array_ops.h"
#include "tacit/diagnostics.h"
#include "tacit/pervade.h"

namespace {

void test_pervasive_kernels_match_sequential() {
  phase7_test::expect_same_results("+ 1 ⇡ 1000");
  phase7_test::expect_same_results("× ⇡ 1000 ⇡ 1000");
  phase7_test::expect_same_results("◿ 7 ⇡ 1000");
  phase7_test::expect_same_results("< 500 ⇡ 1000");
  phase7_test::expect_same_results("¯ ⇡ 500");
  phase7_test::expect_same_results("√ ⇡ 300");
  phase7_test::expect_same_results("+ ⇡ 10 ↯ 10_100 ⇡ 1000");
  phase7_test::expect_same_results("+ 1 \"the quick brown fox jumps over the lazy dog\"");
}

void test_programs_match_sequential() {
  phase7_test::expect_same_results("/+ ⇡ 1000");
  phase7_test::expect_same_results("\\+ ⇡ 200");
  phase7_test::expect_same_results("≡(/+) ↯ 50_20 ⇡ 1000");
  phase7_test::expect_same_results("⊞× ⇡ 40 ⇡ 40");
  phase7_test::expect_same_results("⬚0+ ⇡ 100 ⇡ 120");
  phase7_test::expect_same_results("+ 1 {⇡ 100 ⇡ 50}");
}

void test_errors_match_sequential() {
  const auto program = tacit::compile("◿ 0 ⇡ 1000");
  tacit::ExecutionContext parallel(phase7_test::eager_parallel_options());
  bool failed = false;
  try {
    tacit::run(program, {}, parallel);
  } catch (const tacit::RuntimeError& error) {
    failed = true;
    assert(error.kind == tacit::RuntimeErrorKind::DivisionByZero);
    assert(error.has_span());
    assert(error.span().start == 0);
  }
  assert(failed);

  const auto result = phase7_test::run_shown("/+ ⇡ 100", parallel);
  assert(result.size() == 1 && result[0] == "4950");
}

void test_direct_kernel_with_pool() {
  tacit::WorkerPool pool(3);
  tacit::OpContext ctx;
  ctx.pool = &pool;
  ctx.parallel_min_elements = 1;
  ctx.chunk_elements = 5;

  std::vector<double> left(101);
  std::vector<double> right(101);
  for (std::size_t i = 0; i < left.size(); ++i) {
    left[i] = static_cast<double>(i);
    right[i] = static_cast<double>(2 * i);
  }
  const auto a = tacit::Array::number_list(left);
  const auto b = tacit::Array::number_list(right);
  const auto parallel = tacit::pervade_dyadic(tacit::DyadicOp::Subtract, a, b, ctx);
  const auto sequential = tacit::pervade_dyadic(tacit::DyadicOp::Subtract, a, b, tacit::OpContext{});
  assert(tacit::arrays_match(parallel, sequential));
  assert(parallel.elements<double>()[100] == 100.0);
  assert(pool.stats().spawned == 21);

  const auto negated = tacit::pervade_monadic(tacit::MonadicOp::Negate, a, ctx);
  assert(negated.elements<double>()[7] == -7.0);
}

}  // namespace

namespace phase7_test {

void run_parallel_determinism_tests() {
  test_pervasive_kernels_match_sequential();
  test_programs_match_sequential();
  test_errors_match_sequential();
  test_direct_kernel_with_pool();
}

}  // namespace phase7_test
