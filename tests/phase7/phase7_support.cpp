#include <cassert>
#include <cstdio>

#include "phase7_support.h"

namespace phase7_test {

tacit::RunOptions sequential_options() {
  tacit::RunOptions options;
  options.parallel = false;
  return options;
}

tacit::RunOptions eager_parallel_options(std::size_t threads) {
  tacit::RunOptions options;
  options.parallel = true;
  options.threads = threads;
  options.parallel_min_elements = 16;
  options.chunk_elements = 7;
  return options;
}

std::vector<std::string> run_shown(std::string_view source, tacit::ExecutionContext& context) {
  const auto program = tacit::compile(source);
  std::vector<std::string> out;
  for (const auto& value : tacit::run(program, {}, context)) {
    out.push_back(value.show());
  }
  return out;
}

void expect_same_results(std::string_view source) {
  tacit::ExecutionContext sequential(sequential_options());
  tacit::ExecutionContext parallel(eager_parallel_options());
  const auto expected = run_shown(source, sequential);
  const auto actual = run_shown(source, parallel);
  if (expected != actual) {
    std::fprintf(stderr, "phase7 parallel result differs: source=%.*s\n",
                 static_cast<int>(source.size()), source.data());
  }
  assert(expected == actual);
}

}  // namespace phase7_test
