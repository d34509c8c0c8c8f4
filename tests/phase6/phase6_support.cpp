#include <cassert>
#include <cstdio>
#include <utility>

#include "phase6_support.h"

namespace phase6_test {

namespace {

std::string join_shown(const std::vector<std::string>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += " | ";
    }
    out += values[i];
  }
  return out;
}

}  // namespace

tacit::RunOptions sequential_options() {
  tacit::RunOptions options;
  options.parallel = false;
  return options;
}

std::vector<tacit::Array> run_source(std::string_view source, tacit::ExecutionContext& context,
                                     std::vector<tacit::Array> initial_stack) {
  const auto program = tacit::compile(source);
  return tacit::run(program, std::move(initial_stack), context);
}

std::vector<std::string> shown_stack(std::string_view source) {
  tacit::ExecutionContext context(sequential_options());
  std::vector<std::string> out;
  for (const auto& value : run_source(source, context)) {
    out.push_back(value.show());
  }
  return out;
}

void expect_stack(std::string_view source, const std::vector<std::string>& expected) {
  const auto actual = shown_stack(source);
  if (actual != expected) {
    std::fprintf(stderr, "phase6 stack mismatch: source=%.*s expected=%s actual=%s\n",
                 static_cast<int>(source.size()), source.data(), join_shown(expected).c_str(),
                 join_shown(actual).c_str());
  }
  assert(actual == expected);
}

void expect_result(std::string_view source, std::string_view expected) {
  expect_stack(source, {std::string(expected)});
}

std::optional<tacit::RuntimeError> capture_runtime_error(std::string_view source) {
  const auto program = tacit::compile(source);
  tacit::ExecutionContext context(sequential_options());
  try {
    tacit::run(program, {}, context);
  } catch (const tacit::RuntimeError& error) {
    return error;
  }
  return std::nullopt;
}

void expect_runtime_error(std::string_view source, tacit::RuntimeErrorKind kind) {
  const auto error = capture_runtime_error(source);
  if (!error) {
    std::fprintf(stderr, "phase6 expected a runtime error: source=%.*s\n",
                 static_cast<int>(source.size()), source.data());
  } else if (error->kind != kind) {
    std::fprintf(stderr, "phase6 error kind mismatch: source=%.*s expected=%s actual=%s message=%s\n",
                 static_cast<int>(source.size()), source.data(),
                 tacit::runtime_error_kind_name(kind), tacit::runtime_error_kind_name(error->kind),
                 error->what());
  }
  assert(error && error->kind == kind);
}

}  // namespace phase6_test
