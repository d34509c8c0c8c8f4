#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

#include "tacit/bytecode.h"
#include "tacit/scope_arena.h"
#include "tacit/worker_pool.h"

namespace tacit {

struct RunOptions {
  bool parallel = true;
  std::size_t parallel_min_elements = 65536;
  // 0 picks a size from the element count.
  std::size_t chunk_elements = 0;
  // 0 uses TACIT_THREADS or the hardware concurrency.
  std::size_t threads = 0;
  bool default_fill = false;
  std::uint64_t random_seed = 0;

  static RunOptions from_env();
};

// State a caller keeps across executions: options, the cancellation flag,
// the random generator and the worker pool.
class ExecutionContext {
 public:
  ExecutionContext();
  explicit ExecutionContext(RunOptions options);

  RunOptions options;
  std::shared_ptr<std::atomic<bool>> interrupted;
  std::mt19937_64 rng;

  void interrupt() { interrupted->store(true, std::memory_order_relaxed); }
  void clear_interrupt() { interrupted->store(false, std::memory_order_relaxed); }
  bool interrupt_requested() const { return interrupted->load(std::memory_order_relaxed); }

  // Created on first use; nullptr when parallel execution is disabled.
  WorkerPool* pool();

 private:
  std::shared_ptr<WorkerPool> pool_;
};

class Interpreter : public CallContext {
 public:
  Interpreter(const Program& program, ExecutionContext& context);
  ~Interpreter() override;

  std::vector<Array> run(std::vector<Array> initial_stack);

  Array pop(const char* what) override;
  void push(Array value) override;
  std::size_t stack_size() const override { return stack_.size(); }

  void call(std::uint32_t function) override;
  std::optional<Signature> signature_of(std::uint32_t function) const override;
  std::optional<Primitive> primitive_of(std::uint32_t function) const override;

  const OpContext& op_context() const override { return op_context_; }
  void push_fill(Array value) override;
  void pop_fill() override;
  std::mt19937_64& rng() override { return context_.rng; }

  Checkpoint checkpoint() const override;
  void restore(Checkpoint checkpoint) override;
  void poll_interrupt() const override;

 private:
  struct Frame {
    const Code* code = nullptr;
    std::size_t ip = 0;
    ScopeHandle scope = 0;
    // Index into the function table, or kTopLevel for the program body.
    std::uint32_t function = 0;
  };

  static constexpr std::uint32_t kTopLevel = 0xFFFFFFFFu;

  void execute(std::size_t stop_depth);
  void step(const Instruction& instruction);
  void call_primitive(const Instruction& instruction);
  void enter(std::uint32_t function, ScopeHandle parent);
  void leave();
  void require_stack(std::size_t count, const char* what) const;
  void lower_array_marks();
  void sync_fill();

  const Program& program_;
  ExecutionContext& context_;
  std::vector<Array> stack_;
  std::vector<Frame> frames_;
  std::vector<std::size_t> array_marks_;
  std::vector<Array> fills_;
  ScopeArena scopes_;
  OpContext op_context_;
};

std::vector<Array> run(const Program& program, std::vector<Array> initial_stack,
                       ExecutionContext& context);
std::vector<Array> run(const Program& program, std::vector<Array> initial_stack = {});

}  // namespace tacit
