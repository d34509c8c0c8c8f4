namespace tacit {

namespace {

bool vm_trace_enabled() {
  static const bool enabled = env_flag_enabled("TACIT_VM_TRACE", false);
  return enabled;
}

}  // namespace

RunOptions RunOptions::from_env() {
  RunOptions options;
  options.parallel = env_flag_enabled("TACIT_PARALLEL", options.parallel);
  options.parallel_min_elements = static_cast<std::size_t>(
      env_unsigned_value("TACIT_PARALLEL_MIN", options.parallel_min_elements));
  options.chunk_elements =
      static_cast<std::size_t>(env_unsigned_value("TACIT_CHUNK", options.chunk_elements));
  options.threads = static_cast<std::size_t>(env_unsigned_value("TACIT_THREADS", options.threads));
  options.default_fill = env_flag_enabled("TACIT_DEFAULT_FILL", options.default_fill);
  options.random_seed = env_unsigned_value("TACIT_SEED", options.random_seed);
  return options;
}

ExecutionContext::ExecutionContext() : ExecutionContext(RunOptions::from_env()) {}

ExecutionContext::ExecutionContext(RunOptions options_in)
    : options(options_in),
      interrupted(std::make_shared<std::atomic<bool>>(false)),
      rng(options_in.random_seed) {}

WorkerPool* ExecutionContext::pool() {
  if (!options.parallel) {
    return nullptr;
  }
  if (!pool_) {
    const auto threads = options.threads > 0 ? options.threads : default_thread_count();
    pool_ = std::make_shared<WorkerPool>(threads);
  }
  return pool_.get();
}

std::vector<Array> run(const Program& program, std::vector<Array> initial_stack,
                       ExecutionContext& context) {
  Interpreter interpreter(program, context);
  return interpreter.run(std::move(initial_stack));
}

std::vector<Array> run(const Program& program, std::vector<Array> initial_stack) {
  ExecutionContext context;
  return run(program, std::move(initial_stack), context);
}

}  // namespace tacit
