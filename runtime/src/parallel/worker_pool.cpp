#include "tacit/worker_pool.h"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <utility>

#include "tacit/env_config.h"

namespace tacit {

namespace {

bool pool_trace_enabled() {
  static const bool enabled = env_flag_enabled("TACIT_POOL_TRACE", false);
  return enabled;
}

struct BatchState {
  explicit BatchState(std::size_t tasks) : remaining(tasks) {}

  std::atomic<std::size_t> remaining;
  std::mutex mutex;
  std::condition_variable cv;
  std::size_t first_error_task = 0;
  std::exception_ptr first_error = nullptr;
};

// Keeps the error of the lowest task index so the rethrown error does not
// depend on which worker finished first.
void record_batch_error(const std::shared_ptr<BatchState>& state, std::size_t task,
                        std::exception_ptr error) {
  if (!error) {
    return;
  }
  std::lock_guard<std::mutex> guard(state->mutex);
  if (!state->first_error || task < state->first_error_task) {
    state->first_error = error;
    state->first_error_task = task;
  }
}

void complete_batch_task(const std::shared_ptr<BatchState>& state) {
  if (state->remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    std::lock_guard<std::mutex> guard(state->mutex);
    state->cv.notify_one();
  }
}

void wait_batch(const std::shared_ptr<BatchState>& state) {
  std::unique_lock<std::mutex> lock(state->mutex);
  state->cv.wait(lock, [&state]() { return state->remaining.load(std::memory_order_acquire) == 0; });
  if (state->first_error) {
    std::rethrow_exception(state->first_error);
  }
}

}  // namespace

std::size_t default_thread_count() {
  const auto configured = env_unsigned_value("TACIT_THREADS", 0);
  if (configured > 0) {
    return static_cast<std::size_t>(configured);
  }
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 4u : static_cast<std::size_t>(hw);
}

std::size_t default_chunk_size(std::size_t total, std::size_t configured) {
  if (configured > 0) {
    return configured;
  }
  if (total <= 4096) {
    return total;
  }
  if (total <= 65536) {
    return 4096;
  }
  return 16384;
}

WorkerPool::WorkerPool(std::size_t threads)
    : done_(false), rr_index_(0), pending_(0), spawned_(0), executed_(0), steals_(0) {
  const auto count = std::max<std::size_t>(1, threads);
  workers_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers_.push_back(std::make_unique<Worker>());
  }
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    workers_[i]->thread = std::thread([this, i]() { worker_loop(i); });
  }
  if (pool_trace_enabled()) {
    std::fprintf(stderr, "[tacit-pool] started threads=%zu\n", workers_.size());
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> guard(cv_mutex_);
    done_.store(true, std::memory_order_relaxed);
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker->thread.joinable()) {
      worker->thread.join();
    }
  }
}

void WorkerPool::parallel_for(std::size_t total, std::size_t chunk,
                              const std::function<void(std::size_t, std::size_t)>& body) {
  if (total == 0) {
    return;
  }
  chunk = std::max<std::size_t>(1, chunk);
  const auto task_count = (total + chunk - 1) / chunk;
  if (task_count == 1) {
    body(0, total);
    return;
  }
  if (pool_trace_enabled()) {
    std::fprintf(stderr, "[tacit-pool] batch total=%zu chunk=%zu tasks=%zu\n", total, chunk,
                 task_count);
  }

  auto batch = std::make_shared<BatchState>(task_count);
  for (std::size_t task_index = 0, offset = 0; task_index < task_count; ++task_index, offset += chunk) {
    const auto begin = offset;
    const auto finish = std::min(total, offset + chunk);
    TaskItem item;
    item.run = [&body, begin, finish, task_index, batch]() {
      try {
        body(begin, finish);
      } catch (...) {
        record_batch_error(batch, task_index, std::current_exception());
      }
      complete_batch_task(batch);
    };
    enqueue_item(std::move(item));
  }
  while (batch->remaining.load(std::memory_order_acquire) > 0 && assist_one()) {
  }
  wait_batch(batch);
}

PoolStats WorkerPool::stats() const {
  PoolStats out;
  out.threads = workers_.size();
  out.spawned = spawned_.load(std::memory_order_relaxed);
  out.executed = executed_.load(std::memory_order_relaxed);
  out.steals = steals_.load(std::memory_order_relaxed);
  return out;
}

void WorkerPool::enqueue_item(TaskItem item) {
  const auto index = rr_index_.fetch_add(1, std::memory_order_relaxed) % workers_.size();
  {
    std::lock_guard<std::mutex> guard(workers_[index]->mutex);
    workers_[index]->queue.push_back(std::move(item));
  }
  {
    std::lock_guard<std::mutex> guard(cv_mutex_);
    pending_.fetch_add(1, std::memory_order_relaxed);
  }
  spawned_.fetch_add(1, std::memory_order_relaxed);
  cv_.notify_one();
}

bool WorkerPool::pop_local(std::size_t worker_index, TaskItem& out) {
  auto& worker = workers_[worker_index];
  std::lock_guard<std::mutex> guard(worker->mutex);
  if (worker->queue.empty()) {
    return false;
  }
  out = std::move(worker->queue.back());
  worker->queue.pop_back();
  return true;
}

bool WorkerPool::steal_remote(std::size_t worker_index, TaskItem& out) {
  for (std::size_t offset = 1; offset < workers_.size(); ++offset) {
    const auto victim_index = (worker_index + offset) % workers_.size();
    auto& victim = workers_[victim_index];
    std::lock_guard<std::mutex> guard(victim->mutex);
    if (victim->queue.empty()) {
      continue;
    }
    out = std::move(victim->queue.front());
    victim->queue.pop_front();
    steals_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }
  return false;
}

bool WorkerPool::assist_one() {
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    TaskItem item;
    if (pop_local(i, item)) {
      run_item(item);
      return true;
    }
  }
  return false;
}

void WorkerPool::run_item(TaskItem& item) {
  pending_.fetch_sub(1, std::memory_order_relaxed);
  item.run();
  executed_.fetch_add(1, std::memory_order_relaxed);
}

void WorkerPool::worker_loop(std::size_t worker_index) {
  while (!done_.load(std::memory_order_relaxed)) {
    TaskItem item;
    if (pop_local(worker_index, item) || steal_remote(worker_index, item)) {
      run_item(item);
      continue;
    }

    std::unique_lock<std::mutex> lock(cv_mutex_);
    cv_.wait(lock, [this]() {
      return done_.load(std::memory_order_relaxed) || pending_.load(std::memory_order_relaxed) > 0;
    });
  }
}

}  // namespace tacit
