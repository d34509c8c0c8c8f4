#include <atomic>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "phase7_support.h"

namespace {

void test_every_index_runs_once() {
  tacit::WorkerPool pool(4);
  std::vector<int> hits(1000, 0);
  pool.parallel_for(hits.size(), 64, [&hits](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      ++hits[i];
    }
  });
  for (const auto hit : hits) {
    assert(hit == 1);
  }
  const auto stats = pool.stats();
  assert(stats.threads == 4);
  assert(stats.spawned == 16);
  assert(stats.executed <= stats.spawned);
}

void test_small_batches_run_inline() {
  tacit::WorkerPool pool(2);
  std::atomic<std::size_t> calls{0};
  pool.parallel_for(10, 64, [&calls](std::size_t begin, std::size_t end) {
    assert(begin == 0 && end == 10);
    ++calls;
  });
  pool.parallel_for(0, 4, [&calls](std::size_t, std::size_t) { ++calls; });
  assert(calls.load() == 1);
  assert(pool.stats().spawned == 0);
}

void test_lowest_failing_chunk_wins() {
  tacit::WorkerPool pool(4);
  for (int attempt = 0; attempt < 20; ++attempt) {
    bool failed = false;
    try {
      pool.parallel_for(100, 10, [](std::size_t begin, std::size_t) {
        if (begin >= 30) {
          throw std::runtime_error(std::to_string(begin));
        }
      });
    } catch (const std::runtime_error& error) {
      failed = true;
      assert(std::string(error.what()) == "30");
    }
    assert(failed);
  }

  std::atomic<std::size_t> total{0};
  pool.parallel_for(100, 10, [&total](std::size_t begin, std::size_t end) { total += end - begin; });
  assert(total.load() == 100);
}

void test_thread_count_and_chunking() {
  tacit::WorkerPool single(0);
  assert(single.thread_count() == 1);
  assert(tacit::default_chunk_size(100, 0) == 100);
  assert(tacit::default_chunk_size(5000, 0) == 4096);
  assert(tacit::default_chunk_size(100000, 0) == 16384);
  assert(tacit::default_chunk_size(100000, 7) == 7);
  assert(tacit::default_thread_count() >= 1);
}

void test_context_owns_pool() {
  tacit::ExecutionContext sequential(phase7_test::sequential_options());
  assert(sequential.pool() == nullptr);

  tacit::ExecutionContext parallel(phase7_test::eager_parallel_options(3));
  auto* pool = parallel.pool();
  assert(pool != nullptr);
  assert(pool->thread_count() == 3);
  assert(parallel.pool() == pool);

  const auto before = pool->stats().spawned;
  phase7_test::run_shown("+ 1 ⇡ 1000", parallel);
  assert(pool->stats().spawned > before);
}

}  // namespace

namespace phase7_test {

void run_worker_pool_tests() {
  test_every_index_runs_once();
  test_small_batches_run_inline();
  test_lowest_failing_chunk_wins();
  test_thread_count_and_chunking();
  test_context_owns_pool();
}

}  // namespace phase7_test
