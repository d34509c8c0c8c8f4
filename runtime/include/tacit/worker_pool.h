#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace tacit {

struct PoolStats {
  std::size_t threads = 0;
  std::size_t spawned = 0;
  std::size_t executed = 0;
  std::size_t steals = 0;
};

// Work-stealing pool owned by an execution context. Each worker has its own
// deque; idle workers steal from the front of their neighbours' queues.
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::size_t thread_count() const { return workers_.size(); }

  // Runs body(begin, end) over [0, total) in chunks and blocks until all of
  // them finish. The calling thread helps drain the queues. If chunks throw,
  // the error of the lowest failing chunk is rethrown.
  void parallel_for(std::size_t total, std::size_t chunk,
                    const std::function<void(std::size_t, std::size_t)>& body);

  PoolStats stats() const;

 private:
  struct TaskItem {
    std::function<void()> run;
  };

  struct Worker {
    std::mutex mutex;
    std::deque<TaskItem> queue;
    std::thread thread;
  };

  void enqueue_item(TaskItem item);
  bool pop_local(std::size_t worker_index, TaskItem& out);
  bool steal_remote(std::size_t worker_index, TaskItem& out);
  bool assist_one();
  void run_item(TaskItem& item);
  void worker_loop(std::size_t worker_index);

  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<bool> done_;
  std::atomic<std::size_t> rr_index_;
  std::atomic<std::size_t> pending_;
  std::atomic<std::size_t> spawned_;
  std::atomic<std::size_t> executed_;
  std::atomic<std::size_t> steals_;
  mutable std::mutex cv_mutex_;
  std::condition_variable cv_;
};

std::size_t default_thread_count();
std::size_t default_chunk_size(std::size_t total, std::size_t configured);

}  // namespace tacit
