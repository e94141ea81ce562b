#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "types.hpp"

// Number of workers for a run: fixed once the pool is built.
std::size_t resolve_worker_count(const ParallelConfig& config,
                                 unsigned int hardware_threads =
                                     std::thread::hardware_concurrency());

// Fixed set of worker threads fed from one bounded FIFO queue.
//
// drain(): no new work is accepted, queued work runs to completion, workers
// exit. request_stop(): queued work is dropped, running tasks see their
// stop_token set and finish, workers exit. Both are idempotent and the
// destructor drains.
class WorkerPool {
 public:
  using Task = std::function<void(std::stop_token)>;

  WorkerPool(std::size_t worker_count, std::size_t queue_capacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Blocks while the queue is full. Returns false once the pool is draining
  // or stopping; the task is then not run.
  bool submit(Task task);

  void drain();
  void request_stop();

  bool stop_requested() const { return m_stopping; }
  std::size_t worker_count() const { return m_worker_count; }

  // Tasks dropped from the queue by request_stop().
  std::size_t dropped() const { return m_dropped; }

 private:
  void worker_loop(std::stop_token stoken);

  std::size_t m_worker_count;
  std::size_t m_capacity;
  std::vector<std::jthread> m_workers;

  std::mutex m_mutex;
  std::condition_variable_any m_not_empty;
  std::condition_variable_any m_not_full;
  std::deque<Task> m_tasks;
  bool m_closed = false;
  std::atomic<bool> m_stopping = false;
  std::atomic<std::size_t> m_dropped = 0;
};
