#include "WorkerPool.hpp"

#include <algorithm>
#include <format>

#include "IOManager.hpp"

std::size_t resolve_worker_count(const ParallelConfig& config,
                                 unsigned int hardware_threads) {
  if (!config.enabled) return 1;
  const auto limit =
      static_cast<std::size_t>(std::max(1, config.max_workers_limit));
  if (config.max_workers) {
    return std::clamp<std::size_t>(
        static_cast<std::size_t>(std::max(1, *config.max_workers)), 1, limit);
  }
  const std::size_t cores = hardware_threads == 0 ? 4 : hardware_threads;
  const auto multiplier =
      static_cast<std::size_t>(std::max(1, config.cpu_multiplier));
  return std::clamp<std::size_t>(cores * multiplier, 1, limit);
}

WorkerPool::WorkerPool(std::size_t worker_count, std::size_t queue_capacity)
    : m_worker_count(std::max<std::size_t>(1, worker_count)),
      m_capacity(std::max<std::size_t>(1, queue_capacity)) {
  m_workers.reserve(m_worker_count);
  for (std::size_t i = 0; i < m_worker_count; ++i) {
    m_workers.emplace_back(
        [this](std::stop_token stoken) { worker_loop(stoken); });
  }
}

WorkerPool::~WorkerPool() { drain(); }

bool WorkerPool::submit(Task task) {
  std::unique_lock lock(m_mutex);
  m_not_full.wait(lock, [this] {
    return m_closed || m_stopping || m_tasks.size() < m_capacity;
  });
  if (m_closed || m_stopping) return false;
  m_tasks.push_back(std::move(task));
  lock.unlock();
  m_not_empty.notify_one();
  return true;
}

void WorkerPool::drain() {
  {
    std::scoped_lock lock(m_mutex);
    m_closed = true;
  }
  m_not_empty.notify_all();
  m_not_full.notify_all();
  for (auto& worker : m_workers) {
    if (worker.joinable()) worker.join();
  }
}

void WorkerPool::request_stop() {
  {
    std::scoped_lock lock(m_mutex);
    if (m_stopping) return;
    m_stopping = true;
    m_dropped += m_tasks.size();
    m_tasks.clear();
  }
  for (auto& worker : m_workers) {
    worker.request_stop();
  }
  m_not_empty.notify_all();
  m_not_full.notify_all();
}

void WorkerPool::worker_loop(std::stop_token stoken) {
  while (true) {
    Task task;
    {
      std::unique_lock lock(m_mutex);
      m_not_empty.wait(lock, stoken,
                       [this] { return m_closed || !m_tasks.empty(); });
      if (stoken.stop_requested() || m_tasks.empty()) return;
      task = std::move(m_tasks.front());
      m_tasks.pop_front();
    }
    m_not_full.notify_one();

    try {
      task(stoken);
    } catch (const std::exception& e) {
      IOManager::log(std::format("[ERROR] Unhandled exception in worker: {}",
                                 e.what()));
    }
  }
}
