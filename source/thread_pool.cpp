#include <gitscope/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gitscope {

ThreadPool::ThreadPool(unsigned n) {
  if (n == 0)
    n = std::max(1u, std::thread::hardware_concurrency());
  for (unsigned i = 0; i < n; i++) {
    workers_.emplace_back([this] {
      for (;;) {
        std::function<void()> job;
        {
          std::unique_lock<std::mutex> lk(m_);
          cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
          if (stop_ && q_.empty())
            return;
          job = std::move(q_.front());
          q_.pop();
        }
        try {
          job();
        } catch (const std::exception &e) {
          spdlog::error("[pool] job failed: {}", e.what());
        }
        {
          std::lock_guard<std::mutex> lk(m_);
          if (--pending_ == 0)
            idle_cv_.notify_all();
        }
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lk(m_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto &t : workers_)
    t.join();
}

void ThreadPool::submit(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lk(m_);
    q_.emplace(std::move(fn));
    ++pending_;
  }
  cv_.notify_one();
}

void ThreadPool::wait_idle() {
  std::unique_lock<std::mutex> lk(m_);
  idle_cv_.wait(lk, [&] { return pending_ == 0; });
}

} // namespace gitscope
