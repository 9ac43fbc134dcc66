#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gitscope {

class ThreadPool {
public:
  explicit ThreadPool(unsigned n);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void submit(std::function<void()> fn);
  // ждёт, пока очередь опустеет и все задачи завершатся
  void wait_idle();

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> q_;
  std::mutex m_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::size_t pending_{0};
  std::atomic<bool> stop_{false};
};

} // namespace gitscope
