#include "WorkerPool.hpp"

#include <exception>
#include <vector>

#include <spdlog/spdlog.h>

namespace zipcat {

ThreadFactory defaultThreadFactory() {
  return [](std::function<void()> fn) { return std::thread(std::move(fn)); };
}

void runWorkers(size_t n, const std::function<void()>& worker, const ThreadFactory& spawn) {
  if (n <= 1) {
    worker();
    return;
  }

  std::vector<std::thread> pool;
  pool.reserve(n);
  for (size_t t = 0; t < n; ++t) {
    try {
      pool.push_back(spawn(worker));
    } catch (const std::exception& e) {
      spdlog::warn("started {} of {} worker threads: {}", pool.size(), n, e.what());
      break;
    }
  }
  if (pool.empty()) worker();
  for (auto& t : pool) t.join();
}

} // namespace zipcat
