#pragma once
#include <cstddef>
#include <functional>
#include <thread>

namespace zipcat {

using ThreadFactory = std::function<std::thread(std::function<void()>)>;

ThreadFactory defaultThreadFactory();

// Runs `worker` on up to `n` threads and joins them all before returning.
// `worker` must pull its own work until none is left, so any number of
// copies may run. When a thread cannot be started the ones already running
// carry the load; with none started the caller runs `worker` itself.
void runWorkers(size_t n, const std::function<void()>& worker,
                const ThreadFactory& spawn = defaultThreadFactory());

} // namespace zipcat
