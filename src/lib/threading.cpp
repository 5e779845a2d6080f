#include "threading.hpp"
#include <algorithm>

namespace chartok {
namespace threading {

ThreadPool::ThreadPool(size_t threads) : num_threads(threads) {
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock,
                                   [this]() { return stop || !tasks.empty(); });

                    if (stop && tasks.empty()) {
                        return;
                    }

                    // Counted as active before leaving the lock so wait()
                    // never sees an empty queue with a task in flight
                    task = std::move(tasks.front());
                    tasks.pop_front();
                    ++active_tasks;
                }

                task();

                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    --active_tasks;
                    if (active_tasks == 0 && tasks.empty()) {
                        idle.notify_all();
                    }
                }
            }
        });
    }
}

void ThreadPool::wait() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle.wait(lock, [this]() { return active_tasks == 0 && tasks.empty(); });
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all();
    for (std::thread &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void parallel_for(size_t count, size_t num_threads,
                  const std::function<void(size_t)> &fn) {
    if (num_threads == 0) {
        num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    num_threads = std::min(num_threads, count);
    if (num_threads <= 1) {
        for (size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    ThreadPool thread_pool(num_threads);
    const size_t chunk_size = (count + num_threads - 1) / num_threads;
    for (size_t t = 0; t < num_threads; ++t) {
        const size_t start = t * chunk_size;
        const size_t end = std::min(start + chunk_size, count);
        if (start >= end) break;
        thread_pool.enqueue([&fn, start, end]() {
            for (size_t i = start; i < end; ++i) fn(i);
        });
    }
    thread_pool.wait();
}

} // namespace threading
} // namespace chartok
