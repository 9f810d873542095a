#include "parallel/thread_pool.h"

#include <numa.h>
#include <spdlog/spdlog.h>

namespace qpscd {

ThreadPool::ThreadPool(std::size_t threads, int node) : node_(node) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) w.join();
}

void ThreadPool::worker_loop() {
    if (node_ >= 0 && numa_available() >= 0) {
        if (numa_run_on_node(node_) != 0) {
            spdlog::warn("ThreadPool: could not bind worker to NUMA node {}",
                         node_);
        }
    }

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        // packaged_task captures any exception into the future.
        task();
    }
}

}  // namespace qpscd
