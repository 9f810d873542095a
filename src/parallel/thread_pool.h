#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool bound to one NUMA domain.
///
/// Workers pin themselves to their node with numa_run_on_node() on
/// startup and then pull tasks from a mutex-protected FIFO. The solver
/// keeps one pool per replica for its lifetime. The queue lock is only
/// taken at task boundaries, never inside a coordinate update.

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace qpscd {

class ThreadPool {
public:
    /// @param threads Number of workers (0 is treated as 1).
    /// @param node    NUMA node to run on, or -1 for no pinning.
    explicit ThreadPool(std::size_t threads, int node = -1);

    /// Drains the queue and joins all workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable. Exceptions it throws surface from future::get().
    template <class F, class R = std::invoke_result_t<std::decay_t<F>>>
    std::future<R> enqueue(F&& f);

    std::size_t thread_count() const { return workers_.size(); }
    int node() const { return node_; }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
    int node_;
};

template <class F, class R>
std::future<R> ThreadPool::enqueue(F&& f) {
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        tasks_.emplace([task = std::move(task)]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

}  // namespace qpscd
