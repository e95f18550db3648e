/**
 * Fixed-size worker pool for codec parallelism
 *
 * Used for read-only candidate evaluation inside one encode and for
 * encoding independent inputs in a batch. Each caller owns a short-lived
 * pool sized by its configuration. Tasks must not wait on other tasks of
 * the same pool.
 */

#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace fracktal {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);  // 0 = hardware concurrency
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    // Runs func(i) for i in [start, end), split into contiguous ranges.
    // Blocks until every range finished; the first exception thrown by any
    // range is rethrown here after all ranges completed.
    void parallel_for_index(size_t start, size_t end,
                            const std::function<void(size_t)>& func);

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<ReturnType> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return result;
}

// Resolves a configured thread count (0 = hardware concurrency, never below 1)
size_t resolve_thread_count(size_t requested);

// Workers to start for `work_items` independent items: the resolved count,
// capped by the item count, never below 1
size_t bounded_thread_count(size_t requested, size_t work_items);

} // namespace fracktal
