#include "fracktal/thread_pool.hpp"

#include <algorithm>
#include <exception>

namespace fracktal {

size_t resolve_thread_count(size_t requested) {
    if (requested > 0) return requested;
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

size_t bounded_thread_count(size_t requested, size_t work_items) {
    return std::max<size_t>(1, std::min(resolve_thread_count(requested), work_items));
}

ThreadPool::ThreadPool(size_t num_threads) {
    size_t count = resolve_thread_count(num_threads);

    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                    if (stop_ && tasks_.empty()) return;

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::parallel_for_index(size_t start, size_t end,
                                    const std::function<void(size_t)>& func) {
    if (start >= end) return;

    size_t count = end - start;
    size_t chunk_size = (count + workers_.size() - 1) / workers_.size();

    std::vector<std::future<void>> pending;
    pending.reserve(workers_.size());

    for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk_size) {
        size_t chunk_end = std::min(chunk_start + chunk_size, end);
        pending.push_back(submit([&func, chunk_start, chunk_end] {
            for (size_t i = chunk_start; i < chunk_end; ++i) {
                func(i);
            }
        }));
    }

    // Wait for every range before rethrowing so no task outlives func
    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
}

} // namespace fracktal
