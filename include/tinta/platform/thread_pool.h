#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace tinta::platform {

// Fixed-size worker pool used to render independent layers and filter
// primitives concurrently. Tasks never share mutable pixel buffers.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    void post(std::function<void()> task);

    // Runs every job and blocks until all of them finished. The calling
    // thread executes jobs too, so nested calls from a worker cannot
    // starve the pool. The first exception thrown by a job is rethrown.
    void run_all(std::vector<std::function<void()>> jobs);

    size_t size() const;

    void shutdown();

    bool is_running() const;

private:
    void worker_loop();
    bool run_one_pending();

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_{false};
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    auto future = task->get_future();
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        tasks_.emplace_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

} // namespace tinta::platform
