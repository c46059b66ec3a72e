#include <tinta/platform/thread_pool.h>

#include <chrono>
#include <exception>
#include <memory>

namespace tinta::platform {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        tasks_.emplace_back(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::run_all(std::vector<std::function<void()>> jobs) {
    if (jobs.empty()) return;
    if (jobs.size() == 1) {
        jobs.front()();
        return;
    }

    std::vector<std::future<void>> futures;
    futures.reserve(jobs.size() - 1);
    for (size_t i = 1; i < jobs.size(); ++i) {
        futures.push_back(submit(std::move(jobs[i])));
    }

    std::exception_ptr first_error;
    try {
        jobs.front()();
    } catch (...) {
        first_error = std::current_exception();
    }

    for (auto& future : futures) {
        // Help drain the queue while our own jobs are still pending.
        while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            if (!run_one_pending()) {
                future.wait();
                break;
            }
        }
        try {
            future.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

size_t ThreadPool::size() const {
    return workers_.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::is_running() const {
    return !shutdown_.load();
}

bool ThreadPool::run_one_pending() {
    std::function<void()> task;
    {
        std::lock_guard lock(mutex_);
        if (tasks_.empty()) {
            return false;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
    }
    task();
    return true;
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() {
                return shutdown_.load() || !tasks_.empty();
            });

            if (tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

} // namespace tinta::platform
