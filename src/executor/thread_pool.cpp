/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation and supervised-execution submission.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include "supervisor/supervisor.hpp"

#include <stop_token>

namespace exec_profiler {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 2;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    // A running execution sees the stop through its merged token and kills
    // its child; queued ones are dropped and their futures report broken_promise.
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (stop.stop_requested() && task_queue_.empty()) return;
            if (task_queue_.empty()) continue;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task(stop);
        --active_tasks_;
    }
}

std::future<Result<ExecutionResult>> ThreadPool::submit_execution(Supervisor& supervisor,
                                                                  Command command,
                                                                  std::filesystem::path log_path,
                                                                  std::stop_token cancel) {
    return submit_cancellable(
        [&supervisor, command = std::move(command), log_path = std::move(log_path),
         cancel = std::move(cancel)](std::stop_token stop) {
            std::stop_source combined;
            std::stop_callback on_pool_stop(stop, [&combined] { combined.request_stop(); });
            std::stop_callback on_cancel(cancel, [&combined] { combined.request_stop(); });
            return supervisor.execute(command, log_path, combined.get_token());
        });
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace exec_profiler
