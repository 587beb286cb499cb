// Worker pool implementation

#include "worker_pool.h"
#include <algorithm>

WorkerPool::WorkerPool(size_t num_threads)
    : stop_(false), active_tasks_(0) {
    num_threads = std::max<size_t>(1, num_threads);
    threads_.reserve(num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    task_cv_.wait(lock, [this] { return !tasks_.empty() || stop_; });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                    ++active_tasks_;
                }

                task();

                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    --active_tasks_;
                }
                completion_cv_.notify_all();
            }
        });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    task_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }
    task_cv_.notify_one();
}

void WorkerPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    completion_cv_.wait(lock, [this] { return tasks_.empty() && active_tasks_ == 0; });
}
