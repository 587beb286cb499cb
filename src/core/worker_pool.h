#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size pool of worker threads draining a FIFO task queue.
// The destructor finishes every queued task before joining the workers.

class WorkerPool {
public:
    /**
     * @brief Start a pool with a fixed number of workers
     * @param num_threads Worker count, at least one worker is started
     */
    explicit WorkerPool(size_t num_threads);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task for execution by the next free worker
     * @param task Callable to run; must not throw
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void wait_all();

    size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable task_cv_;
    std::condition_variable completion_cv_;
    bool stop_;
    size_t active_tasks_;
};
