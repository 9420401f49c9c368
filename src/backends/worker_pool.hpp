#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size FIFO thread pool running local jobs. Tasks start in submission
// order, so a task that waits on an earlier task's future can't deadlock
// the pool. Destruction runs whatever is still queued, then joins.
class WorkerPool {
public:
    explicit WorkerPool(int workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task; the future yields its return value (or exception).
    std::shared_future<int> submit(std::function<int()> task);

    int worker_count() const { return workers_; }

private:
    void worker_loop(int worker_id);

    int workers_;
    std::atomic<bool> shutdown_{false};

    std::mutex queue_mutex_;
    std::condition_variable task_available_;
    std::queue<std::packaged_task<int()>> tasks_;

    std::vector<std::thread> threads_;
};
