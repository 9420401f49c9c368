#include "worker_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

WorkerPool::WorkerPool(int workers) : workers_(workers > 0 ? workers : 1) {
    threads_.reserve(workers_);
    for (int i = 0; i < workers_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    batchq_log(fmt::format("pool: started {} worker(s)", workers_));
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_.store(true);
    }
    task_available_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    batchq_log("pool: stopped");
}

std::shared_future<int> WorkerPool::submit(std::function<int()> task) {
    std::packaged_task<int()> pt(std::move(task));
    std::shared_future<int> result = pt.get_future().share();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        tasks_.push(std::move(pt));
    }
    task_available_.notify_one();
    return result;
}

void WorkerPool::worker_loop(int worker_id) {
    while (true) {
        std::packaged_task<int()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            task_available_.wait(lock, [this] {
                return !tasks_.empty() || shutdown_.load();
            });

            // Drain before exiting so no submitted job is lost
            if (tasks_.empty()) break;

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // Exceptions land in the task's future
        task();
    }
    batchq_log(fmt::format("pool: worker {} exiting", worker_id));
}
