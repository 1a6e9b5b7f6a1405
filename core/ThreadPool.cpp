#include "core/ThreadPool.hpp"
#include "core/Logger.hpp"

namespace homescout {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue)
    : max_queue_(max_queue) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

bool ThreadPool::TrySubmit(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_ || (max_queue_ != 0 && tasks_.size() >= max_queue_)) {
            ++rejected_;
            return false;
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::WaitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPool::GetQueueSize() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void ThreadPool::WorkerThread() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& ex) {
            LOG_ERROR("ThreadPool: task threw: {}", ex.what());
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --running_;
            if (tasks_.empty() && running_ == 0) {
                idle_condition_.notify_all();
            }
        }
    }
}

} // namespace homescout
