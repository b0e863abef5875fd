#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace bashbuddy {

// Fixed set of worker threads with a bounded amount of outstanding work.
// try_submit() refuses new work once `capacity` tasks are queued or running.
class WorkerPool {
public:
    explicit WorkerPool(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
        for (size_t i = 0; i < capacity_; ++i) {
            workers_.emplace_back([this] {
                for (;;) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mu_);
                        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                    {
                        std::lock_guard<std::mutex> lock(mu_);
                        outstanding_--;
                    }
                }
            });
        }
    }

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) w.join();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool try_submit(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (stop_ || outstanding_ >= capacity_) return false;
            outstanding_++;
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mu_;
    std::condition_variable cv_;
    size_t outstanding_ = 0;
    bool stop_ = false;
};

} // namespace bashbuddy
