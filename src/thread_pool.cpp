#include "coldpack/thread_pool.hpp"

namespace coldpack {

ThreadPool::ThreadPool(size_t threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown(true);
}

void ThreadPool::execute(std::function<void()> f) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) throw std::runtime_error("execute on stopped ThreadPool");
        tasks_.push(std::move(f));
    }
    cv_.notify_one();
}

void ThreadPool::shutdown(bool wait) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
        if (!wait) {
            std::queue<std::function<void()>> empty;
            tasks_.swap(empty);
        }
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

size_t ThreadPool::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;  // stopping and drained
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

}  // namespace coldpack
