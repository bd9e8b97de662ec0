#include "worker_pool.hpp"
#include "logging.hpp"

namespace core {

    WorkerPool::WorkerPool(std::size_t thread_count) {
        if (thread_count == 0) {
            thread_count = 1;
        }
        threads_.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this]() { workerLoop(); });
        }
        if (logging::isInitialized()) {
            logging::getLogger()->debug("WorkerPool started with {} threads", thread_count);
        }
    }

    WorkerPool::~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        condition_.notify_all();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void WorkerPool::workerLoop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                condition_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
                // Drain remaining work before exiting so no future is left unfulfilled
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            // packaged_task captures the task's own exception into its future
            task();
        }
    }

} // namespace core
