#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

#include "exceptions.hpp"

namespace core {

    // --- WorkerPool ---
    // Fixed set of threads draining a FIFO of tasks. submit() hands back a
    // future; an exception thrown by the task is rethrown from future::get().
    // Used only for per-symbol work inside a single simulation step.
    class WorkerPool {
    public:
        explicit WorkerPool(std::size_t thread_count);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        std::size_t size() const { return threads_.size(); }

        template <typename F>
        auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using Result = std::invoke_result_t<std::decay_t<F>>;
            auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
            std::future<Result> future = packaged->get_future();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_) {
                    throw CascadeException("WorkerPool::submit called after shutdown");
                }
                tasks_.emplace_back([packaged]() { (*packaged)(); });
            }
            condition_.notify_one();
            return future;
        }

        // Runs fn(item) for every item; futures come back in input order.
        // items must outlive the returned futures. A task that throws
        // rethrows from its own future only.
        template <typename Item, typename F>
        auto mapOrdered(const std::vector<Item>& items, F fn)
            -> std::vector<std::future<std::invoke_result_t<F, const Item&>>> {
            using Result = std::invoke_result_t<F, const Item&>;
            auto shared_fn = std::make_shared<F>(std::move(fn));
            std::vector<std::future<Result>> futures;
            futures.reserve(items.size());
            for (const Item& item : items) {
                const Item* item_ptr = &item;
                futures.push_back(submit([shared_fn, item_ptr]() { return (*shared_fn)(*item_ptr); }));
            }
            return futures;
        }

    private:
        void workerLoop();

        std::vector<std::thread> threads_;
        std::deque<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable condition_;
        bool stopping_ = false;
    };

} // namespace core
