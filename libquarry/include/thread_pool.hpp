/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used by ExtractionExecutor.
 */

#ifndef QUARRY_THREAD_POOL_HPP
#define QUARRY_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace quarry {

    /**
     * @brief A fixed-size thread pool running tasks that accept a std::stop_token.
     *
     * @details Workers are std::jthread, so destruction requests stop and joins.
     * Every task receives the stop_token of the worker running it and should
     * check it between units of work (e.g. between pages).
     */
    class ThreadPool {
    public:
        /**
         * @brief Starts the worker threads.
         * @param threads Number of workers; 0 is treated as 1.
         */
        explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Enqueues a task.
         * @tparam F Callable taking a std::stop_token.
         * @return A future for the task's result. Exceptions thrown by the
         * task are stored in the future.
         * @throws std::runtime_error if the pool has been stopped.
         */
        template<class F>
        auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
            using return_type = std::invoke_result_t<F, std::stop_token>;
            auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
                std::forward<F>(f)
            );
            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
                ++pending_;
                tasks_.emplace([task](std::stop_token st) { (*task)(st); });
            }
            condition_.notify_one();
            return task->get_future();
        }

        /// Blocks until every enqueued task has finished or been discarded.
        void wait_idle();

        /**
         * @brief Discards queued tasks and signals running ones through their stop_token.
         * Running tasks are not interrupted; wait_idle() still waits for them.
         */
        void request_stop();

        [[nodiscard]] size_t thread_count() const noexcept { return workers_.size(); }

    private:
        void worker_loop(const std::stop_token& st);

        std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
        std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
        std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ reaches zero
        std::queue<std::function<void(std::stop_token)>> tasks_;
        bool stop_{false};
        size_t pending_{0};                     ///< Tasks queued or running
        std::vector<std::jthread> workers_;
    };

} // namespace quarry

#endif // QUARRY_THREAD_POOL_HPP
