#pragma once

#include <thread>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <stdexcept>

namespace llink
{
    /**
     * Fixed-size worker pool
     * Used to bound the wall-clock time of blocking transport calls:
     * the caller waits on the returned future and may abandon it.
     */
    class ThreadPool
    {
    public:
        /**
         * Constructor
         * @param numThreads Number of worker threads
         */
        explicit ThreadPool(size_t numThreads = 4)
            : m_stop(false)
        {
            if (numThreads == 0)
            {
                numThreads = 1;
            }

            for (size_t i = 0; i < numThreads; ++i)
            {
                m_workers.emplace_back([this]
                                       { workerLoop(); });
            }
        }

        /**
         * Destructor - drains queued tasks and joins the workers
         */
        ~ThreadPool()
        {
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_stop = true;
            }

            m_condition.notify_all();

            for (auto &worker : m_workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;

        /**
         * Enqueue a task for execution
         * Exceptions thrown by the task are delivered through the future.
         * @throws std::runtime_error if the pool is stopping
         */
        template <typename F>
        auto enqueue(F &&f) -> std::future<typename std::invoke_result<F>::type>
        {
            using return_type = typename std::invoke_result<F>::type;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                if (m_stop)
                {
                    throw std::runtime_error("Cannot enqueue on stopped ThreadPool");
                }
                m_tasks.emplace([task]()
                                { (*task)(); });
            }

            m_condition.notify_one();
            return result;
        }

        size_t pendingTasks() const
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            return m_tasks.size();
        }

        size_t workerCount() const
        {
            return m_workers.size();
        }

    private:
        void workerLoop()
        {
            while (true)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(m_queueMutex);
                    m_condition.wait(lock, [this]
                                     { return m_stop || !m_tasks.empty(); });

                    if (m_stop && m_tasks.empty())
                    {
                        return;
                    }

                    task = std::move(m_tasks.front());
                    m_tasks.pop();
                }

                // packaged_task stores exceptions in its shared state
                task();
            }
        }

        std::vector<std::thread> m_workers;
        std::queue<std::function<void()>> m_tasks;

        mutable std::mutex m_queueMutex;
        std::condition_variable m_condition;
        std::atomic<bool> m_stop;
    };

} // namespace llink
