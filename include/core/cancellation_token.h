#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace llink
{
    /**
     * Cooperative cancellation flag
     * cancel() may be called from any thread; waiters wake immediately.
     */
    class CancellationToken
    {
    public:
        void cancel()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_cancelled = true;
            }
            m_cv.notify_all();
        }

        bool isCancelled() const noexcept
        {
            return m_cancelled.load();
        }

        void reset()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = false;
        }

        /**
         * Sleep for the given duration or until cancelled
         * @return true if the token was cancelled
         */
        template <typename Rep, typename Period>
        bool waitFor(const std::chrono::duration<Rep, Period> &duration) const
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            return m_cv.wait_for(lock, duration, [this]
                                 { return m_cancelled.load(); });
        }

    private:
        mutable std::mutex m_mutex;
        mutable std::condition_variable m_cv;
        std::atomic<bool> m_cancelled{false};
    };
} // namespace llink
