#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include "core/error_handler.h"
#include "types/result.h"
#include "utils/logger.h"
#include "utils/thread_pool.h"

namespace llink
{
    /**
     * Bounds the wall-clock time of a single blocking call
     *
     * The call runs on a shared worker pool. When the deadline passes the
     * caller gets OPERATION_TIMEOUT and the abandoned call finishes in the
     * background, so the callable must own everything it touches.
     */
    class TimeoutPolicy
    {
    public:
        explicit TimeoutPolicy(std::chrono::milliseconds timeout)
            : m_timeout(timeout)
        {
        }

        std::chrono::milliseconds timeout() const { return m_timeout; }

        template <typename T>
        Result<T> execute(std::function<Result<T>()> operation, const std::string &operationName = "Operation") const
        {
            const auto start = std::chrono::steady_clock::now();
            std::future<Result<T>> future;
            try
            {
                future = pool().enqueue(std::move(operation));
            }
            catch (const std::runtime_error &e)
            {
                return Result<T>::Error(LLINK_ERROR_CODE::OPERATION_ERROR, e.what());
            }

            if (future.wait_for(m_timeout) != std::future_status::ready)
            {
                LABELLINK_LOG_WARN("[{}] Timed out after {}ms", operationName, m_timeout.count());
                return Result<T>::Error(ErrorHandler::createTimeoutFailure(operationName, start));
            }

            try
            {
                return future.get();
            }
            catch (const std::exception &e)
            {
                LABELLINK_LOG_WARN("[{}] Operation threw: {}", operationName, e.what());
                return Result<T>::Error(LLINK_ERROR_CODE::OPERATION_ERROR, e.what());
            }
        }

        /**
         * Pool shared by every timeout-bounded call in the process
         */
        static ThreadPool &pool();

    private:
        std::chrono::milliseconds m_timeout;
    };
} // namespace llink
