#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <thread>
#include <string>
#include <vector>
#include "core/cancellation_token.h"
#include "types/result.h"
#include "utils/logger.h"

namespace llink
{
    /**
     * Retry policy configuration
     */
    struct RetryPolicyConfig
    {
        int maxAttempts = 3;
        std::optional<std::chrono::milliseconds> delay;    // Unset means retry immediately
        std::optional<std::chrono::milliseconds> maxDelay; // Cap for the grown delay
        double backoffMultiplier = 2.0;
        bool retryOnTimeout = true;   // Retry failures classified as timeouts
        bool retryOnException = true; // Retry any other failure
        // When non-empty, only these codes count as retryable generic failures
        std::vector<LLINK_ERROR_CODE> retryOnErrorCodes;
    };

    /**
     * Outcome of RetryPolicy::execute
     */
    template <typename T>
    struct RetryPolicyResult
    {
        Result<T> result;
        int attempts = 0;
        std::chrono::milliseconds totalDuration{0};

        bool isSuccess() const noexcept { return result.isSuccess(); }
    };

    /**
     * Bounded retry executor with geometric backoff
     */
    class RetryPolicy
    {
    public:
        explicit RetryPolicy(RetryPolicyConfig config = RetryPolicyConfig{});

        static RetryPolicy of(int maxAttempts);
        static RetryPolicy ofWithDelay(int maxAttempts, std::chrono::milliseconds delay);
        static RetryPolicy ofWithBackoff(int maxAttempts, std::chrono::milliseconds delay,
                                         double backoffMultiplier = 2.0,
                                         std::optional<std::chrono::milliseconds> maxDelay = std::nullopt);

        const RetryPolicyConfig &config() const { return m_config; }

        /**
         * Delay to wait after the given failed attempt (1-based)
         */
        std::chrono::milliseconds delayForAttempt(int attempt) const;

        /**
         * Whether a failure is eligible for another attempt
         */
        bool shouldRetry(const ErrorInfo &error) const;

        static bool isTimeoutError(const ErrorInfo &error);

        /**
         * Run the operation until it succeeds or attempts are exhausted
         * An exception thrown by the operation counts as a generic failure.
         * @param operation Callable returning Result<T>
         * @param operationName Name used in log records
         * @param cancellation Optional token observed between attempts
         */
        template <typename T>
        RetryPolicyResult<T> execute(const std::function<Result<T>()> &operation,
                                     const std::string &operationName = "Operation",
                                     const CancellationToken *cancellation = nullptr) const
        {
            const auto start = std::chrono::steady_clock::now();
            auto elapsed = [&start]()
            {
                return std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
            };

            if (m_config.maxAttempts <= 0)
            {
                LABELLINK_LOG_DEBUG("[{}] maxAttempts is {}, not executing", operationName, m_config.maxAttempts);
                return {Result<T>::Error(LLINK_ERROR_CODE::RETRY_LIMIT_EXCEEDED, 0), 0, elapsed()};
            }

            LABELLINK_LOG_DEBUG("[{}] Starting retry policy execution: maxAttempts={}",
                                operationName, m_config.maxAttempts);

            std::optional<ErrorInfo> lastError;
            for (int attempt = 1; attempt <= m_config.maxAttempts; ++attempt)
            {
                if (cancellation && cancellation->isCancelled())
                {
                    LABELLINK_LOG_INFO("[{}] Cancelled before attempt {}/{}", operationName, attempt, m_config.maxAttempts);
                    return {Result<T>::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED), attempt - 1, elapsed()};
                }

                Result<T> outcome = invoke(operation, operationName);
                if (outcome.isSuccess())
                {
                    LABELLINK_LOG_DEBUG("[{}] Attempt {} succeeded after {}ms", operationName, attempt, elapsed().count());
                    return {std::move(outcome), attempt, elapsed()};
                }

                lastError = outcome.error();
                LABELLINK_LOG_DEBUG("[{}] Attempt {}/{} failed: {}", operationName, attempt,
                                    m_config.maxAttempts, lastError->message);

                if (attempt >= m_config.maxAttempts || !shouldRetry(*lastError))
                {
                    return {Result<T>::Error(*lastError), attempt, elapsed()};
                }

                const auto wait = delayForAttempt(attempt);
                if (wait.count() > 0)
                {
                    if (cancellation)
                    {
                        if (cancellation->waitFor(wait))
                        {
                            return {Result<T>::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED), attempt, elapsed()};
                        }
                    }
                    else
                    {
                        std::this_thread::sleep_for(wait);
                    }
                }
            }

            // Unreachable with maxAttempts > 0, the loop returns on the last attempt
            return {Result<T>::Error(*lastError), m_config.maxAttempts, elapsed()};
        }

    private:
        template <typename T>
        static Result<T> invoke(const std::function<Result<T>()> &operation, const std::string &operationName)
        {
            try
            {
                return operation();
            }
            catch (const std::exception &e)
            {
                LABELLINK_LOG_WARN("[{}] Operation threw: {}", operationName, e.what());
                return Result<T>::Error(LLINK_ERROR_CODE::OPERATION_ERROR, e.what());
            }
        }

        RetryPolicyConfig m_config;
    };
} // namespace llink
