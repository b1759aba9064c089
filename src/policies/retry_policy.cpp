#include "policies/retry_policy.h"
#include <algorithm>
#include <cmath>

namespace llink
{
    RetryPolicy::RetryPolicy(RetryPolicyConfig config)
        : m_config(std::move(config))
    {
    }

    RetryPolicy RetryPolicy::of(int maxAttempts)
    {
        RetryPolicyConfig config;
        config.maxAttempts = maxAttempts;
        return RetryPolicy(config);
    }

    RetryPolicy RetryPolicy::ofWithDelay(int maxAttempts, std::chrono::milliseconds delay)
    {
        RetryPolicyConfig config;
        config.maxAttempts = maxAttempts;
        config.delay = delay;
        config.backoffMultiplier = 1.0;
        return RetryPolicy(config);
    }

    RetryPolicy RetryPolicy::ofWithBackoff(int maxAttempts, std::chrono::milliseconds delay,
                                           double backoffMultiplier,
                                           std::optional<std::chrono::milliseconds> maxDelay)
    {
        RetryPolicyConfig config;
        config.maxAttempts = maxAttempts;
        config.delay = delay;
        config.backoffMultiplier = backoffMultiplier;
        config.maxDelay = maxDelay;
        return RetryPolicy(config);
    }

    std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const
    {
        if (!m_config.delay || attempt < 1)
        {
            return std::chrono::milliseconds(0);
        }

        const double multiplier = m_config.backoffMultiplier > 0.0 ? m_config.backoffMultiplier : 1.0;
        double millis = static_cast<double>(m_config.delay->count()) * std::pow(multiplier, attempt - 1);
        if (m_config.maxDelay)
        {
            millis = std::min(millis, static_cast<double>(m_config.maxDelay->count()));
        }
        return std::chrono::milliseconds(static_cast<long long>(millis));
    }

    bool RetryPolicy::isTimeoutError(const ErrorInfo &error)
    {
        switch (error.code)
        {
        case LLINK_ERROR_CODE::CONNECTION_TIMEOUT:
        case LLINK_ERROR_CODE::OPERATION_TIMEOUT:
        case LLINK_ERROR_CODE::STATUS_TIMEOUT:
        case LLINK_ERROR_CODE::PRINT_TIMEOUT:
            return true;
        default:
            return false;
        }
    }

    bool RetryPolicy::shouldRetry(const ErrorInfo &error) const
    {
        if (error.code == LLINK_ERROR_CODE::OPERATION_CANCELLED)
        {
            return false;
        }
        if (isTimeoutError(error))
        {
            return m_config.retryOnTimeout;
        }
        if (!m_config.retryOnException)
        {
            return false;
        }
        if (m_config.retryOnErrorCodes.empty())
        {
            return true;
        }
        return std::find(m_config.retryOnErrorCodes.begin(), m_config.retryOnErrorCodes.end(),
                         error.code) != m_config.retryOnErrorCodes.end();
    }
} // namespace llink
