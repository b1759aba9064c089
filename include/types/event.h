#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "types/print.h"

namespace llink
{
    enum class PrintEventType
    {
        STEP_CHANGED = 0,
        PROGRESS_UPDATE,
        ERROR_OCCURRED,
        RETRY_ATTEMPT,
        STATUS_UPDATE,
        COMPLETED,
        CANCELLED,
    };

    inline std::string printEventTypeToString(PrintEventType type)
    {
        switch (type)
        {
        case PrintEventType::STEP_CHANGED:
            return "stepChanged";
        case PrintEventType::PROGRESS_UPDATE:
            return "progressUpdate";
        case PrintEventType::ERROR_OCCURRED:
            return "errorOccurred";
        case PrintEventType::RETRY_ATTEMPT:
            return "retryAttempt";
        case PrintEventType::STATUS_UPDATE:
            return "statusUpdate";
        case PrintEventType::COMPLETED:
            return "completed";
        case PrintEventType::CANCELLED:
            return "cancelled";
        default:
            return "unknown";
        }
    }

    /**
     * Transition into a new step
     */
    struct StepChangedEvent
    {
        PrintStep step = PrintStep::INITIALIZING;
        std::string message;
        int attempt = 1;
        int maxAttempts = 1;
        std::chrono::milliseconds elapsed{0};
        double progress = 0.0;

        bool isRetry() const { return attempt > 1; }
        bool isFinalAttempt() const { return attempt >= maxAttempts; }
    };

    struct ProgressUpdateEvent
    {
        double progress = 0.0;
        std::string currentOperation;
        std::chrono::milliseconds elapsed{0};
        std::chrono::milliseconds estimatedRemaining{0};
    };

    struct ErrorOccurredEvent
    {
        PrintErrorInfo error;
        PrintStep step = PrintStep::INITIALIZING;
        bool willRetry = false;
    };

    struct RetryAttemptEvent
    {
        int attempt = 1; // Attempt about to start
        int maxAttempts = 1;
        std::chrono::milliseconds delay{0};
        std::string reason;
    };

    // Printer status observed during checking-status
    struct StatusUpdateEvent
    {
        bool isReady = false;
        std::vector<std::string> issues;
        std::vector<std::string> corrections;
        std::map<std::string, std::string> details;
    };

    struct CompletedEvent
    {
        std::chrono::milliseconds elapsed{0};
        int attempts = 1;
        size_t bytesSent = 0;
    };

    struct CancelledEvent
    {
        PrintStep step = PrintStep::INITIALIZING; // Step at which cancellation was observed
        std::chrono::milliseconds elapsed{0};
    };

    using PrintEventPayload = std::variant<StepChangedEvent,
                                           ProgressUpdateEvent,
                                           ErrorOccurredEvent,
                                           RetryAttemptEvent,
                                           StatusUpdateEvent,
                                           CompletedEvent,
                                           CancelledEvent>;

    /**
     * One entry of the workflow event stream
     */
    struct PrintEvent
    {
        PrintEventPayload payload;
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

        PrintEventType type() const { return static_cast<PrintEventType>(payload.index()); }

        template <typename T>
        const T *as() const
        {
            return std::get_if<T>(&payload);
        }

        template <typename T>
        bool is() const
        {
            return std::holds_alternative<T>(payload);
        }
    };
} // namespace llink
