#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "types/printer.h"
#include "types/readiness.h"
#include "types/result.h"

namespace llink
{
    /**
     * Steps of one print attempt
     * COMPLETED, FAILED and CANCELLED are terminal
     */
    enum class PrintStep
    {
        INITIALIZING = 0,
        VALIDATING,
        CONNECTING,
        CONNECTED,
        CHECKING_STATUS,
        SENDING,
        WAITING_FOR_COMPLETION,
        COMPLETED,
        FAILED,
        CANCELLED,
    };

    inline std::string printStepToString(PrintStep step)
    {
        switch (step)
        {
        case PrintStep::INITIALIZING:
            return "initializing";
        case PrintStep::VALIDATING:
            return "validating";
        case PrintStep::CONNECTING:
            return "connecting";
        case PrintStep::CONNECTED:
            return "connected";
        case PrintStep::CHECKING_STATUS:
            return "checkingStatus";
        case PrintStep::SENDING:
            return "sending";
        case PrintStep::WAITING_FOR_COMPLETION:
            return "waitingForCompletion";
        case PrintStep::COMPLETED:
            return "completed";
        case PrintStep::FAILED:
            return "failed";
        case PrintStep::CANCELLED:
            return "cancelled";
        default:
            return "unknown";
        }
    }

    inline bool isTerminalStep(PrintStep step)
    {
        return step == PrintStep::COMPLETED || step == PrintStep::FAILED || step == PrintStep::CANCELLED;
    }

    /**
     * Fixed progress fraction of a step
     * Terminal failure steps keep the last progress reached.
     */
    inline double progressForStep(PrintStep step, double lastProgress)
    {
        switch (step)
        {
        case PrintStep::INITIALIZING:
            return 0.0;
        case PrintStep::VALIDATING:
            return 0.1;
        case PrintStep::CONNECTING:
            return 0.2;
        case PrintStep::CONNECTED:
            return 0.3;
        case PrintStep::CHECKING_STATUS:
            return 0.4;
        case PrintStep::SENDING:
            return 0.6;
        case PrintStep::WAITING_FOR_COMPLETION:
            return 0.8;
        case PrintStep::COMPLETED:
            return 1.0;
        default:
            return lastProgress;
        }
    }

    enum class ErrorRecoverability
    {
        RECOVERABLE = 0,
        NON_RECOVERABLE,
        POSSIBLY_RECOVERABLE,
        UNKNOWN,
    };

    inline std::string recoverabilityToString(ErrorRecoverability recoverability)
    {
        switch (recoverability)
        {
        case ErrorRecoverability::RECOVERABLE:
            return "recoverable";
        case ErrorRecoverability::NON_RECOVERABLE:
            return "nonRecoverable";
        case ErrorRecoverability::POSSIBLY_RECOVERABLE:
            return "possiblyRecoverable";
        default:
            return "unknown";
        }
    }

    /**
     * Workflow failure: the underlying error plus its classification
     */
    struct PrintErrorInfo
    {
        ErrorInfo error;
        ErrorRecoverability recoverability = ErrorRecoverability::UNKNOWN;
        std::optional<std::string> recoveryHint; // Omitted while the workflow retries on its own

        LLINK_ERROR_CODE code() const { return error.code; }
        const std::string &message() const { return error.message; }
    };

    /**
     * Options for a single print attempt
     */
    struct PrintOptions
    {
        int maxAttempts = 3;
        std::chrono::milliseconds connectTimeout{10000};
        std::chrono::milliseconds statusCheckTimeout{5000};
        std::chrono::milliseconds sendTimeout{30000};

        bool validateData = true;
        bool checkStatus = true;
        bool waitForCompletion = true;

        ReadinessOptions readinessOptions = ReadinessOptions::forPrinting();
        // Derived from readinessOptions when not set
        std::optional<AutoCorrectionOptions> autoCorrection;

        // Delay before retry n is min(retryBaseDelay * n, retryMaxDelay)
        std::chrono::milliseconds retryBaseDelay{2000};
        std::chrono::milliseconds retryMaxDelay{30000};

        std::chrono::milliseconds maxDwellTime{60000};

        AutoCorrectionOptions correctionOptions() const
        {
            return autoCorrection ? *autoCorrection : AutoCorrectionOptions::fromReadinessOptions(readinessOptions);
        }

        static PrintOptions defaults() { return PrintOptions{}; }

        static PrintOptions withoutCompletion()
        {
            PrintOptions options;
            options.waitForCompletion = false;
            return options;
        }
    };

    /**
     * Batch printing: the single-print options plus batch behaviour
     */
    struct BatchPrintOptions
    {
        PrintOptions print;
        std::chrono::milliseconds delayBetweenJobs{500};
        bool stopOnError = false;
    };

    /**
     * Immutable snapshot of a print attempt
     * The workflow publishes a new snapshot on every change.
     */
    struct PrintState
    {
        PrintStep step = PrintStep::INITIALIZING;
        bool isRunning = false;
        bool isCompleted = false;
        bool isCancelled = false;
        std::string message;
        std::optional<PrintErrorInfo> error;
        std::vector<std::string> issues;
        int currentAttempt = 1;
        int maxAttempts = 3;
        double progress = 0.0;
        std::optional<std::chrono::system_clock::time_point> startTime;
        std::chrono::milliseconds elapsed{0};

        bool isPrinting() const { return isRunning && !isCompleted && !isCancelled; }
        bool hasFailed() const { return error.has_value() && !isRunning; }
        bool isRetrying() const { return currentAttempt > 1 && isRunning; }
        int retryCount() const { return currentAttempt > 1 ? currentAttempt - 1 : 0; }
        bool hasIssues() const { return !issues.empty(); }
    };

    /**
     * Outcome of a batch
     */
    struct BatchPrintResult
    {
        int total = 0;
        int succeeded = 0;
        std::vector<std::pair<size_t, ErrorInfo>> failures; // payload index -> error
        bool stoppedEarly = false;

        bool allSucceeded() const { return succeeded == total; }
    };
} // namespace llink
