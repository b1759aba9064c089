#include "workflow/print_workflow.h"
#include "core/error_handler.h"
#include "policies/timeout_policy.h"
#include "protocol/sgd_codec.h"
#include "readiness/auto_corrector.h"
#include "readiness/printer_readiness.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <cmath>

namespace llink
{
    struct PrintWorkflow::AttemptContext
    {
        const std::string &data;
        const std::string &address;
        const PrintOptions &options;
        PrintLanguage language = PrintLanguage::UNKNOWN;
        int attempt = 1;
        int maxAttempts = 1;
        std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
        std::chrono::steady_clock::time_point sendStart = std::chrono::steady_clock::now();
        bool cancelled = false;

        std::chrono::milliseconds elapsed() const
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        }
    };

    namespace
    {
        std::string joinIssues(const std::vector<std::string> &issues)
        {
            std::string joined;
            for (const auto &issue : issues)
            {
                if (!joined.empty())
                {
                    joined += ", ";
                }
                joined += issue;
            }
            return joined;
        }

        const char *kFallbackRecoveryHint = "Check the printer and try again.";
    } // namespace

    PrintWorkflow::PrintWorkflow(std::shared_ptr<ITransport> transport,
                                 std::shared_ptr<ConnectionHistory> history,
                                 DwellTimingConfig dwell)
        : m_transport(std::move(transport)),
          m_history(history ? std::move(history) : std::make_shared<ConnectionHistory>()),
          m_dwell(dwell),
          m_state(std::make_shared<const PrintState>())
    {
    }

    PrintWorkflow::~PrintWorkflow()
    {
        m_cancellation.cancel();
        std::lock_guard<std::mutex> run(m_runMutex);
    }

    // ---- Classification ----

    VoidResult PrintWorkflow::validatePrintData(const std::string &data)
    {
        if (StringUtils::trim(data).empty())
        {
            return VoidResult::Error(LLINK_ERROR_CODE::EMPTY_DATA);
        }
        if (data.size() > kMaxPrintDataSize)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_DATA_TOO_LARGE, data.size());
        }
        if (SgdCodec::detectLanguage(data) == PrintLanguage::UNKNOWN)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_DATA_INVALID_FORMAT);
        }
        return VoidResult::Success();
    }

    ErrorRecoverability PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE code)
    {
        switch (categoryOf(code))
        {
        case ErrorCategory::CONNECTION:
        case ErrorCategory::OPERATION:
            return ErrorRecoverability::RECOVERABLE;
        case ErrorCategory::PRINT:
            if (code == LLINK_ERROR_CODE::PRINT_TIMEOUT || code == LLINK_ERROR_CODE::PRINTER_PAUSED)
            {
                return ErrorRecoverability::RECOVERABLE;
            }
            return ErrorRecoverability::NON_RECOVERABLE;
        case ErrorCategory::DATA:
            return ErrorRecoverability::NON_RECOVERABLE;
        case ErrorCategory::STATUS:
            return ErrorRecoverability::POSSIBLY_RECOVERABLE;
        default:
            return ErrorRecoverability::UNKNOWN;
        }
    }

    bool PrintWorkflow::isAutoRetried(LLINK_ERROR_CODE code)
    {
        switch (code)
        {
        case LLINK_ERROR_CODE::CONNECTION_ERROR:
        case LLINK_ERROR_CODE::CONNECTION_TIMEOUT:
        case LLINK_ERROR_CODE::CONNECTION_LOST:
        case LLINK_ERROR_CODE::CONNECTION_PERMISSION:
        case LLINK_ERROR_CODE::INVALID_DEVICE_ADDRESS:
        case LLINK_ERROR_CODE::NETWORK_ERROR:
        case LLINK_ERROR_CODE::PRINT_ERROR:
        case LLINK_ERROR_CODE::PRINT_TIMEOUT:
        case LLINK_ERROR_CODE::PRINTER_PAUSED:
        case LLINK_ERROR_CODE::OPERATION_TIMEOUT:
        case LLINK_ERROR_CODE::OPERATION_ERROR:
        case LLINK_ERROR_CODE::STATUS_CHECK_FAILED:
        case LLINK_ERROR_CODE::STATUS_TIMEOUT:
        case LLINK_ERROR_CODE::INVALID_STATUS_RESPONSE:
            return true;
        default:
            return false;
        }
    }

    std::chrono::milliseconds PrintWorkflow::estimateDwellTime(const std::string &data) const
    {
        double msPerChar = m_dwell.defaultMsPerChar;
        switch (SgdCodec::detectLanguage(data))
        {
        case PrintLanguage::ZPL:
            msPerChar = m_dwell.zplMsPerChar;
            break;
        case PrintLanguage::CPCL:
            msPerChar = m_dwell.cpclMsPerChar;
            break;
        default:
            break;
        }

        const double totalMs = static_cast<double>(data.size()) * msPerChar +
                               static_cast<double>(m_dwell.jobOverhead.count()) +
                               static_cast<double>(m_dwell.mechanicalOverhead.count());
        const auto estimate = std::chrono::milliseconds(static_cast<long long>(std::llround(totalMs)));
        return std::max(estimate, m_dwell.minimum);
    }

    std::chrono::milliseconds PrintWorkflow::retryDelay(const PrintOptions &options, int attempt) const
    {
        return std::min(options.retryBaseDelay * attempt, options.retryMaxDelay);
    }

    // ---- State and events ----

    std::shared_ptr<const PrintState> PrintWorkflow::state() const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_state;
    }

    std::vector<PrintEvent> PrintWorkflow::events() const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_events;
    }

    void PrintWorkflow::cancel()
    {
        LABELLINK_LOG_INFO("PrintWorkflow: Cancellation requested");
        m_cancellation.cancel();
    }

    void PrintWorkflow::updateState(const std::function<void(PrintState &)> &mutator)
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        auto next = std::make_shared<PrintState>(*m_state);
        mutator(*next);
        if (next->startTime)
        {
            next->elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now() - *next->startTime);
        }
        m_state = std::move(next);
    }

    void PrintWorkflow::emit(PrintEventPayload payload)
    {
        PrintEvent event{std::move(payload), std::chrono::system_clock::now()};
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_events.push_back(event);
        }
        m_eventBus.publish(event);
    }

    void PrintWorkflow::resetRun(const PrintOptions &options)
    {
        auto initial = std::make_shared<PrintState>();
        initial->isRunning = true;
        initial->maxAttempts = std::max(1, options.maxAttempts);
        initial->startTime = std::chrono::system_clock::now();

        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = std::move(initial);
        m_events.clear();
    }

    bool PrintWorkflow::transition(PrintStep step, const std::string &message, AttemptContext &context)
    {
        if (m_cancellation.isCancelled())
        {
            finishCancelled(context);
            return false;
        }

        LABELLINK_LOG_INFO("PrintWorkflow: Step {} - {} (attempt {}/{})", printStepToString(step), message,
                           context.attempt, context.maxAttempts);

        double progress = 0.0;
        updateState([&](PrintState &state)
                     {
                         state.step = step;
                         state.message = message;
                         state.currentAttempt = context.attempt;
                         state.progress = progressForStep(step, state.progress);
                         if (step == PrintStep::COMPLETED)
                         {
                             state.isRunning = false;
                             state.isCompleted = true;
                             state.error.reset();
                             state.issues.clear();
                         }
                         progress = state.progress; });

        StepChangedEvent event;
        event.step = step;
        event.message = message;
        event.attempt = context.attempt;
        event.maxAttempts = context.maxAttempts;
        event.elapsed = context.elapsed();
        event.progress = progress;
        emit(event);
        return true;
    }

    void PrintWorkflow::finishCancelled(AttemptContext &context)
    {
        if (context.cancelled)
        {
            return;
        }
        context.cancelled = true;

        PrintStep observedAt = PrintStep::INITIALIZING;
        double progress = 0.0;
        updateState([&](PrintState &state)
                     {
                         observedAt = state.step;
                         state.step = PrintStep::CANCELLED;
                         state.message = "Print operation cancelled";
                         state.isRunning = false;
                         state.isCancelled = true;
                         progress = state.progress; });

        LABELLINK_LOG_INFO("PrintWorkflow: Print cancelled during {}", printStepToString(observedAt));

        StepChangedEvent step;
        step.step = PrintStep::CANCELLED;
        step.message = "Print operation cancelled";
        step.attempt = context.attempt;
        step.maxAttempts = context.maxAttempts;
        step.elapsed = context.elapsed();
        step.progress = progress;
        emit(step);

        CancelledEvent cancelled;
        cancelled.step = observedAt;
        cancelled.elapsed = context.elapsed();
        emit(cancelled);
    }

    VoidResult PrintWorkflow::finishFailed(AttemptContext &context, const AttemptFailure &failure)
    {
        PrintErrorInfo info;
        info.error = failure.error;
        info.recoverability = failure.recoverability;
        std::string hint = failure.error.recoveryHint;
        if (hint.empty())
        {
            hint = describeError(failure.error.code).recoveryHint;
        }
        info.recoveryHint = hint.empty() ? std::string(kFallbackRecoveryHint) : hint;
        info.error.recoveryHint = *info.recoveryHint;

        LABELLINK_LOG_ERROR("PrintWorkflow: Print failed after {} attempt(s): [{}] {}", context.attempt,
                            info.error.codeName(), info.error.message);

        PrintStep failedAt = PrintStep::INITIALIZING;
        double progress = 0.0;
        updateState([&](PrintState &state)
                    {
                        failedAt = state.step;
                        state.step = PrintStep::FAILED;
                        state.message = info.error.message;
                        state.isRunning = false;
                        state.error = info;
                        progress = state.progress; });

        ErrorOccurredEvent error;
        error.error = info;
        error.step = failedAt;
        error.willRetry = false;
        emit(error);

        StepChangedEvent step;
        step.step = PrintStep::FAILED;
        step.message = info.error.message;
        step.attempt = context.attempt;
        step.maxAttempts = context.maxAttempts;
        step.elapsed = context.elapsed();
        step.progress = progress;
        emit(step);

        return VoidResult::Error(info.error);
    }

    // ---- Steps ----

    std::optional<PrintWorkflow::AttemptFailure> PrintWorkflow::connectStep(AttemptContext &context)
    {
        auto connected = m_transport->isConnected();
        if (connected.isSuccess() && connected.value())
        {
            LABELLINK_LOG_DEBUG("PrintWorkflow: Already connected to {}", context.address);
            return std::nullopt;
        }

        TimeoutPolicy timeout(context.options.connectTimeout);
        auto transport = m_transport;
        const std::string address = context.address;
        auto result = timeout.execute<std::monostate>(
            [transport, address]()
            { return transport->connect(address); },
            "Connect");

        if (result.isSuccess())
        {
            m_history->recordSuccessfulConnection(context.address);
            return std::nullopt;
        }

        m_history->recordFailedConnection(context.address);
        ErrorInfo error = result.error();
        if (error.code == LLINK_ERROR_CODE::CONNECTION_ERROR)
        {
            // Refine the generic code from the native message
            const auto refined = ErrorHandler::mapConnectionErrorCode(error.message);
            if (refined != error.code)
            {
                error.code = refined;
                error.recoveryHint = describeError(refined).recoveryHint;
            }
        }
        else if (error.code == LLINK_ERROR_CODE::OPERATION_TIMEOUT)
        {
            error = ErrorInfo::withMessage(LLINK_ERROR_CODE::CONNECTION_TIMEOUT, error.message);
        }
        return AttemptFailure{error, classifyRecoverability(error.code)};
    }

    std::optional<PrintWorkflow::AttemptFailure> PrintWorkflow::checkStatusStep(AttemptContext &context)
    {
        const PrintOptions &options = context.options;
        auto readiness = std::make_shared<PrinterReadiness>(m_transport, options.readinessOptions);

        TimeoutPolicy timeout(options.statusCheckTimeout);
        auto readAll = [&timeout, readiness]()
        {
            auto result = timeout.execute<std::monostate>(
                [readiness]()
                {
                    readiness->readAllStatuses();
                    return VoidResult::Success();
                },
                "Status check");
            if (result.isError())
            {
                // The timed out read keeps running on the pool; stop it issuing further queries
                readiness->abandon();
            }
            return result;
        };

        auto read = readAll();
        if (read.isError())
        {
            return AttemptFailure{read.error(), classifyRecoverability(read.code())};
        }

        const AutoCorrectionOptions correction = options.correctionOptions();
        AutoCorrector corrector(m_transport, correction, &m_cancellation);
        corrector.setStatusCallback([this, &context](const std::string &, const std::string &message)
                                    {
                                        ProgressUpdateEvent progress;
                                        progress.progress = progressForStep(PrintStep::CHECKING_STATUS, 0.0);
                                        progress.currentOperation = message;
                                        progress.elapsed = context.elapsed();
                                        emit(progress); });
        CorrectedReadiness log(readiness);

        if (!readiness->isReady() && correction.hasAnyEnabled())
        {
            LABELLINK_LOG_INFO("PrintWorkflow: Printer not ready, attempting corrections");
            if (corrector.correctReadiness(*readiness, log))
            {
                read = readAll();
                if (read.isError())
                {
                    return AttemptFailure{read.error(), classifyRecoverability(read.code())};
                }
            }
        }

        if (m_cancellation.isCancelled())
        {
            // Observed at the next step boundary
            return std::nullopt;
        }

        std::optional<AttemptFailure> languageFailure;
        if (context.language != PrintLanguage::UNKNOWN &&
            (correction.enableLanguageSwitch || options.readinessOptions.checkLanguage))
        {
            auto switched = corrector.switchLanguageForData(context.data, *readiness, &log);
            if (switched.isError())
            {
                const auto recoverability = correction.enableLanguageSwitch
                                                ? ErrorRecoverability::RECOVERABLE
                                                : classifyRecoverability(switched.code());
                languageFailure = AttemptFailure{switched.error(), recoverability};
            }
        }

        const bool ready = readiness->isReady();
        const auto issues = readiness->blockingIssues();

        StatusUpdateEvent status;
        status.isReady = ready && !languageFailure;
        status.issues = issues;
        for (const auto &entry : log.corrections())
        {
            status.corrections.push_back(entry.name + (entry.success ? ": ok" : ": failed"));
        }
        for (const auto &[dimension, wasRead] : readiness->readStatus())
        {
            status.details[dimension] = wasRead ? "read" : "unread";
        }
        emit(status);

        updateState([&issues](PrintState &state)
                    { state.issues = issues; });

        if (languageFailure)
        {
            return languageFailure;
        }

        if (!ready)
        {
            // Blocking issues go back to the retry loop
            return AttemptFailure{ErrorInfo::fromCode(LLINK_ERROR_CODE::PRINTER_NOT_READY, joinIssues(issues)),
                                  ErrorRecoverability::RECOVERABLE};
        }

        if (!corrector.prepareBuffer(log))
        {
            LABELLINK_LOG_WARN("PrintWorkflow: Buffer preparation failed: {}", log.summary());
        }
        return std::nullopt;
    }

    std::optional<PrintWorkflow::AttemptFailure> PrintWorkflow::sendStep(AttemptContext &context)
    {
        TimeoutPolicy timeout(context.options.sendTimeout);
        auto transport = m_transport;
        const std::string data = context.data;
        auto result = timeout.execute<std::monostate>(
            [transport, data]()
            { return transport->sendRaw(data); },
            "Send print data");

        if (result.isSuccess())
        {
            LABELLINK_LOG_INFO("PrintWorkflow: Sent {} bytes", context.data.size());
            return std::nullopt;
        }

        ErrorInfo error = result.error();
        if (error.code == LLINK_ERROR_CODE::OPERATION_TIMEOUT)
        {
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(context.options.sendTimeout).count();
            error = ErrorInfo::fromCode(LLINK_ERROR_CODE::PRINT_TIMEOUT, seconds);
        }
        return AttemptFailure{error, classifyRecoverability(error.code)};
    }

    bool PrintWorkflow::waitForCompletionStep(AttemptContext &context)
    {
        const auto estimate = estimateDwellTime(context.data);
        const auto sinceSend = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - context.sendStart);

        if (sinceSend >= estimate)
        {
            LABELLINK_LOG_DEBUG("PrintWorkflow: Estimated print time {}ms already elapsed", estimate.count());
            return true;
        }

        const auto remaining = std::min(estimate - sinceSend, context.options.maxDwellTime);
        LABELLINK_LOG_DEBUG("PrintWorkflow: Waiting {}ms for print completion (estimate {}ms)", remaining.count(),
                            estimate.count());

        ProgressUpdateEvent progress;
        progress.progress = progressForStep(PrintStep::WAITING_FOR_COMPLETION, 0.0);
        progress.currentOperation = "Waiting for print completion";
        progress.elapsed = context.elapsed();
        progress.estimatedRemaining = remaining;
        emit(progress);

        return !m_cancellation.waitFor(remaining);
    }

    std::optional<PrintWorkflow::AttemptFailure> PrintWorkflow::runAttempt(AttemptContext &context)
    {
        const PrintOptions &options = context.options;

        if (!transition(PrintStep::CONNECTING, "Connecting to printer " + context.address, context))
            return std::nullopt;
        if (auto failure = connectStep(context))
            return failure;

        if (!transition(PrintStep::CONNECTED, "Connected to printer", context))
            return std::nullopt;

        if (options.checkStatus)
        {
            if (!transition(PrintStep::CHECKING_STATUS, "Checking printer status", context))
                return std::nullopt;
            if (auto failure = checkStatusStep(context))
                return failure;
        }

        if (!transition(PrintStep::SENDING, "Sending print data", context))
            return std::nullopt;
        context.sendStart = std::chrono::steady_clock::now();
        if (auto failure = sendStep(context))
            return failure;

        if (options.waitForCompletion)
        {
            if (!transition(PrintStep::WAITING_FOR_COMPLETION, "Waiting for print completion", context))
                return std::nullopt;
            if (!waitForCompletionStep(context))
            {
                finishCancelled(context);
                return std::nullopt;
            }
        }

        transition(PrintStep::COMPLETED, "Print operation completed successfully", context);
        return std::nullopt;
    }

    // ---- Entry points ----

    VoidResult PrintWorkflow::print(const std::string &data, const std::string &address, const PrintOptions &options)
    {
        std::lock_guard<std::mutex> run(m_runMutex);
        m_cancellation.reset();
        resetRun(options);

        AttemptContext context{data, address, options};
        context.maxAttempts = std::max(1, options.maxAttempts);

        LABELLINK_LOG_INFO("PrintWorkflow: Starting print of {} bytes to {}", data.size(), address);

        if (!transition(PrintStep::INITIALIZING, "Initializing print operation", context))
        {
            return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED);
        }

        if (options.validateData)
        {
            if (!transition(PrintStep::VALIDATING, "Validating print data", context))
            {
                return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED);
            }
            auto valid = validatePrintData(data);
            if (valid.isError())
            {
                return finishFailed(context, AttemptFailure{valid.error(), classifyRecoverability(valid.code())});
            }
        }

        context.language = SgdCodec::detectLanguage(data);
        LABELLINK_LOG_INFO("PrintWorkflow: Detected print language: {}", printLanguageToString(context.language));

        while (true)
        {
            auto failure = runAttempt(context);
            if (!context.cancelled && failure &&
                (m_cancellation.isCancelled() || failure->error.code == LLINK_ERROR_CODE::OPERATION_CANCELLED))
            {
                // A step observed cancellation and reported it as its failure
                finishCancelled(context);
            }
            if (context.cancelled)
            {
                return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED);
            }
            if (!failure)
            {
                CompletedEvent completed;
                completed.elapsed = context.elapsed();
                completed.attempts = context.attempt;
                completed.bytesSent = data.size();
                emit(completed);
                return VoidResult::Success();
            }

            const bool retryable = failure->recoverability == ErrorRecoverability::RECOVERABLE ||
                                   failure->recoverability == ErrorRecoverability::POSSIBLY_RECOVERABLE;
            if (!retryable || context.attempt >= context.maxAttempts)
            {
                return finishFailed(context, *failure);
            }

            PrintErrorInfo info;
            info.error = failure->error;
            info.recoverability = failure->recoverability;
            if (!isAutoRetried(failure->error.code) && failure->error.hasRecoveryHint())
            {
                info.recoveryHint = failure->error.recoveryHint;
            }

            LABELLINK_LOG_WARN("PrintWorkflow: Attempt {}/{} failed: [{}] {}", context.attempt, context.maxAttempts,
                               failure->error.codeName(), failure->error.message);

            PrintStep failedAt = PrintStep::INITIALIZING;
            updateState([&](PrintState &state)
                        {
                            failedAt = state.step;
                            state.error = info; });

            ErrorOccurredEvent error;
            error.error = info;
            error.step = failedAt;
            error.willRetry = true;
            emit(error);

            const auto delay = retryDelay(options, context.attempt);
            RetryAttemptEvent retry;
            retry.attempt = context.attempt + 1;
            retry.maxAttempts = context.maxAttempts;
            retry.delay = delay;
            retry.reason = failure->error.message;
            emit(retry);

            LABELLINK_LOG_INFO("PrintWorkflow: Retrying in {}ms", delay.count());
            if (m_cancellation.waitFor(delay))
            {
                finishCancelled(context);
                return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED);
            }
            ++context.attempt;
        }
    }

    BatchPrintResult PrintWorkflow::printBatch(const std::vector<std::string> &payloads,
                                               const std::string &address,
                                               const BatchPrintOptions &options)
    {
        BatchPrintResult result;
        result.total = static_cast<int>(payloads.size());

        LABELLINK_LOG_INFO("PrintWorkflow: Starting batch of {} jobs", payloads.size());
        for (size_t i = 0; i < payloads.size(); ++i)
        {
            auto printed = print(payloads[i], address, options.print);
            if (printed.isSuccess())
            {
                ++result.succeeded;
            }
            else
            {
                result.failures.emplace_back(i, printed.error());
                if (printed.code() == LLINK_ERROR_CODE::OPERATION_CANCELLED || options.stopOnError)
                {
                    result.stoppedEarly = i + 1 < payloads.size();
                    break;
                }
            }

            if (i + 1 < payloads.size() && options.delayBetweenJobs.count() > 0)
            {
                if (m_cancellation.waitFor(options.delayBetweenJobs))
                {
                    result.stoppedEarly = true;
                    break;
                }
            }
        }

        LABELLINK_LOG_INFO("PrintWorkflow: Batch finished, {}/{} succeeded", result.succeeded, result.total);
        return result;
    }
} // namespace llink
