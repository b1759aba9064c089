#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "core/cancellation_token.h"
#include "events/event_system.h"
#include "labellink_export.h"
#include "selection/connection_history.h"
#include "transport/transport.h"
#include "types/event.h"
#include "types/print.h"
#include "types/result.h"

namespace llink
{
    class PrinterReadiness;

    /**
     * Print workflow state machine
     *
     * Drives one print attempt through
     * initializing -> validating -> connecting -> connected -> checkingStatus
     * -> sending -> waitingForCompletion -> completed, with failed and
     * cancelled reachable from any non-terminal step. Attempts on one
     * instance never interleave; concurrent print() calls are serialized.
     */
    class LABELLINK_API PrintWorkflow
    {
    public:
        PrintWorkflow(std::shared_ptr<ITransport> transport,
                      std::shared_ptr<ConnectionHistory> history = nullptr,
                      DwellTimingConfig dwell = DwellTimingConfig{});
        ~PrintWorkflow();

        PrintWorkflow(const PrintWorkflow &) = delete;
        PrintWorkflow &operator=(const PrintWorkflow &) = delete;

        /**
         * Print a payload on the printer at address
         * @return success once completed, otherwise the terminal error
         */
        VoidResult print(const std::string &data,
                         const std::string &address,
                         const PrintOptions &options = PrintOptions::defaults());

        /**
         * Print payloads one after another on the same printer
         */
        BatchPrintResult printBatch(const std::vector<std::string> &payloads,
                                    const std::string &address,
                                    const BatchPrintOptions &options = BatchPrintOptions{});

        /**
         * Request cancellation, observed at the next step boundary
         */
        void cancel();
        bool isCancelled() const { return m_cancellation.isCancelled(); }

        /**
         * Latest immutable state snapshot
         */
        std::shared_ptr<const PrintState> state() const;

        /**
         * Copy of the events emitted by the latest print() call, in order
         */
        std::vector<PrintEvent> events() const;

        EventBus &eventBus() { return m_eventBus; }

        /**
         * Estimated time for the printer to finish a payload after it was sent
         */
        std::chrono::milliseconds estimateDwellTime(const std::string &data) const;

        static VoidResult validatePrintData(const std::string &data);
        static ErrorRecoverability classifyRecoverability(LLINK_ERROR_CODE code);
        // Errors the workflow retries by itself carry no hint in error events
        static bool isAutoRetried(LLINK_ERROR_CODE code);

        static constexpr size_t kMaxPrintDataSize = 1000000;

    private:
        struct AttemptFailure
        {
            ErrorInfo error;
            ErrorRecoverability recoverability;
        };

        struct AttemptContext;

        // Returns false when cancellation was observed and the workflow ended
        bool transition(PrintStep step, const std::string &message, AttemptContext &context);
        void finishCancelled(AttemptContext &context);
        VoidResult finishFailed(AttemptContext &context, const AttemptFailure &failure);

        // Each step returns nullopt on success
        std::optional<AttemptFailure> runAttempt(AttemptContext &context);
        std::optional<AttemptFailure> connectStep(AttemptContext &context);
        std::optional<AttemptFailure> checkStatusStep(AttemptContext &context);
        std::optional<AttemptFailure> sendStep(AttemptContext &context);
        // Returns false when cancelled while waiting
        bool waitForCompletionStep(AttemptContext &context);

        std::chrono::milliseconds retryDelay(const PrintOptions &options, int attempt) const;

        void emit(PrintEventPayload payload);
        void updateState(const std::function<void(PrintState &)> &mutator);
        void resetRun(const PrintOptions &options);

        std::shared_ptr<ITransport> m_transport;
        std::shared_ptr<ConnectionHistory> m_history;
        DwellTimingConfig m_dwell;

        CancellationToken m_cancellation;
        EventBus m_eventBus;

        // Serializes print() calls
        std::mutex m_runMutex;

        mutable std::mutex m_stateMutex;
        std::shared_ptr<const PrintState> m_state;
        std::vector<PrintEvent> m_events;
    };
} // namespace llink
