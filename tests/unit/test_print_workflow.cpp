#include <catch2/catch.hpp>
#include <algorithm>
#include <thread>
#include "mocks/mock_transport.h"
#include "protocol/sgd_codec.h"
#include "workflow/print_workflow.h"

using namespace llink;
using namespace llink::test;
using namespace std::chrono_literals;

// ============================================================================
// Test Fixture
// ============================================================================

namespace
{
    const std::string kZplLabel = "^XA^FO20,20^A0N,30,30^FDShip to^FS^XZ";
    const std::string kCpclLabel = "! 0 200 200 210 1\r\nTEXT 4 0 30 40 Hello\r\nPRINT\r\n";
    const std::string kAddress = "10.0.0.42:9100";

    DwellTimingConfig fastDwell()
    {
        DwellTimingConfig dwell;
        dwell.jobOverhead = 5ms;
        dwell.mechanicalOverhead = 5ms;
        dwell.minimum = 20ms;
        return dwell;
    }

    PrintOptions fastOptions()
    {
        PrintOptions options;
        options.retryBaseDelay = 10ms;
        options.retryMaxDelay = 20ms;
        return options;
    }

    class WorkflowFixture
    {
    public:
        explicit WorkflowFixture(DwellTimingConfig dwell = fastDwell())
            : printer(std::make_shared<MockTransport>()),
              history(std::make_shared<ConnectionHistory>()),
              workflow(printer, history, dwell)
        {
        }

        std::vector<PrintStep> steps() const
        {
            std::vector<PrintStep> result;
            for (const auto &event : workflow.events())
            {
                if (const auto *step = event.as<StepChangedEvent>())
                {
                    result.push_back(step->step);
                }
            }
            return result;
        }

        template <typename T>
        std::vector<T> eventsOf() const
        {
            std::vector<T> result;
            for (const auto &event : workflow.events())
            {
                if (const T *typed = event.as<T>())
                {
                    result.push_back(*typed);
                }
            }
            return result;
        }

        // Position of the first event of a type, events().size() when absent
        template <typename T>
        size_t indexOf() const
        {
            const auto events = workflow.events();
            for (size_t i = 0; i < events.size(); ++i)
            {
                if (events[i].is<T>())
                {
                    return i;
                }
            }
            return events.size();
        }

        std::shared_ptr<MockTransport> printer;
        std::shared_ptr<ConnectionHistory> history;
        PrintWorkflow workflow;
    };

    long indexInLog(const std::vector<std::string> &log, const std::string &entry)
    {
        auto it = std::find(log.begin(), log.end(), entry);
        return it == log.end() ? -1 : static_cast<long>(it - log.begin());
    }
} // namespace

// ============================================================================
// Happy path
// ============================================================================

TEST_CASE("PrintWorkflow - Successful print", "[workflow]")
{
    WorkflowFixture f;
    auto result = f.workflow.print(kZplLabel, kAddress, fastOptions());

    REQUIRE(result.isSuccess());
    REQUIRE(f.printer->lastAddress() == kAddress);

    SECTION("Steps run in order")
    {
        REQUIRE(f.steps() == std::vector<PrintStep>{
                                 PrintStep::INITIALIZING,
                                 PrintStep::VALIDATING,
                                 PrintStep::CONNECTING,
                                 PrintStep::CONNECTED,
                                 PrintStep::CHECKING_STATUS,
                                 PrintStep::SENDING,
                                 PrintStep::WAITING_FOR_COMPLETION,
                                 PrintStep::COMPLETED,
                             });
    }

    SECTION("Progress follows the fixed per step fractions")
    {
        auto stepEvents = f.eventsOf<StepChangedEvent>();
        REQUIRE(stepEvents.front().progress == Approx(0.0));
        REQUIRE(stepEvents.back().progress == Approx(1.0));
        for (size_t i = 1; i < stepEvents.size(); ++i)
        {
            REQUIRE(stepEvents[i].progress >= stepEvents[i - 1].progress);
            REQUIRE(stepEvents[i].attempt == 1);
            REQUIRE(stepEvents[i].maxAttempts == 3);
        }
    }

    SECTION("Completed event closes the stream")
    {
        const auto events = f.workflow.events();
        REQUIRE(events.back().is<CompletedEvent>());
        auto completed = events.back().as<CompletedEvent>();
        REQUIRE(completed->attempts == 1);
        REQUIRE(completed->bytesSent == kZplLabel.size());
    }

    SECTION("Status update reports a ready printer")
    {
        auto status = f.eventsOf<StatusUpdateEvent>();
        REQUIRE(status.size() == 1);
        REQUIRE(status[0].isReady);
        REQUIRE(status[0].issues.empty());
    }

    SECTION("Buffer is prepared before the payload")
    {
        REQUIRE(f.printer->sentCommands() == std::vector<std::string>{SgdCodec::clearBufferCommand(),
                                                                     SgdCodec::flushBufferCommand(),
                                                                     kZplLabel});
    }

    SECTION("Final state")
    {
        auto state = f.workflow.state();
        REQUIRE(state->step == PrintStep::COMPLETED);
        REQUIRE(state->isCompleted);
        REQUIRE_FALSE(state->isRunning);
        REQUIRE_FALSE(state->hasFailed());
        REQUIRE(state->progress == Approx(1.0));
    }

    SECTION("Successful connection is recorded")
    {
        REQUIRE(f.history->successCount(kAddress) == 1);
    }
}

TEST_CASE("PrintWorkflow - Optional steps", "[workflow]")
{
    WorkflowFixture f;

    SECTION("Without status check or completion wait")
    {
        PrintOptions options = PrintOptions::withoutCompletion();
        options.checkStatus = false;
        REQUIRE(f.workflow.print(kCpclLabel, kAddress, options).isSuccess());
        REQUIRE(f.steps() == std::vector<PrintStep>{
                                 PrintStep::INITIALIZING,
                                 PrintStep::VALIDATING,
                                 PrintStep::CONNECTING,
                                 PrintStep::CONNECTED,
                                 PrintStep::SENDING,
                                 PrintStep::COMPLETED,
                             });
        REQUIRE(f.printer->totalQueries() == 0);
    }

    SECTION("Already connected transport is reused")
    {
        f.printer->setConnected(true);
        REQUIRE(f.workflow.print(kZplLabel, kAddress, fastOptions()).isSuccess());
        REQUIRE(f.printer->connectCalls() == 0);
    }

    SECTION("Events are reset for each print")
    {
        f.workflow.print(kZplLabel, kAddress, fastOptions());
        const auto first = f.workflow.events().size();
        f.workflow.print(kZplLabel, kAddress, fastOptions());
        REQUIRE(f.workflow.events().size() == first);
        REQUIRE(f.workflow.events().front().as<StepChangedEvent>()->step == PrintStep::INITIALIZING);
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("PrintWorkflow - Data validation", "[workflow]")
{
    REQUIRE(PrintWorkflow::validatePrintData(kZplLabel).isSuccess());
    REQUIRE(PrintWorkflow::validatePrintData(kCpclLabel).isSuccess());
    REQUIRE(PrintWorkflow::validatePrintData("").code() == LLINK_ERROR_CODE::EMPTY_DATA);
    REQUIRE(PrintWorkflow::validatePrintData(" \r\n").code() == LLINK_ERROR_CODE::EMPTY_DATA);
    REQUIRE(PrintWorkflow::validatePrintData("hello").code() == LLINK_ERROR_CODE::PRINT_DATA_INVALID_FORMAT);
    REQUIRE(PrintWorkflow::validatePrintData("^XA" + std::string(PrintWorkflow::kMaxPrintDataSize, 'A')).code() ==
            LLINK_ERROR_CODE::PRINT_DATA_TOO_LARGE);
}

TEST_CASE("PrintWorkflow - Invalid data fails without retry", "[workflow]")
{
    WorkflowFixture f;
    auto result = f.workflow.print("not a label", kAddress, fastOptions());

    REQUIRE(result.code() == LLINK_ERROR_CODE::PRINT_DATA_INVALID_FORMAT);
    REQUIRE(result.error().hasRecoveryHint());
    REQUIRE(f.printer->connectCalls() == 0);
    REQUIRE(f.steps() == std::vector<PrintStep>{PrintStep::INITIALIZING, PrintStep::VALIDATING, PrintStep::FAILED});

    auto errors = f.eventsOf<ErrorOccurredEvent>();
    REQUIRE(errors.size() == 1);
    REQUIRE_FALSE(errors[0].willRetry);
    REQUIRE(errors[0].error.recoverability == ErrorRecoverability::NON_RECOVERABLE);
    REQUIRE(errors[0].error.recoveryHint.has_value());

    auto state = f.workflow.state();
    REQUIRE(state->hasFailed());
    REQUIRE(state->progress == Approx(0.1));
}

// ============================================================================
// Retries
// ============================================================================

TEST_CASE("PrintWorkflow - Recoverable failures are retried", "[workflow]")
{
    WorkflowFixture f;

    SECTION("Connection refused once")
    {
        f.printer->failNextConnects(1, ErrorInfo::withMessage(LLINK_ERROR_CODE::CONNECTION_ERROR,
                                                              "connect to 10.0.0.42:9100: Connection refused"));
        auto result = f.workflow.print(kZplLabel, kAddress, fastOptions());

        REQUIRE(result.isSuccess());
        REQUIRE(f.printer->connectCalls() == 2);
        REQUIRE(f.history->failureCount(kAddress) == 1);
        REQUIRE(f.history->successCount(kAddress) == 1);

        auto errors = f.eventsOf<ErrorOccurredEvent>();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].willRetry);
        REQUIRE(errors[0].error.code() == LLINK_ERROR_CODE::CONNECTION_REFUSED);
        REQUIRE(errors[0].step == PrintStep::CONNECTING);

        auto retries = f.eventsOf<RetryAttemptEvent>();
        REQUIRE(retries.size() == 1);
        REQUIRE(retries[0].attempt == 2);
        REQUIRE(retries[0].maxAttempts == 3);
        REQUIRE(retries[0].delay == 10ms);

        REQUIRE(f.eventsOf<CompletedEvent>()[0].attempts == 2);
    }

    SECTION("Progress resets on a new attempt")
    {
        f.printer->failNextConnects(1, ErrorInfo::fromCode(LLINK_ERROR_CODE::CONNECTION_LOST));
        f.workflow.print(kZplLabel, kAddress, fastOptions());

        auto stepEvents = f.eventsOf<StepChangedEvent>();
        auto secondConnect = std::find_if(stepEvents.begin(), stepEvents.end(), [](const StepChangedEvent &e)
                                          { return e.step == PrintStep::CONNECTING && e.attempt == 2; });
        REQUIRE(secondConnect != stepEvents.end());
        REQUIRE(secondConnect->progress == Approx(0.2));
        REQUIRE(secondConnect->isRetry());
    }

    SECTION("Send failure retries without a hint for auto retried codes")
    {
        PrintOptions options = fastOptions();
        options.checkStatus = false;
        f.printer->failNextSends(1, ErrorInfo::fromCode(LLINK_ERROR_CODE::CONNECTION_LOST));

        REQUIRE(f.workflow.print(kZplLabel, kAddress, options).isSuccess());
        auto errors = f.eventsOf<ErrorOccurredEvent>();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].step == PrintStep::SENDING);
        REQUIRE_FALSE(errors[0].error.recoveryHint.has_value());
        REQUIRE(f.printer->connectCalls() == 1);
    }

    SECTION("Exhausted attempts fail with the last error")
    {
        PrintOptions options = fastOptions();
        options.maxAttempts = 2;
        f.printer->failNextConnects(5, ErrorInfo::fromCode(LLINK_ERROR_CODE::CONNECTION_TIMEOUT, 5));

        auto result = f.workflow.print(kZplLabel, kAddress, options);
        REQUIRE(result.code() == LLINK_ERROR_CODE::CONNECTION_TIMEOUT);
        REQUIRE(f.printer->connectCalls() == 2);
        REQUIRE(f.eventsOf<RetryAttemptEvent>().size() == 1);

        auto errors = f.eventsOf<ErrorOccurredEvent>();
        REQUIRE(errors.back().error.recoverability == ErrorRecoverability::RECOVERABLE);
        REQUIRE(errors.back().error.recoveryHint.has_value());
        REQUIRE(f.steps().back() == PrintStep::FAILED);
    }
}

TEST_CASE("PrintWorkflow - Blocking issues feed the retry loop", "[workflow]")
{
    WorkflowFixture f;
    f.printer->setSetting("head.latch", "open");

    PrintOptions options = fastOptions();
    options.autoCorrection = AutoCorrectionOptions::none();
    auto result = f.workflow.print(kZplLabel, kAddress, options);

    REQUIRE(result.code() == LLINK_ERROR_CODE::PRINTER_NOT_READY);
    REQUIRE(result.message() == "Printer is not ready: Printer head is open");
    REQUIRE(f.eventsOf<RetryAttemptEvent>().size() == 2);
    REQUIRE(f.eventsOf<StatusUpdateEvent>().size() == 3);
    REQUIRE_FALSE(f.printer->wasSent(kZplLabel));

    auto state = f.workflow.state();
    REQUIRE(state->issues == std::vector<std::string>{"Printer head is open"});
    REQUIRE(state->currentAttempt == 3);
}

TEST_CASE("PrintWorkflow - Paused printer is corrected during the status check", "[workflow][slow]")
{
    WorkflowFixture f;
    f.printer->setSetting("device.pause", "true");

    auto result = f.workflow.print(kZplLabel, kAddress, fastOptions());

    REQUIRE(result.isSuccess());
    REQUIRE(f.printer->wasSent(SgdCodec::unpauseCommand()));
    REQUIRE(f.eventsOf<RetryAttemptEvent>().empty());

    auto status = f.eventsOf<StatusUpdateEvent>();
    REQUIRE(status.size() == 1);
    REQUIRE(status[0].isReady);
    REQUIRE(status[0].corrections.front() == "unpause: ok");
    REQUIRE_FALSE(f.eventsOf<ProgressUpdateEvent>().empty());
}

TEST_CASE("PrintWorkflow - Send timeout", "[workflow][slow]")
{
    WorkflowFixture f;
    f.printer->setSendLatency(300ms);

    PrintOptions options = fastOptions();
    options.checkStatus = false;
    options.maxAttempts = 1;
    options.sendTimeout = 50ms;

    auto result = f.workflow.print(kZplLabel, kAddress, options);
    REQUIRE(result.code() == LLINK_ERROR_CODE::PRINT_TIMEOUT);
    REQUIRE(f.workflow.state()->step == PrintStep::FAILED);
}

// ============================================================================
// Language
// ============================================================================

TEST_CASE("PrintWorkflow - Printer language is switched before sending", "[workflow]")
{
    WorkflowFixture f;
    f.printer->setSetting("device.languages", "line_print");

    PrintOptions options = fastOptions();
    AutoCorrectionOptions correction = AutoCorrectionOptions::all();
    correction.attemptDelay = 10ms;
    options.autoCorrection = correction;

    auto result = f.workflow.print(kZplLabel, kAddress, options);
    REQUIRE(result.isSuccess());

    const auto log = f.printer->callLog();
    const long switchSent = indexInLog(log, "send:" + SgdCodec::setLanguageCommand(PrintLanguage::ZPL));
    const long payloadSent = indexInLog(log, "send:" + kZplLabel);
    REQUIRE(switchSent >= 0);
    REQUIRE(payloadSent > switchSent);

    // The confirming read happens between the switch and the payload
    long confirm = -1;
    for (long i = switchSent + 1; i < payloadSent; ++i)
    {
        if (log[static_cast<size_t>(i)] == "query:device.languages")
        {
            confirm = i;
            break;
        }
    }
    REQUIRE(confirm > switchSent);

    auto status = f.eventsOf<StatusUpdateEvent>();
    REQUIRE(status.size() == 1);
    REQUIRE(std::find(status[0].corrections.begin(), status[0].corrections.end(), "switchLanguage: ok") !=
            status[0].corrections.end());
    REQUIRE(f.indexOf<StatusUpdateEvent>() < f.workflow.events().size());
}

TEST_CASE("PrintWorkflow - Language mismatch without switching", "[workflow]")
{
    WorkflowFixture f;
    f.printer->setSetting("device.languages", "line_print");

    PrintOptions options = fastOptions();
    options.readinessOptions.checkLanguage = true;
    options.autoCorrection = AutoCorrectionOptions::safe();

    auto result = f.workflow.print(kZplLabel, kAddress, options);
    REQUIRE(result.code() == LLINK_ERROR_CODE::LANGUAGE_MISMATCH);
    REQUIRE(f.eventsOf<RetryAttemptEvent>().empty());
    REQUIRE_FALSE(f.printer->wasSent(kZplLabel));
    REQUIRE(f.workflow.state()->error->recoverability == ErrorRecoverability::NON_RECOVERABLE);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE("PrintWorkflow - Cancellation while waiting for completion", "[workflow]")
{
    // Default dwell keeps the workflow waiting for seconds
    WorkflowFixture f(DwellTimingConfig{});

    SECTION("Cancelled from a subscriber")
    {
        f.workflow.eventBus().subscribe<StepChangedEvent>([&f](const StepChangedEvent &event)
                                                          {
                                                              if (event.step == PrintStep::WAITING_FOR_COMPLETION)
                                                              {
                                                                  f.workflow.cancel();
                                                              } });

        const auto start = std::chrono::steady_clock::now();
        auto result = f.workflow.print(kZplLabel, kAddress, fastOptions());
        REQUIRE(std::chrono::steady_clock::now() - start < 2s);
        REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_CANCELLED);
    }

    SECTION("Cancelled from another thread")
    {
        std::thread canceller([&f]()
                              {
                                  while (f.workflow.state()->step != PrintStep::WAITING_FOR_COMPLETION)
                                  {
                                      std::this_thread::sleep_for(5ms);
                                  }
                                  f.workflow.cancel(); });

        auto result = f.workflow.print(kZplLabel, kAddress, fastOptions());
        canceller.join();
        REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_CANCELLED);
    }

    const auto events = f.workflow.events();
    REQUIRE(std::count_if(events.begin(), events.end(), [](const PrintEvent &e)
                          { return e.is<CancelledEvent>(); }) == 1);
    REQUIRE(events.back().is<CancelledEvent>());
    REQUIRE(events.back().as<CancelledEvent>()->step == PrintStep::WAITING_FOR_COMPLETION);
    REQUIRE(events[events.size() - 2].as<StepChangedEvent>()->step == PrintStep::CANCELLED);
    REQUIRE(f.eventsOf<CompletedEvent>().empty());

    auto state = f.workflow.state();
    REQUIRE(state->isCancelled);
    REQUIRE_FALSE(state->isRunning);
    REQUIRE(state->step == PrintStep::CANCELLED);
    REQUIRE(state->progress == Approx(0.8));
}

TEST_CASE("PrintWorkflow - Cancellation during the retry delay", "[workflow]")
{
    WorkflowFixture f;
    f.printer->failNextConnects(5, ErrorInfo::fromCode(LLINK_ERROR_CODE::CONNECTION_LOST));
    f.workflow.eventBus().subscribe<RetryAttemptEvent>([&f](const RetryAttemptEvent &)
                                                       { f.workflow.cancel(); });

    PrintOptions options = fastOptions();
    options.retryBaseDelay = 10s;
    options.retryMaxDelay = 10s;

    auto result = f.workflow.print(kZplLabel, kAddress, options);
    REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_CANCELLED);
    REQUIRE(f.printer->connectCalls() == 1);
    REQUIRE(f.workflow.events().back().is<CancelledEvent>());
}

TEST_CASE("PrintWorkflow - Cancellation while confirming a language switch", "[workflow]")
{
    WorkflowFixture f;
    f.printer->setSetting("device.languages", "line_print");
    // The printer never confirms, so the switch keeps polling until cancelled
    f.printer->setApplySetvar(false);

    AutoCorrectionOptions correction = AutoCorrectionOptions::all();
    correction.attemptDelay = std::chrono::milliseconds(50);
    correction.maxAttempts = 20;

    PrintOptions options = fastOptions();
    options.autoCorrection = correction;

    const std::string switchCommand = SgdCodec::setLanguageCommand(PrintLanguage::ZPL);

    SECTION("On the last attempt")
    {
        options.maxAttempts = 1;
    }

    SECTION("With attempts left")
    {
        options.maxAttempts = 3;
    }

    std::thread canceller([&f, &switchCommand]()
                          {
                              const auto deadline = std::chrono::steady_clock::now() + 5s;
                              while (!f.printer->wasSent(switchCommand) && std::chrono::steady_clock::now() < deadline)
                              {
                                  std::this_thread::sleep_for(5ms);
                              }
                              f.workflow.cancel(); });

    auto result = f.workflow.print(kZplLabel, kAddress, options);
    canceller.join();

    REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_CANCELLED);
    REQUIRE_FALSE(f.printer->wasSent(kZplLabel));

    auto state = f.workflow.state();
    REQUIRE(state->step == PrintStep::CANCELLED);
    REQUIRE(state->isCancelled);

    const auto events = f.workflow.events();
    REQUIRE(std::count_if(events.begin(), events.end(), [](const PrintEvent &e)
                          { return e.is<CancelledEvent>(); }) == 1);
    REQUIRE(events.back().as<CancelledEvent>()->step == PrintStep::CHECKING_STATUS);
    REQUIRE(f.eventsOf<ErrorOccurredEvent>().empty());
    REQUIRE(f.eventsOf<RetryAttemptEvent>().empty());
    REQUIRE(f.steps().back() == PrintStep::CANCELLED);
}

TEST_CASE("PrintWorkflow - Timed out status check stops querying", "[workflow][slow]")
{
    WorkflowFixture f;
    f.printer->setQueryLatency(150ms);

    PrintOptions options = fastOptions();
    options.maxAttempts = 1;
    options.statusCheckTimeout = 50ms;

    auto result = f.workflow.print(kZplLabel, kAddress, options);
    REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_TIMEOUT);
    const int queriesAtReturn = f.printer->totalQueries();

    // Long enough for every remaining dimension to have been read
    std::this_thread::sleep_for(700ms);
    REQUIRE(f.printer->totalQueries() == queriesAtReturn);
    REQUIRE_FALSE(f.printer->wasSent(kZplLabel));
}

// ============================================================================
// Batch
// ============================================================================

TEST_CASE("PrintWorkflow - Batch printing", "[workflow]")
{
    WorkflowFixture f;
    BatchPrintOptions batch;
    batch.print = PrintOptions::withoutCompletion();
    batch.print.checkStatus = false;
    batch.delayBetweenJobs = 1ms;

    SECTION("Failures are collected and the batch continues")
    {
        auto result = f.workflow.printBatch({kZplLabel, "", kCpclLabel}, kAddress, batch);
        REQUIRE(result.total == 3);
        REQUIRE(result.succeeded == 2);
        REQUIRE(result.failures.size() == 1);
        REQUIRE(result.failures[0].first == 1);
        REQUIRE(result.failures[0].second.code == LLINK_ERROR_CODE::EMPTY_DATA);
        REQUIRE_FALSE(result.stoppedEarly);
        REQUIRE_FALSE(result.allSucceeded());
    }

    SECTION("stopOnError ends the batch")
    {
        batch.stopOnError = true;
        auto result = f.workflow.printBatch({"", kZplLabel}, kAddress, batch);
        REQUIRE(result.succeeded == 0);
        REQUIRE(result.stoppedEarly);
        REQUIRE_FALSE(f.printer->wasSent(kZplLabel));
    }
}

// ============================================================================
// Helpers
// ============================================================================

TEST_CASE("PrintWorkflow - Dwell time estimate", "[workflow]")
{
    PrintWorkflow workflow(std::make_shared<MockTransport>());

    // 6 chars * 0.1 ms rounds up past the minimum
    REQUIRE(workflow.estimateDwellTime("^XA^XZ") == 3001ms);
    REQUIRE(workflow.estimateDwellTime("^XA") == 3000ms);
    REQUIRE(workflow.estimateDwellTime("^XA" + std::string(9997, 'A')) == 4000ms);
    REQUIRE(workflow.estimateDwellTime("!" + std::string(9999, 'A')) == 5000ms);
    REQUIRE(workflow.estimateDwellTime(std::string(10000, 'A')) == 4500ms);
}

TEST_CASE("PrintWorkflow - Error classification", "[workflow]")
{
    REQUIRE(PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE::CONNECTION_LOST) == ErrorRecoverability::RECOVERABLE);
    REQUIRE(PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE::OPERATION_TIMEOUT) == ErrorRecoverability::RECOVERABLE);
    REQUIRE(PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE::PRINT_TIMEOUT) == ErrorRecoverability::RECOVERABLE);
    REQUIRE(PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE::HEAD_OPEN) == ErrorRecoverability::NON_RECOVERABLE);
    REQUIRE(PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE::EMPTY_DATA) == ErrorRecoverability::NON_RECOVERABLE);
    REQUIRE(PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE::STATUS_TIMEOUT) == ErrorRecoverability::POSSIBLY_RECOVERABLE);
    REQUIRE(PrintWorkflow::classifyRecoverability(LLINK_ERROR_CODE::UNKNOWN_ERROR) == ErrorRecoverability::UNKNOWN);

    REQUIRE(PrintWorkflow::isAutoRetried(LLINK_ERROR_CODE::CONNECTION_TIMEOUT));
    REQUIRE_FALSE(PrintWorkflow::isAutoRetried(LLINK_ERROR_CODE::OUT_OF_PAPER));
}
