#pragma once
#include <chrono>
#include <variant>
#include <nlohmann/json.hpp>
#include "../event.h"
#include "../print.h"
#include "../printer.h"
#include "../readiness.h"
#include "../result.h"
#include "readiness/corrected_readiness.h"

#ifdef NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT
#undef NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT
#endif

#define NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Type, ...)                                                                                                \
    template <typename BasicJsonType, nlohmann::detail::enable_if_t<nlohmann::detail::is_basic_json<BasicJsonType>::value, int> = 0>                              \
    static void to_json(BasicJsonType &nlohmann_json_j, const Type &nlohmann_json_t) { NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(NLOHMANN_JSON_TO, __VA_ARGS__)) } \
    template <typename BasicJsonType, nlohmann::detail::enable_if_t<nlohmann::detail::is_basic_json<BasicJsonType>::value, int> = 0>                              \
    static void from_json(const BasicJsonType &nlohmann_json_j, Type &nlohmann_json_t)                                                                            \
    {                                                                                                                                                             \
        const Type nlohmann_json_default_obj{};                                                                                                                   \
        NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(NLOHMANN_JSON_FROM_WITH_DEFAULT, __VA_ARGS__))                                                                   \
    }

namespace llink
{
    inline long long toJsonMillis(const std::chrono::system_clock::time_point &tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    NLOHMANN_JSON_SERIALIZE_ENUM(TransportType, {
                                                    {TransportType::BLUETOOTH, "bluetooth"},
                                                    {TransportType::NETWORK, "network"},
                                                })

    NLOHMANN_JSON_SERIALIZE_ENUM(DeviceAvailability, {
                                                         {DeviceAvailability::UNKNOWN, "unknown"},
                                                         {DeviceAvailability::DISCOVERED, "discovered"},
                                                         {DeviceAvailability::READY, "ready"},
                                                         {DeviceAvailability::CONNECTED, "connected"},
                                                     })

    NLOHMANN_JSON_SERIALIZE_ENUM(PrintStep, {
                                                {PrintStep::INITIALIZING, "initializing"},
                                                {PrintStep::VALIDATING, "validating"},
                                                {PrintStep::CONNECTING, "connecting"},
                                                {PrintStep::CONNECTED, "connected"},
                                                {PrintStep::CHECKING_STATUS, "checkingStatus"},
                                                {PrintStep::SENDING, "sending"},
                                                {PrintStep::WAITING_FOR_COMPLETION, "waitingForCompletion"},
                                                {PrintStep::COMPLETED, "completed"},
                                                {PrintStep::FAILED, "failed"},
                                                {PrintStep::CANCELLED, "cancelled"},
                                            })

    NLOHMANN_JSON_SERIALIZE_ENUM(ErrorRecoverability, {
                                                          {ErrorRecoverability::UNKNOWN, "unknown"},
                                                          {ErrorRecoverability::RECOVERABLE, "recoverable"},
                                                          {ErrorRecoverability::NON_RECOVERABLE, "nonRecoverable"},
                                                          {ErrorRecoverability::POSSIBLY_RECOVERABLE, "possiblyRecoverable"},
                                                      })

    // Devices are also read back from discovery lists
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DeviceInfo, address, name, model, transport, availability)

    inline void to_json(nlohmann::json &j, const ErrorInfo &error)
    {
        j = nlohmann::json{
            {"code", static_cast<int>(error.code)},
            {"name", error.codeName()},
            {"category", errorCategoryName(error.category())},
            {"message", error.message},
            {"timestamp", toJsonMillis(error.timestamp)}};
        if (error.hasRecoveryHint())
        {
            j["recoveryHint"] = error.recoveryHint;
        }
    }

    template <typename T>
    inline void to_json(nlohmann::json &j, const Result<T> &result)
    {
        j = nlohmann::json{
            {"code", static_cast<int>(result.code())},
            {"message", result.message()}};

        if (result.isError())
        {
            j["error"] = result.error();
        }
        else if constexpr (!std::is_same_v<T, std::monostate>)
        {
            j["data"] = result.value();
        }
    }

    inline void to_json(nlohmann::json &j, const HostStatusInfo &info)
    {
        j = nlohmann::json{
            {"isOk", info.isOk},
            {"details", info.details},
            {"issues", info.blockingIssues()}};
        j["errorCode"] = info.errorCode ? nlohmann::json(*info.errorCode) : nlohmann::json(nullptr);
        j["errorMessage"] = info.errorMessage ? nlohmann::json(*info.errorMessage) : nlohmann::json(nullptr);
    }

    inline void to_json(nlohmann::json &j, const DimensionState &state)
    {
        if (isGood(state))
        {
            j = nlohmann::json{{"state", "good"}};
        }
        else if (const Bad *bad = std::get_if<Bad>(&state))
        {
            j = nlohmann::json{{"state", "bad"}, {"detail", bad->detail}};
        }
        else
        {
            j = nlohmann::json{{"state", "unchecked"}};
        }
    }

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CorrectionEntry, name, success, error)

    inline void to_json(nlohmann::json &j, const CorrectedReadiness &corrected)
    {
        j = nlohmann::json{
            {"corrections", corrected.corrections()},
            {"summary", corrected.summary()},
            {"timestamp", toJsonMillis(corrected.timestamp())}};
        if (corrected.readiness())
        {
            j["isReady"] = corrected.readiness()->isReady();
            j["issues"] = corrected.readiness()->blockingIssues();
        }
    }

    inline void to_json(nlohmann::json &j, const PrintErrorInfo &info)
    {
        j = nlohmann::json{
            {"error", info.error},
            {"recoverability", info.recoverability}};
        if (info.recoveryHint)
        {
            j["recoveryHint"] = *info.recoveryHint;
        }
    }

    inline void to_json(nlohmann::json &j, const PrintState &state)
    {
        j = nlohmann::json{
            {"step", state.step},
            {"isRunning", state.isRunning},
            {"isCompleted", state.isCompleted},
            {"isCancelled", state.isCancelled},
            {"message", state.message},
            {"issues", state.issues},
            {"currentAttempt", state.currentAttempt},
            {"maxAttempts", state.maxAttempts},
            {"progress", state.progress},
            {"elapsedMs", state.elapsed.count()}};
        if (state.error)
        {
            j["error"] = *state.error;
        }
    }

    inline void to_json(nlohmann::json &j, const StepChangedEvent &e)
    {
        j = nlohmann::json{
            {"step", e.step},
            {"message", e.message},
            {"attempt", e.attempt},
            {"maxAttempts", e.maxAttempts},
            {"elapsedMs", e.elapsed.count()},
            {"progress", e.progress}};
    }

    inline void to_json(nlohmann::json &j, const ProgressUpdateEvent &e)
    {
        j = nlohmann::json{
            {"progress", e.progress},
            {"currentOperation", e.currentOperation},
            {"elapsedMs", e.elapsed.count()},
            {"estimatedRemainingMs", e.estimatedRemaining.count()}};
    }

    inline void to_json(nlohmann::json &j, const ErrorOccurredEvent &e)
    {
        j = nlohmann::json{
            {"error", e.error},
            {"step", e.step},
            {"willRetry", e.willRetry}};
    }

    inline void to_json(nlohmann::json &j, const RetryAttemptEvent &e)
    {
        j = nlohmann::json{
            {"attempt", e.attempt},
            {"maxAttempts", e.maxAttempts},
            {"delayMs", e.delay.count()},
            {"reason", e.reason}};
    }

    inline void to_json(nlohmann::json &j, const StatusUpdateEvent &e)
    {
        j = nlohmann::json{
            {"isReady", e.isReady},
            {"issues", e.issues},
            {"corrections", e.corrections},
            {"details", e.details}};
    }

    inline void to_json(nlohmann::json &j, const CompletedEvent &e)
    {
        j = nlohmann::json{
            {"elapsedMs", e.elapsed.count()},
            {"attempts", e.attempts},
            {"bytesSent", e.bytesSent}};
    }

    inline void to_json(nlohmann::json &j, const CancelledEvent &e)
    {
        j = nlohmann::json{
            {"step", e.step},
            {"elapsedMs", e.elapsed.count()}};
    }

    inline void to_json(nlohmann::json &j, const PrintEvent &event)
    {
        j = nlohmann::json{
            {"type", printEventTypeToString(event.type())},
            {"timestamp", toJsonMillis(event.timestamp)}};
        std::visit([&j](const auto &payload)
                   { j["data"] = payload; },
                   event.payload);
    }
} // namespace llink
