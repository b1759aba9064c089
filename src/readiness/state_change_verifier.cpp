#include "readiness/state_change_verifier.h"
#include "protocol/sgd_codec.h"
#include "protocol/status_parser.h"
#include "utils/logger.h"
#include <thread>

namespace llink
{
    StateChangeVerifier::StateChangeVerifier(std::shared_ptr<ITransport> transport,
                                             const CancellationToken *cancellation)
        : m_transport(std::move(transport)), m_cancellation(cancellation)
    {
    }

    std::optional<std::string> StateChangeVerifier::readSetting(const std::string &settingKey)
    {
        auto result = m_transport->query(settingKey);
        if (result.isError())
        {
            LABELLINK_LOG_DEBUG("StateChangeVerifier: Failed to read {}: {}", settingKey, result.error().message);
            return std::nullopt;
        }
        return SgdCodec::parseResponse(result.value());
    }

    bool StateChangeVerifier::pause(std::chrono::milliseconds delay)
    {
        if (delay.count() <= 0)
        {
            return !(m_cancellation && m_cancellation->isCancelled());
        }
        if (m_cancellation)
        {
            return !m_cancellation->waitFor(delay);
        }
        std::this_thread::sleep_for(delay);
        return true;
    }

    Result<std::string> StateChangeVerifier::executeAndVerify(const std::string &operationName,
                                                              const std::string &command,
                                                              const std::string &settingKey,
                                                              const Validator &isStateValid,
                                                              std::chrono::milliseconds checkDelay,
                                                              int maxAttempts)
    {
        LABELLINK_LOG_DEBUG("StateChangeVerifier: Starting {} verification", operationName);

        auto initial = readSetting(settingKey);
        if (isStateValid(initial))
        {
            LABELLINK_LOG_DEBUG("StateChangeVerifier: {} already in desired state", operationName);
            return Result<std::string>::Ok(initial.value_or(""));
        }

        auto sent = m_transport->sendRaw(command);
        if (sent.isError())
        {
            LABELLINK_LOG_WARN("StateChangeVerifier: Failed to send {} command: {}", operationName, sent.error().message);
            return Result<std::string>::Error(sent.error());
        }

        for (int attempt = 1; attempt <= maxAttempts; ++attempt)
        {
            if (!pause(checkDelay))
            {
                return Result<std::string>::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED);
            }

            auto current = readSetting(settingKey);
            LABELLINK_LOG_DEBUG("StateChangeVerifier: {} check {}/{}: {}", operationName, attempt, maxAttempts,
                                current.value_or("<none>"));
            if (isStateValid(current))
            {
                LABELLINK_LOG_DEBUG("StateChangeVerifier: {} state changed successfully", operationName);
                return Result<std::string>::Ok(current.value_or(""));
            }
        }

        return Result<std::string>::ErrorMessage(
            LLINK_ERROR_CODE::OPERATION_TIMEOUT,
            operationName + " failed - state did not change after " + std::to_string(maxAttempts) + " attempts");
    }

    Result<bool> StateChangeVerifier::setBooleanState(const std::string &operationName,
                                                      const std::string &command,
                                                      const std::string &settingKey,
                                                      bool desiredState,
                                                      std::chrono::milliseconds checkDelay,
                                                      int maxAttempts)
    {
        auto result = executeAndVerify(
            operationName, command, settingKey,
            [desiredState](const std::optional<std::string> &value)
            {
                if (!value)
                {
                    return false;
                }
                auto parsed = StatusParser::toBool(*value);
                return parsed.has_value() && *parsed == desiredState;
            },
            checkDelay, maxAttempts);

        if (result.isError())
        {
            return Result<bool>::Error(std::move(result).error());
        }
        return Result<bool>::Ok(desiredState);
    }

    Result<std::string> StateChangeVerifier::setStringState(const std::string &operationName,
                                                            const std::string &command,
                                                            const std::string &settingKey,
                                                            const Validator &validator,
                                                            std::chrono::milliseconds checkDelay,
                                                            int maxAttempts)
    {
        return executeAndVerify(operationName, command, settingKey, validator, checkDelay, maxAttempts);
    }

    VoidResult StateChangeVerifier::executeWithDelay(const std::string &operationName,
                                                     const std::string &command,
                                                     std::chrono::milliseconds delay)
    {
        LABELLINK_LOG_DEBUG("StateChangeVerifier: {} sending command (no verification available)", operationName);
        auto sent = m_transport->sendRaw(command);
        if (sent.isError())
        {
            return sent;
        }
        if (!pause(delay))
        {
            return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED);
        }
        return VoidResult::Success();
    }
} // namespace llink
