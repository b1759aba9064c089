#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "core/cancellation_token.h"
#include "transport/transport.h"
#include "types/result.h"

namespace llink
{
    /**
     * Verifies commands that the printer executes without acknowledging
     *
     * The target state is read first and the command is skipped when it
     * already holds. Otherwise the command is sent and the setting is
     * polled until the validator accepts it or attempts run out.
     */
    class StateChangeVerifier
    {
    public:
        using Validator = std::function<bool(const std::optional<std::string> &)>;

        explicit StateChangeVerifier(std::shared_ptr<ITransport> transport,
                                     const CancellationToken *cancellation = nullptr);

        Result<std::string> executeAndVerify(const std::string &operationName,
                                             const std::string &command,
                                             const std::string &settingKey,
                                             const Validator &isStateValid,
                                             std::chrono::milliseconds checkDelay = std::chrono::milliseconds(200),
                                             int maxAttempts = 3);

        /**
         * Drive a boolean setting (e.g. device.pause) to the desired value
         */
        Result<bool> setBooleanState(const std::string &operationName,
                                     const std::string &command,
                                     const std::string &settingKey,
                                     bool desiredState,
                                     std::chrono::milliseconds checkDelay = std::chrono::milliseconds(200),
                                     int maxAttempts = 3);

        Result<std::string> setStringState(const std::string &operationName,
                                           const std::string &command,
                                           const std::string &settingKey,
                                           const Validator &validator,
                                           std::chrono::milliseconds checkDelay = std::chrono::milliseconds(200),
                                           int maxAttempts = 3);

        /**
         * Send a command that cannot be verified and wait for it to settle
         */
        VoidResult executeWithDelay(const std::string &operationName,
                                    const std::string &command,
                                    std::chrono::milliseconds delay = std::chrono::milliseconds(500));

    private:
        std::optional<std::string> readSetting(const std::string &settingKey);
        // Returns false when cancelled during the wait
        bool pause(std::chrono::milliseconds delay);

        std::shared_ptr<ITransport> m_transport;
        const CancellationToken *m_cancellation;
    };
} // namespace llink
