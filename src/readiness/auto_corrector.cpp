#include "readiness/auto_corrector.h"
#include "protocol/sgd_codec.h"
#include "readiness/state_change_verifier.h"
#include "utils/logger.h"
#include <thread>

namespace llink
{
    namespace
    {
        constexpr std::chrono::milliseconds kUnpauseCheckDelay{200};
        constexpr std::chrono::milliseconds kCalibrateSettleDelay{1000};
        constexpr std::chrono::milliseconds kBufferSettleDelay{100};
    } // namespace

    AutoCorrector::AutoCorrector(std::shared_ptr<ITransport> transport,
                                 AutoCorrectionOptions options,
                                 const CancellationToken *cancellation)
        : m_transport(std::move(transport)), m_options(std::move(options)), m_cancellation(cancellation)
    {
    }

    void AutoCorrector::notify(const std::string &name, const std::string &message)
    {
        if (!m_statusCallback)
        {
            return;
        }
        try
        {
            m_statusCallback(name, message);
        }
        catch (const std::exception &e)
        {
            LABELLINK_LOG_WARN("AutoCorrector: Status callback threw: {}", e.what());
        }
    }

    void AutoCorrector::record(CorrectedReadiness &log, const char *name, const VoidResult &result)
    {
        if (result.isSuccess())
        {
            LABELLINK_LOG_INFO("AutoCorrector: {} succeeded", name);
            log.recordCorrection(name, true);
            notify(name, std::string(name) + " succeeded");
        }
        else
        {
            LABELLINK_LOG_WARN("AutoCorrector: {} failed: {}", name, result.error().message);
            log.recordCorrection(name, false, result.error().message);
            notify(name, std::string(name) + " failed: " + result.error().message);
        }
    }

    bool AutoCorrector::correctReadiness(PrinterReadiness &readiness, CorrectedReadiness &log)
    {
        if (!m_options.hasAnyEnabled())
        {
            LABELLINK_LOG_DEBUG("AutoCorrector: No corrections enabled");
            return false;
        }

        bool anySucceeded = false;

        if (m_options.enableUnpause && readiness.cachedIsPaused().value_or(false))
        {
            notify(correction_names::UNPAUSE, "Printer is paused, unpausing");
            auto result = unpause(readiness);
            record(log, correction_names::UNPAUSE, result);
            anySucceeded = anySucceeded || result.isSuccess();
        }

        if (m_options.enableClearErrors && !readiness.errors().empty())
        {
            notify(correction_names::CLEAR_ERRORS, "Printer reports errors, clearing");
            auto result = clearErrors(readiness);
            record(log, correction_names::CLEAR_ERRORS, result);
            anySucceeded = anySucceeded || result.isSuccess();
        }

        auto hasMedia = readiness.cachedHasMedia();
        if (m_options.enableCalibration && hasMedia && !*hasMedia)
        {
            notify(correction_names::CALIBRATE, "No media detected, calibrating");
            auto result = calibrate(readiness);
            record(log, correction_names::CALIBRATE, result);
            anySucceeded = anySucceeded || result.isSuccess();
        }

        return anySucceeded;
    }

    CorrectedReadiness AutoCorrector::correct(const std::shared_ptr<PrinterReadiness> &readiness)
    {
        CorrectedReadiness log(readiness);
        if (readiness)
        {
            correctReadiness(*readiness, log);
        }
        return log;
    }

    VoidResult AutoCorrector::unpause(PrinterReadiness &readiness)
    {
        StateChangeVerifier verifier(m_transport, m_cancellation);
        auto result = verifier.setBooleanState("Unpause", SgdCodec::unpauseCommand(), sgd_keys::DEVICE_PAUSE, false,
                                               kUnpauseCheckDelay, m_options.maxAttempts);
        if (result.isError())
        {
            return VoidResult::Error(std::move(result).error());
        }
        readiness.setCachedPause("false");
        return VoidResult::Success();
    }

    VoidResult AutoCorrector::clearErrors(PrinterReadiness &readiness)
    {
        StateChangeVerifier verifier(m_transport, m_cancellation);
        auto result = verifier.executeWithDelay("Clear errors", SgdCodec::clearErrorsCommand(), m_options.attemptDelay);
        if (result.isSuccess())
        {
            // Host status must be read again to confirm
            readiness.reset(ReadinessDimension::HOST);
        }
        return result;
    }

    VoidResult AutoCorrector::calibrate(PrinterReadiness &readiness)
    {
        StateChangeVerifier verifier(m_transport, m_cancellation);
        auto result = verifier.executeWithDelay("Calibrate", SgdCodec::calibrateCommand(), kCalibrateSettleDelay);
        if (result.isSuccess())
        {
            readiness.reset(ReadinessDimension::MEDIA);
        }
        return result;
    }

    VoidResult AutoCorrector::switchLanguageForData(const std::string &data,
                                                    PrinterReadiness &readiness,
                                                    CorrectedReadiness *log)
    {
        const PrintLanguage target = SgdCodec::detectLanguage(data);
        if (target == PrintLanguage::UNKNOWN)
        {
            LABELLINK_LOG_DEBUG("AutoCorrector: Payload language unknown, skipping language check");
            return VoidResult::Success();
        }

        auto current = readiness.readLanguageFresh();
        if (!current || current->empty())
        {
            LABELLINK_LOG_DEBUG("AutoCorrector: Printer language unknown, assuming {} is accepted", printLanguageToString(target));
            return VoidResult::Success();
        }

        if (SgdCodec::isLanguageMatch(*current, target))
        {
            LABELLINK_LOG_DEBUG("AutoCorrector: Printer language '{}' matches {}", *current, printLanguageToString(target));
            return VoidResult::Success();
        }

        if (!m_options.enableLanguageSwitch)
        {
            return VoidResult::ErrorMessage(LLINK_ERROR_CODE::LANGUAGE_MISMATCH,
                                            "Printer language '" + *current + "' does not match " +
                                                printLanguageToString(target) + " data");
        }

        LABELLINK_LOG_INFO("AutoCorrector: Switching printer language from '{}' to {}", *current, printLanguageToString(target));
        notify(correction_names::SWITCH_LANGUAGE, "Switching printer language to " + printLanguageToString(target));

        StateChangeVerifier verifier(m_transport, m_cancellation);
        auto result = verifier.setStringState(
            "Switch language", SgdCodec::setLanguageCommand(target), sgd_keys::LANGUAGES,
            [target](const std::optional<std::string> &value)
            {
                return value.has_value() && SgdCodec::isLanguageMatch(*value, target);
            },
            m_options.attemptDelay, m_options.maxAttempts);

        VoidResult outcome = VoidResult::Success();
        if (result.isSuccess())
        {
            readiness.setCachedLanguage(result.value());
        }
        else if (result.code() == LLINK_ERROR_CODE::OPERATION_TIMEOUT)
        {
            outcome = VoidResult::ErrorMessage(LLINK_ERROR_CODE::LANGUAGE_MISMATCH, result.error().message);
        }
        else
        {
            outcome = VoidResult::Error(std::move(result).error());
        }

        if (log)
        {
            record(*log, correction_names::SWITCH_LANGUAGE, outcome);
        }
        return outcome;
    }

    bool AutoCorrector::prepareBuffer(CorrectedReadiness &log)
    {
        bool ok = true;
        StateChangeVerifier verifier(m_transport, m_cancellation);

        if (m_options.enableClearBuffer)
        {
            auto result = verifier.executeWithDelay("Clear buffer", SgdCodec::clearBufferCommand(), kBufferSettleDelay);
            record(log, correction_names::CLEAR_BUFFER, result);
            ok = ok && result.isSuccess();
        }

        if (m_options.enableFlushBuffer)
        {
            auto result = verifier.executeWithDelay("Flush buffer", SgdCodec::flushBufferCommand(), kBufferSettleDelay);
            record(log, correction_names::FLUSH_BUFFER, result);
            ok = ok && result.isSuccess();
        }
        return ok;
    }
} // namespace llink
