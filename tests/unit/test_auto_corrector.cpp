#include <catch2/catch.hpp>
#include "mocks/mock_transport.h"
#include "protocol/sgd_codec.h"
#include "readiness/auto_corrector.h"

using namespace llink;
using namespace llink::test;
using namespace std::chrono_literals;

namespace
{
    struct CorrectorFixture
    {
        CorrectorFixture()
            : printer(std::make_shared<MockTransport>())
        {
            printer->setConnected(true);
            options.maxAttempts = 2;
            options.attemptDelay = 10ms;
        }

        std::shared_ptr<PrinterReadiness> readAll()
        {
            auto readiness = std::make_shared<PrinterReadiness>(printer, ReadinessOptions::all());
            readiness->readAllStatuses();
            printer->resetCounters();
            return readiness;
        }

        std::shared_ptr<MockTransport> printer;
        AutoCorrectionOptions options = AutoCorrectionOptions::all();
    };

    const std::string kZplLabel = "^XA^FO20,20^FDShip to^FS^XZ";
    const std::string kCpclLabel = "! 0 200 200 210 1\r\nTEXT 4 0 30 40 Hello\r\nPRINT\r\n";
} // namespace

// ============================================================================
// correctReadiness
// ============================================================================

TEST_CASE("AutoCorrector - Healthy printer needs nothing", "[corrector]")
{
    CorrectorFixture f;
    auto readiness = f.readAll();
    AutoCorrector corrector(f.printer, f.options);

    auto first = corrector.correct(readiness);
    REQUIRE_FALSE(first.hasCorrections());

    auto second = corrector.correct(readiness);
    REQUIRE_FALSE(second.hasCorrections());
    REQUIRE(f.printer->transportCalls() == 0);
}

TEST_CASE("AutoCorrector - Unpause", "[corrector][slow]")
{
    CorrectorFixture f;
    f.printer->setSetting("device.pause", "true");
    auto readiness = f.readAll();
    AutoCorrector corrector(f.printer, f.options);

    SECTION("Paused printer is unpaused and verified")
    {
        CorrectedReadiness log(readiness);
        REQUIRE(corrector.correctReadiness(*readiness, log));
        REQUIRE(log.isPausedFixed());
        REQUIRE(f.printer->wasSent(SgdCodec::unpauseCommand()));
        REQUIRE(readiness->cachedIsPaused() == false);
        REQUIRE(readiness->isReady());
    }

    SECTION("Second run on the corrected snapshot is idempotent")
    {
        corrector.correct(readiness);
        f.printer->resetCounters();

        auto again = corrector.correct(readiness);
        REQUIRE_FALSE(again.hasCorrections());
        REQUIRE(f.printer->transportCalls() == 0);
    }

    SECTION("Disabled correction is skipped")
    {
        AutoCorrectionOptions options = AutoCorrectionOptions::none();
        options.enableClearErrors = true;
        AutoCorrector limited(f.printer, options);

        auto log = limited.correct(readiness);
        REQUIRE_FALSE(log.hasCorrections());
        REQUIRE(f.printer->sentCommands().empty());
    }
}

TEST_CASE("AutoCorrector - Corrections are independent", "[corrector][slow]")
{
    CorrectorFixture f;
    f.printer->setSetting("device.pause", "true");
    f.printer->setSetting("device.host_status", "1,0,0,0,0,0");
    auto readiness = f.readAll();

    // Pause never clears, so the unpause verification runs out
    f.printer->setApplySetvar(false);
    f.options.maxAttempts = 1;
    AutoCorrector corrector(f.printer, f.options);

    CorrectedReadiness log(readiness);
    REQUIRE(corrector.correctReadiness(*readiness, log));

    REQUIRE(log.corrections().size() == 2);
    REQUIRE(log.corrections()[0].name == correction_names::UNPAUSE);
    REQUIRE_FALSE(log.corrections()[0].success);
    REQUIRE(log.corrections()[0].error == "Unpause failed - state did not change after 1 attempts");
    REQUIRE(log.corrections()[1].name == correction_names::CLEAR_ERRORS);
    REQUIRE(log.corrections()[1].success);
    REQUIRE(f.printer->wasSent(SgdCodec::clearErrorsCommand()));

    // Host status must be read again after clearing
    REQUIRE_FALSE(readiness->wasRead(ReadinessDimension::HOST));
}

TEST_CASE("AutoCorrector - Transport failures are captured", "[corrector]")
{
    CorrectorFixture f;
    f.printer->setSetting("device.host_status", "1,0,0,0,0,0");
    auto readiness = f.readAll();
    f.printer->failNextSends(1, ErrorInfo::fromCode(LLINK_ERROR_CODE::CONNECTION_LOST));

    std::vector<std::string> messages;
    AutoCorrector corrector(f.printer, f.options);
    corrector.setStatusCallback([&messages](const std::string &name, const std::string &message)
                                { messages.push_back(name + "|" + message); });

    CorrectedReadiness log(readiness);
    REQUIRE_NOTHROW(corrector.correctReadiness(*readiness, log));
    REQUIRE(log.anyFailed());
    REQUIRE(log.corrections()[0].error == describeError(LLINK_ERROR_CODE::CONNECTION_LOST).messageTemplate);
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0] == "clearErrors|Printer reports errors, clearing");
}

TEST_CASE("AutoCorrector - Calibration", "[corrector][slow]")
{
    CorrectorFixture f;
    f.printer->setSetting("media.status", "out");
    auto readiness = f.readAll();

    SECTION("Missing media triggers calibration")
    {
        AutoCorrector corrector(f.printer, f.options);
        auto log = corrector.correct(readiness);
        REQUIRE(log.isMediaFixed());
        REQUIRE(f.printer->wasSent(SgdCodec::calibrateCommand()));
        REQUIRE_FALSE(readiness->wasRead(ReadinessDimension::MEDIA));
    }

    SECTION("Safe corrections never calibrate")
    {
        AutoCorrector corrector(f.printer, AutoCorrectionOptions::safe());
        auto log = corrector.correct(readiness);
        REQUIRE_FALSE(log.hasCorrections());
        REQUIRE(f.printer->sentCommands().empty());
    }
}

// ============================================================================
// Language switching
// ============================================================================

TEST_CASE("AutoCorrector - Language switch", "[corrector]")
{
    CorrectorFixture f;
    f.printer->setSetting("device.languages", "line_print");
    auto readiness = f.readAll();

    SECTION("Mismatch is switched and confirmed")
    {
        AutoCorrector corrector(f.printer, f.options);
        CorrectedReadiness log(readiness);
        auto result = corrector.switchLanguageForData(kZplLabel, *readiness, &log);

        REQUIRE(result.isSuccess());
        REQUIRE(log.isLanguageFixed());
        REQUIRE(f.printer->wasSent(SgdCodec::setLanguageCommand(PrintLanguage::ZPL)));
        REQUIRE(readiness->cachedRaw(ReadinessDimension::LANGUAGE) == std::string("zpl"));
    }

    SECTION("Matching language sends nothing")
    {
        AutoCorrector corrector(f.printer, f.options);
        auto result = corrector.switchLanguageForData(kCpclLabel, *readiness);
        REQUIRE(result.isSuccess());
        REQUIRE(f.printer->sentCommands().empty());
        REQUIRE(f.printer->queryCount("device.languages") == 1);
    }

    SECTION("Switching disabled reports the mismatch")
    {
        AutoCorrectionOptions options = AutoCorrectionOptions::safe();
        AutoCorrector corrector(f.printer, options);
        auto result = corrector.switchLanguageForData(kZplLabel, *readiness);
        REQUIRE(result.code() == LLINK_ERROR_CODE::LANGUAGE_MISMATCH);
        REQUIRE(f.printer->sentCommands().empty());
    }

    SECTION("Unknown payload language assumes no action")
    {
        AutoCorrector corrector(f.printer, f.options);
        REQUIRE(corrector.switchLanguageForData("plain text", *readiness).isSuccess());
        REQUIRE(f.printer->transportCalls() == 0);
    }

    SECTION("Unknown printer language assumes no action")
    {
        f.printer->failQuery("device.languages", ErrorInfo::fromCode(LLINK_ERROR_CODE::STATUS_TIMEOUT, 3));
        AutoCorrector corrector(f.printer, f.options);
        REQUIRE(corrector.switchLanguageForData(kZplLabel, *readiness).isSuccess());
        REQUIRE(f.printer->sentCommands().empty());
    }

    SECTION("Printer never confirms")
    {
        f.printer->setApplySetvar(false);
        AutoCorrector corrector(f.printer, f.options);
        CorrectedReadiness log(readiness);
        auto result = corrector.switchLanguageForData(kZplLabel, *readiness, &log);
        REQUIRE(result.code() == LLINK_ERROR_CODE::LANGUAGE_MISMATCH);
        REQUIRE(log.anyFailed());
    }
}

TEST_CASE("AutoCorrector - Buffer preparation", "[corrector]")
{
    CorrectorFixture f;
    auto readiness = f.readAll();
    AutoCorrector corrector(f.printer, f.options);

    CorrectedReadiness log(readiness);
    REQUIRE(corrector.prepareBuffer(log));
    REQUIRE(f.printer->sentCommands() == std::vector<std::string>{SgdCodec::clearBufferCommand(),
                                                                 SgdCodec::flushBufferCommand()});
    REQUIRE(log.isBufferCleared());
}
