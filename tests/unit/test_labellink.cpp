#include <catch2/catch.hpp>
#include "labellink.h"
#include "mocks/mock_transport.h"

using namespace llink;
using namespace llink::test;

namespace
{
    LabelLink::Config quietConfig()
    {
        LabelLink::Config config;
        config.log.logLevel = 6;
        config.log.logEnableConsole = false;
        config.dwell.minimum = std::chrono::milliseconds(10);
        config.dwell.jobOverhead = std::chrono::milliseconds(1);
        config.dwell.mechanicalOverhead = std::chrono::milliseconds(1);
        return config;
    }
} // namespace

TEST_CASE("LabelLink - Lifecycle", "[labellink]")
{
    auto &sdk = LabelLink::getInstance();
    sdk.cleanup();
    REQUIRE_FALSE(sdk.isInitialized());

    SECTION("print requires initialize")
    {
        auto result = sdk.print("10.0.0.9", "^XA^XZ");
        REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_ERROR);
    }

    SECTION("initialize is idempotent")
    {
        REQUIRE(sdk.initialize(quietConfig()));
        REQUIRE(sdk.initialize(quietConfig()));
        REQUIRE(sdk.isInitialized());
        REQUIRE(sdk.getConfig().log.logLevel == 6);
        sdk.cleanup();
        REQUIRE_FALSE(sdk.isInitialized());
    }

    REQUIRE_FALSE(LabelLink::getVersion().empty());
}

TEST_CASE("LabelLink - Workflows share the connection history", "[labellink]")
{
    auto &sdk = LabelLink::getInstance();
    sdk.cleanup();
    REQUIRE(sdk.initialize(quietConfig()));

    auto history = sdk.getConnectionHistory();
    const int before = history->successCount("10.0.0.21:9100");

    auto printer = std::make_shared<MockTransport>();
    auto workflow = sdk.createWorkflow(printer);
    REQUIRE(workflow->print("^XA^FDA^FS^XZ", "10.0.0.21:9100").isSuccess());
    REQUIRE(history->successCount("10.0.0.21:9100") == before + 1);

    // The configured dwell timing is used by created workflows
    REQUIRE(workflow->estimateDwellTime("^XA^XZ") == std::chrono::milliseconds(10));

    DeviceInfo known{"10.0.0.21:9100", "Known", "ZT230", TransportType::NETWORK, DeviceAvailability::DISCOVERED};
    DeviceInfo fresh{"10.0.0.22:9100", "Fresh", "ZT230", TransportType::NETWORK, DeviceAvailability::DISCOVERED};
    auto selection = sdk.selectPrinter({fresh, known});
    REQUIRE(selection.selected.has_value());
    REQUIRE(selection.selected->address == known.address);

    REQUIRE_FALSE(sdk.selectPrinter({}).selected.has_value());

    auto readiness = sdk.createReadiness(printer);
    readiness->readAllStatuses();
    REQUIRE(readiness->isReady());

    sdk.cleanup();
}
