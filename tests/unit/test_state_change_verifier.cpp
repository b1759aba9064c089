#include <catch2/catch.hpp>
#include <thread>
#include "mocks/mock_transport.h"
#include "protocol/sgd_codec.h"
#include "readiness/state_change_verifier.h"

using namespace llink;
using namespace llink::test;
using namespace std::chrono_literals;

TEST_CASE("StateChangeVerifier - Boolean state", "[verifier]")
{
    auto printer = std::make_shared<MockTransport>();
    StateChangeVerifier verifier(printer);

    SECTION("Already in the desired state sends nothing")
    {
        auto result = verifier.setBooleanState("Unpause", SgdCodec::unpauseCommand(), "device.pause", false, 5ms, 3);
        REQUIRE(result.isSuccess());
        REQUIRE(printer->sentCommands().empty());
        REQUIRE(printer->queryCount("device.pause") == 1);
    }

    SECTION("State change is polled until it holds")
    {
        printer->setSetting("device.pause", "true");
        printer->setApplySetvar(false);
        printer->queueResponses("device.pause", {"\"true\"", "\"true\"", "\"false\""});

        auto result = verifier.setBooleanState("Unpause", SgdCodec::unpauseCommand(), "device.pause", false, 5ms, 3);
        REQUIRE(result.isSuccess());
        REQUIRE(printer->sentCommands().size() == 1);
        REQUIRE(printer->queryCount("device.pause") == 3);
    }

    SECTION("Exhausted checks time out")
    {
        printer->setSetting("device.pause", "true");
        printer->setApplySetvar(false);

        auto result = verifier.setBooleanState("Unpause", SgdCodec::unpauseCommand(), "device.pause", false, 5ms, 2);
        REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_TIMEOUT);
        REQUIRE(result.message() == "Unpause failed - state did not change after 2 attempts");
        REQUIRE(printer->queryCount("device.pause") == 3);
    }

    SECTION("Send failure is forwarded unchanged")
    {
        printer->setSetting("device.pause", "true");
        printer->failNextSends(1, ErrorInfo::fromCode(LLINK_ERROR_CODE::NOT_CONNECTED));

        auto result = verifier.setBooleanState("Unpause", SgdCodec::unpauseCommand(), "device.pause", false, 5ms, 2);
        REQUIRE(result.code() == LLINK_ERROR_CODE::NOT_CONNECTED);
    }
}

TEST_CASE("StateChangeVerifier - Cancellation", "[verifier]")
{
    auto printer = std::make_shared<MockTransport>();
    printer->setSetting("device.pause", "true");
    printer->setApplySetvar(false);

    CancellationToken token;
    StateChangeVerifier verifier(printer, &token);
    std::thread canceller([&token]()
                          {
                              std::this_thread::sleep_for(30ms);
                              token.cancel(); });

    const auto start = std::chrono::steady_clock::now();
    auto result = verifier.setBooleanState("Unpause", SgdCodec::unpauseCommand(), "device.pause", false, 10s, 3);
    canceller.join();

    REQUIRE(result.code() == LLINK_ERROR_CODE::OPERATION_CANCELLED);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("StateChangeVerifier - Unverifiable commands", "[verifier]")
{
    auto printer = std::make_shared<MockTransport>();
    StateChangeVerifier verifier(printer);

    auto result = verifier.executeWithDelay("Clear errors", SgdCodec::clearErrorsCommand(), 1ms);
    REQUIRE(result.isSuccess());
    REQUIRE(printer->sentCommands() == std::vector<std::string>{"~JA"});
}
