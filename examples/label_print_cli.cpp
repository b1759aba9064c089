#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "labellink.h"
#include "types/internal/json_serializer.h"

using namespace llink;

/**
 * Label print command line example
 * Sends a ZPL or CPCL payload to a network label printer and writes every
 * workflow event to stdout as one JSON line.
 */
namespace
{
    struct CliOptions
    {
        std::string address;
        std::string data;
        int copies = 1;
        int maxAttempts = 3;
        bool waitForCompletion = true;
        bool autoCorrect = false;
        bool verbose = false;
        bool statusOnly = false;
    };

    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " <host[:port]> (--file <path> | --data <payload>) [options]\n"
                  << "Options:\n"
                  << "  --copies <n>     Print the payload n times as a batch\n"
                  << "  --attempts <n>   Attempts per print (default 3)\n"
                  << "  --no-wait        Do not wait for the printer to finish\n"
                  << "  --fix            Enable every automatic correction\n"
                  << "  --status         Only read and dump printer readiness\n"
                  << "  --verbose        Debug logging\n";
    }

    bool readFile(const std::string &path, std::string &out)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            return false;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        out = buffer.str();
        return true;
    }

    bool parseArguments(int argc, char *argv[], CliOptions &options)
    {
        if (argc < 2)
        {
            return false;
        }
        options.address = argv[1];

        for (int i = 2; i < argc; ++i)
        {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;
            try
            {
                if (arg == "--file" && hasValue)
                {
                    std::string path = argv[++i];
                    if (!readFile(path, options.data))
                    {
                        std::cerr << "Cannot read " << path << std::endl;
                        return false;
                    }
                }
                else if (arg == "--data" && hasValue)
                {
                    options.data = argv[++i];
                }
                else if (arg == "--copies" && hasValue)
                {
                    options.copies = std::stoi(argv[++i]);
                }
                else if (arg == "--attempts" && hasValue)
                {
                    options.maxAttempts = std::stoi(argv[++i]);
                }
                else if (arg == "--no-wait")
                {
                    options.waitForCompletion = false;
                }
                else if (arg == "--fix")
                {
                    options.autoCorrect = true;
                }
                else if (arg == "--status")
                {
                    options.statusOnly = true;
                }
                else if (arg == "--verbose")
                {
                    options.verbose = true;
                }
                else
                {
                    std::cerr << "Unknown argument: " << arg << std::endl;
                    return false;
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
                return false;
            }
        }

        return options.statusOnly || !options.data.empty();
    }

    int dumpStatus(LabelLink &link, const CliOptions &options)
    {
        auto transport = link.createTransport();
        auto connected = transport->connect(options.address);
        if (connected.isError())
        {
            std::cout << nlohmann::json(connected.error()).dump() << std::endl;
            return 1;
        }

        auto readiness = link.createReadiness(transport, ReadinessOptions::all());
        readiness->readAllStatuses();
        std::cout << readiness->cachedValues() << std::endl;

        auto disconnected = transport->disconnect();
        if (disconnected.isError())
        {
            std::cerr << "Disconnect failed: " << disconnected.message() << std::endl;
        }
        return readiness->isReady() ? 0 : 2;
    }
} // namespace

int main(int argc, char *argv[])
{
    CliOptions options;
    if (!parseArguments(argc, argv, options))
    {
        printUsage(argv[0]);
        return 64;
    }

    LabelLink::Config config;
    config.log.logLevel = options.verbose ? 1 : 3;
    config.log.logEnableConsole = true;

    LabelLink &link = LabelLink::getInstance();
    if (!link.initialize(config))
    {
        std::cerr << "LabelLink initialization failed" << std::endl;
        return 1;
    }

    if (options.statusOnly)
    {
        int code = dumpStatus(link, options);
        link.cleanup();
        return code;
    }

    PrintOptions printOptions;
    printOptions.maxAttempts = options.maxAttempts;
    printOptions.waitForCompletion = options.waitForCompletion;
    if (options.autoCorrect)
    {
        printOptions.autoCorrection = AutoCorrectionOptions::all();
    }

    auto transport = link.createTransport();
    auto workflow = link.createWorkflow(transport);
    workflow->eventBus().subscribeAll([](const PrintEvent &event)
                                      { std::cout << nlohmann::json(event).dump() << std::endl; });

    int exitCode = 0;
    if (options.copies > 1)
    {
        BatchPrintOptions batch;
        batch.print = printOptions;
        std::vector<std::string> payloads(static_cast<size_t>(options.copies), options.data);
        BatchPrintResult result = workflow->printBatch(payloads, options.address, batch);
        nlohmann::json summary = {
            {"total", result.total},
            {"succeeded", result.succeeded},
            {"stoppedEarly", result.stoppedEarly}};
        for (const auto &failure : result.failures)
        {
            summary["failures"].push_back({{"index", failure.first}, {"error", failure.second}});
        }
        std::cout << summary.dump() << std::endl;
        exitCode = result.allSucceeded() ? 0 : 1;
    }
    else
    {
        auto result = workflow->print(options.data, options.address, printOptions);
        std::cout << nlohmann::json(*workflow->state()).dump() << std::endl;
        exitCode = result.isSuccess() ? 0 : 1;
    }

    auto disconnected = transport->disconnect();
    if (disconnected.isError())
    {
        std::cerr << "Disconnect failed: " << disconnected.message() << std::endl;
    }
    link.cleanup();
    return exitCode;
}
