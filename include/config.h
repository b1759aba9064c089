#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "version.h"

namespace llink
{
    /**
     * Unified configuration for all LabelLink components
     */

    /**
     * Logging configuration (shared by all components)
     */
    struct LabelLinkLogConfig
    {
        int logLevel = 2;                         // Log level: 0-TRACE, 1-DEBUG, 2-INFO, 3-WARN, 4-ERROR, 5-CRITICAL, 6-OFF
        bool logEnableConsole = true;             // Enable console output
        bool logEnableFile = false;               // Enable file output
        std::string logFileName;                  // Log file name
        size_t logMaxFileSize = 10 * 1024 * 1024; // Maximum log file size (bytes)
        size_t logMaxFiles = 5;                   // Maximum number of log files
    };

    /**
     * Defaults for retry policies created without explicit settings
     */
    struct RetryDefaults
    {
        int maxAttempts = 3;
        std::chrono::milliseconds baseDelay{2000};
        double backoffMultiplier = 2.0;
        std::chrono::milliseconds maxDelay{30000};
    };

    /**
     * Scoring constants of the smart device selector
     */
    struct SelectorWeights
    {
        int preferredTransport = 30;
        int otherTransport = 20;

        int modelRW420 = 25;
        int modelZQ521 = 23;
        int modelZQ520 = 22;
        int modelZQ510 = 20;
        int modelZQ = 15;     // Any other ZQ series
        int modelZebra = 10;  // Any other Zebra device
        int modelUnknown = 5;

        int historyFivePlus = 15;
        int historyThreePlus = 10;
        int historyOnePlus = 5;

        int availabilityConnected = 10;
        int availabilityReady = 8;
        int availabilityDiscovered = 5;
        int availabilityOther = 3;

        // Exceeds the sum of every other factor
        int previousSelectionBonus = 1000;
    };

    /**
     * Dwell time estimate after sending a job
     */
    struct DwellTimingConfig
    {
        double zplMsPerChar = 0.1;
        double cpclMsPerChar = 0.2;
        double defaultMsPerChar = 0.15;
        std::chrono::milliseconds jobOverhead{1000};
        std::chrono::milliseconds mechanicalOverhead{2000};
        std::chrono::milliseconds minimum{3000};
    };

    /**
     * Raw TCP transport settings
     */
    struct TransportConfig
    {
        int defaultPort = 9100;
        std::chrono::milliseconds connectTimeout{5000};
        std::chrono::milliseconds readTimeout{3000};
        int connectAttempts = 2;
        std::chrono::milliseconds connectRetryDelay{500};
    };

    /**
     * Complete LabelLink configuration
     * All components use this unified configuration structure
     */
    struct LabelLinkConfig
    {
        LabelLinkLogConfig log;
        RetryDefaults retry;
        SelectorWeights selector;
        DwellTimingConfig dwell;
        TransportConfig transport;
    };

} // namespace llink
