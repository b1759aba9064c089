#pragma once

namespace llink
{
    /**
     * Error code enumeration
     * Codes are grouped in ranges so the category can be derived from the value
     */
    enum class LLINK_ERROR_CODE
    {
        // Success status
        SUCCESS = 0, // Operation successful

        // General errors (1-99)
        UNKNOWN_ERROR = 1,  // Unknown error
        INTERNAL_ERROR = 2, // Unexpected internal failure

        // Connection errors (1000-1099)
        CONNECTION_ERROR = 1000,        // Failed to connect to printer
        CONNECTION_TIMEOUT = 1001,      // Connection timed out
        CONNECTION_LOST = 1002,         // Connection dropped
        NOT_CONNECTED = 1003,           // No printer connected
        ALREADY_CONNECTED = 1004,       // Already connected to a printer
        INVALID_DEVICE_ADDRESS = 1005,  // Address could not be resolved
        CONNECTION_RETRY_FAILED = 1006, // Connection retries exhausted
        CONNECTION_REFUSED = 1007,      // Remote end refused the connection
        CONNECTION_PERMISSION = 1008,   // Permission denied by the OS

        // Discovery errors (1100-1199)
        DISCOVERY_ERROR = 1100,   // Discovery failed
        NO_PRINTERS_FOUND = 1101, // Nothing discovered
        NETWORK_ERROR = 1102,     // Network unavailable

        // Print errors (1200-1299)
        PRINT_ERROR = 1200,               // Print operation failed
        PRINT_TIMEOUT = 1201,             // Print operation timed out
        PRINTER_NOT_READY = 1202,         // Readiness check failed
        OUT_OF_PAPER = 1203,              // Media out
        HEAD_OPEN = 1204,                 // Print head open
        PRINTER_PAUSED = 1205,            // Printer paused
        RIBBON_ERROR = 1206,              // Ribbon fault
        PRINT_RETRY_FAILED = 1207,        // Print retries exhausted
        PRINT_DATA_INVALID_FORMAT = 1208, // Payload language undetermined
        PRINT_DATA_TOO_LARGE = 1209,      // Payload exceeds size limit
        LANGUAGE_MISMATCH = 1210,         // Printer language differs from payload

        // Data errors (1300-1399)
        INVALID_DATA = 1300,   // Invalid data
        INVALID_FORMAT = 1301, // Invalid format
        EMPTY_DATA = 1302,     // No data supplied

        // Operation errors (1400-1499)
        OPERATION_TIMEOUT = 1400,    // Operation timed out
        OPERATION_CANCELLED = 1401,  // Operation cancelled
        INVALID_ARGUMENT = 1402,     // Invalid argument
        OPERATION_ERROR = 1403,      // Operation failed
        RETRY_LIMIT_EXCEEDED = 1404, // Retry policy exhausted

        // Status errors (1500-1599)
        STATUS_CHECK_FAILED = 1500,     // Status query failed
        STATUS_TIMEOUT = 1501,          // Status query timed out
        INVALID_STATUS_RESPONSE = 1502, // Unparseable status response

        // Platform errors (1600-1699)
        PLATFORM_ERROR = 1600,  // Platform error
        NOT_IMPLEMENTED = 1601, // Not available on this platform
    };

    /**
     * Error category derived from the code range
     */
    enum class ErrorCategory
    {
        SYSTEM = 0,
        CONNECTION,
        DISCOVERY,
        PRINT,
        DATA,
        OPERATION,
        STATUS,
        PLATFORM
    };

    inline ErrorCategory categoryOf(LLINK_ERROR_CODE code)
    {
        const int value = static_cast<int>(code);
        if (value >= 1000 && value < 1100)
            return ErrorCategory::CONNECTION;
        if (value >= 1100 && value < 1200)
            return ErrorCategory::DISCOVERY;
        if (value >= 1200 && value < 1300)
            return ErrorCategory::PRINT;
        if (value >= 1300 && value < 1400)
            return ErrorCategory::DATA;
        if (value >= 1400 && value < 1500)
            return ErrorCategory::OPERATION;
        if (value >= 1500 && value < 1600)
            return ErrorCategory::STATUS;
        if (value >= 1600 && value < 1700)
            return ErrorCategory::PLATFORM;
        return ErrorCategory::SYSTEM;
    }
} // namespace llink
