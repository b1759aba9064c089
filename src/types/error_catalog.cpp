#include "types/error_catalog.h"
#include <unordered_map>

namespace llink
{
    namespace
    {
        const std::unordered_map<int, ErrorDescriptor> &catalog()
        {
            static const std::unordered_map<int, ErrorDescriptor> table = {
                {0, {"SUCCESS", "ok", ""}},
                {1, {"UNKNOWN_ERROR", "Unknown error occurred",
                     "Review the logs and ensure all dependencies are up to date."}},
                {2, {"INTERNAL_ERROR", "Internal error: {}",
                     "This is a bug in the library. Please report it to the developer."}},

                // Connection
                {1000, {"CONNECTION_ERROR", "Failed to connect to printer",
                        "Check network connection and ensure printer is powered on."}},
                {1001, {"CONNECTION_TIMEOUT", "Connection timed out after {} seconds",
                        "Ensure printer is within range and not obstructed."}},
                {1002, {"CONNECTION_LOST", "Connection to printer was lost",
                        "Re-establish connection by attempting to connect again."}},
                {1003, {"NOT_CONNECTED", "No printer is currently connected",
                        "Connect to a printer before sending commands."}},
                {1004, {"ALREADY_CONNECTED", "Already connected to printer at {}",
                        "Disconnect from the current printer before attempting to connect to a new one."}},
                {1005, {"INVALID_DEVICE_ADDRESS", "Invalid device address: {}",
                        "Ensure the device address is correct and matches the printer model."}},
                {1006, {"CONNECTION_RETRY_FAILED", "Failed to connect after {} attempts",
                        "Review connection settings and ensure printer is reachable."}},
                {1007, {"CONNECTION_REFUSED", "Connection refused by printer: {}",
                        "Ensure the printer accepts raw connections on the configured port."}},
                {1008, {"CONNECTION_PERMISSION", "Permission denied: {}",
                        "Grant the application access to the network or device."}},

                // Discovery
                {1100, {"DISCOVERY_ERROR", "Failed to discover printers",
                        "Ensure the transport is enabled and try again."}},
                {1101, {"NO_PRINTERS_FOUND", "No printers found during discovery",
                        "Ensure the printer is within range and powered on."}},
                {1102, {"NETWORK_ERROR", "Network error: {}",
                        "Check your network connection and try again."}},

                // Print
                {1200, {"PRINT_ERROR", "Print operation failed",
                        "Check printer status and ensure it is ready for printing."}},
                {1201, {"PRINT_TIMEOUT", "Print operation timed out after {} seconds",
                        "Ensure printer is responsive and not busy."}},
                {1202, {"PRINTER_NOT_READY", "Printer is not ready: {}",
                        "Ensure the printer is turned on, has paper, and is not jammed."}},
                {1203, {"OUT_OF_PAPER", "Printer is out of paper",
                        "Add more paper to the printer."}},
                {1204, {"HEAD_OPEN", "Printer head is open",
                        "Close the printer head to resume printing."}},
                {1205, {"PRINTER_PAUSED", "Printer is paused",
                        "Unpause the printer to continue printing."}},
                {1206, {"RIBBON_ERROR", "Ribbon error: {}",
                        "Replace the ribbon or check the printer's ribbon alignment."}},
                {1207, {"PRINT_RETRY_FAILED", "Failed to print after {} attempts",
                        "Review print settings and ensure printer is ready."}},
                {1208, {"PRINT_DATA_INVALID_FORMAT", "Invalid print data format",
                        "Ensure the print data is in a valid format (e.g., ZPL, CPCL)."}},
                {1209, {"PRINT_DATA_TOO_LARGE", "Print data too large: {} bytes",
                        "Reduce the size of the print data or increase the printer's buffer size."}},
                {1210, {"LANGUAGE_MISMATCH", "Print language mismatch: expected {}, got {}",
                        "Set the printer language to match your print data format (ZPL/CPCL)."}},

                // Data
                {1300, {"INVALID_DATA", "Invalid data provided",
                        "Ensure the data you are sending is valid and meets the requirements."}},
                {1301, {"INVALID_FORMAT", "Invalid format: {}",
                        "Ensure the data format is compatible with the printer."}},
                {1302, {"EMPTY_DATA", "No data provided for printing",
                        "Provide valid print data to the printer."}},

                // Operation
                {1400, {"OPERATION_TIMEOUT", "Operation timed out after {} ms",
                        "Ensure the operation completes within the specified time."}},
                {1401, {"OPERATION_CANCELLED", "Operation was cancelled",
                        "Check if the operation was explicitly cancelled by the user."}},
                {1402, {"INVALID_ARGUMENT", "Invalid argument: {}",
                        "Review the parameters passed to the operation."}},
                {1403, {"OPERATION_ERROR", "Operation failed: {}",
                        "Investigate the cause of the operation failure."}},
                {1404, {"RETRY_LIMIT_EXCEEDED", "Retry limit exceeded ({} attempts)",
                        "Review the retry logic and consider increasing the retry limit."}},

                // Status
                {1500, {"STATUS_CHECK_FAILED", "Failed to check printer status: {}",
                        "Re-check the printer's status or try again later."}},
                {1501, {"STATUS_TIMEOUT", "Status check timed out after {} seconds",
                        "Increase the status check timeout or ensure printer is responsive."}},
                {1502, {"INVALID_STATUS_RESPONSE", "Invalid status response from printer",
                        "Review the printer's status response and ensure it's valid."}},

                // Platform
                {1600, {"PLATFORM_ERROR", "Platform error: {}",
                        "Investigate the platform-specific error and ensure it's handled."}},
                {1601, {"NOT_IMPLEMENTED", "Feature not implemented on this platform",
                        "This feature is not yet supported on your platform."}},
            };
            return table;
        }
    } // namespace

    const ErrorDescriptor &describeError(LLINK_ERROR_CODE code)
    {
        const auto &table = catalog();
        auto it = table.find(static_cast<int>(code));
        if (it != table.end())
        {
            return it->second;
        }
        return table.at(static_cast<int>(LLINK_ERROR_CODE::UNKNOWN_ERROR));
    }

    std::string errorCodeName(LLINK_ERROR_CODE code)
    {
        return describeError(code).name;
    }

    std::string errorCategoryName(ErrorCategory category)
    {
        switch (category)
        {
        case ErrorCategory::CONNECTION:
            return "connection";
        case ErrorCategory::DISCOVERY:
            return "discovery";
        case ErrorCategory::PRINT:
            return "print";
        case ErrorCategory::DATA:
            return "data";
        case ErrorCategory::OPERATION:
            return "operation";
        case ErrorCategory::STATUS:
            return "status";
        case ErrorCategory::PLATFORM:
            return "platform";
        default:
            return "system";
        }
    }
} // namespace llink
