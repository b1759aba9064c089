#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include "labellink_export.h"

namespace llink
{
    /**
     * Physical transport a device is reachable through
     */
    enum class TransportType
    {
        BLUETOOTH = 0,
        NETWORK = 1,
    };

    /**
     * Payload language understood by the printer
     * UNKNOWN means the payload could not be classified
     */
    enum class PrintLanguage
    {
        UNKNOWN = -1,
        ZPL = 0,
        CPCL = 1,
    };

    /**
     * Availability reported by discovery
     */
    enum class DeviceAvailability
    {
        UNKNOWN = 0,
        DISCOVERED,
        READY,
        CONNECTED,
    };

    inline std::string transportTypeToString(TransportType type)
    {
        switch (type)
        {
        case TransportType::BLUETOOTH:
            return "bluetooth";
        case TransportType::NETWORK:
            return "network";
        default:
            return "unknown";
        }
    }

    inline std::string printLanguageToString(PrintLanguage language)
    {
        switch (language)
        {
        case PrintLanguage::ZPL:
            return "zpl";
        case PrintLanguage::CPCL:
            return "cpcl";
        default:
            return "unknown";
        }
    }

    inline std::string availabilityToString(DeviceAvailability availability)
    {
        switch (availability)
        {
        case DeviceAvailability::DISCOVERED:
            return "discovered";
        case DeviceAvailability::READY:
            return "ready";
        case DeviceAvailability::CONNECTED:
            return "connected";
        default:
            return "unknown";
        }
    }

    // Discovered device
    struct DeviceInfo
    {
        std::string address = "";                                       // MAC address or host[:port]
        std::string name = "";                                          // Friendly name
        std::string model = "";                                         // Model string, e.g. "ZQ520"
        TransportType transport = TransportType::NETWORK;                // Reachable through
        DeviceAvailability availability = DeviceAvailability::DISCOVERED; // Last reported state

        bool operator==(const DeviceInfo &other) const
        {
            return address == other.address;
        }
        bool operator!=(const DeviceInfo &other) const
        {
            return !(*this == other);
        }
    };

    /**
     * Aggregated host status decoded from device.host_status
     */
    struct HostStatusInfo
    {
        bool isOk = false;
        std::optional<int> errorCode;               // Primary code, only for field-encoded responses
        std::optional<std::string> errorMessage;    // Human readable cause, empty when healthy
        std::map<std::string, std::string> details; // rawStatus, statusType, fieldCount, field1..fieldN

        /**
         * Positional flag, absent fields read as false
         * @param index 1-based field index
         */
        LABELLINK_API bool flagAt(size_t index) const;

        bool isPaperOut() const { return flagAt(1); }
        bool isRibbonOut() const { return flagAt(2); }
        bool isHeadOpen() const { return flagAt(3); }
        bool isHeadCold() const { return flagAt(4); }
        bool isHeadTooHot() const { return flagAt(5); }

        /**
         * Descriptions of every raised positional flag
         */
        LABELLINK_API std::vector<std::string> blockingIssues() const;
    };

} // namespace llink
