#include "protocol/status_parser.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <mutex>
#include <regex>
#include <unordered_map>

namespace llink
{
    namespace
    {
        const char *const kStateMessages[] = {
            "Printer is paused",
            "Printer is processing",
            "Printer is receiving data",
            "Printer is warming up",
            "Printer is cooling down",
            "Printer is calibrating",
            "Printer is initializing",
            "Printer is shutting down",
            "Printer is rebooting",
            "Printer is updating firmware",
            "Printer is performing maintenance",
            "Printer is performing diagnostics",
            "Printer is performing self-test",
            "Printer is performing calibration",
            "Printer is performing alignment",
            "Printer is performing cleaning",
            "Printer is performing head cleaning",
            "Printer is performing ribbon cleaning",
            "Printer is performing media cleaning",
            "Printer is performing sensor cleaning",
            "Printer is performing head adjustment",
            "Printer is performing media adjustment",
            "Printer is performing ribbon adjustment",
            "Printer is performing sensor adjustment",
            "Printer is performing print head adjustment",
            "Printer is performing platen adjustment",
            "Printer is performing media sensor adjustment",
            "Printer is performing ribbon sensor adjustment",
            "Printer is performing print head sensor adjustment",
            "Printer is performing platen sensor adjustment",
        }; // 1..30

        const char *const kHeadMessages[] = {
            "Out of paper/media",
            "Out of ribbon",
            "Print head is open",
            "Print head is cold",
            "Print head is too hot",
            "Print head is dirty",
            "Print head is damaged",
            "Print head is misaligned",
            "Print head is not installed",
            "Print head is incompatible",
            "Print head is worn out",
            "Print head is defective",
            "Print head is not responding",
            "Print head is not detected",
            "Print head is not calibrated",
            "Print head is not aligned",
            "Print head is not cleaned",
            "Print head is not adjusted",
            "Print head is not ready",
            "Print head is not available",
            "Print head is not supported",
            "Print head is not authorized",
            "Print head is not licensed",
            "Print head is not registered",
            "Print head is not validated",
            "Print head is not verified",
            "Print head is not authenticated",
            "Print head is not certified",
            "Print head is not approved",
            "Print head is not compliant",
            "Print head is not compatible",
        }; // 100..130

        const char *const kSensorMessages[] = {
            "Media sensor error",
            "Ribbon sensor error",
            "Print head sensor error",
            "Platen sensor error",
            "Temperature sensor error",
            "Pressure sensor error",
            "Position sensor error",
            "Speed sensor error",
            "Tension sensor error",
            "Hardware error detected",
            "Firmware error",
            "Software error",
            "Configuration error",
            "Communication error",
            "Network error",
            "Protocol error",
            "Format error",
            "Data error",
            "Memory error",
            "Buffer error",
            "Queue error",
            "Job error",
            "Print job error",
            "Format job error",
            "Download job error",
            "Upload job error",
            "Delete job error",
            "List job error",
            "Cancel job error",
            "Pause job error",
            "Resume job error",
        }; // 150..180

        const char *const kMismatchSubjects[] = {
            "Media type", "Ribbon type", "Print head type", "Platen type", "Sensor type",
            "Firmware version", "Software version", "Hardware version", "Configuration",
            "Protocol version", "Format version", "Data format", "Encoding", "Character set",
            "Language", "Country", "Time zone", "Date format", "Time format", "Number format",
            "Currency format", "Measurement unit", "Temperature unit", "Pressure unit",
            "Speed unit", "Distance unit", "Weight unit", "Volume unit", "Area unit",
            "Angle unit", "Frequency unit", "Power unit", "Energy unit", "Force unit",
            "Torque unit", "Momentum unit", "Impulse unit", "Work unit", "Heat unit",
            "Entropy unit", "Information unit", "Data rate unit", "Bandwidth unit",
            "Latency unit", "Jitter unit", "Packet loss unit", "Error rate unit",
            "Signal strength unit", "Signal quality unit", "Signal to noise ratio unit",
            "Carrier to noise ratio unit", "Bit error rate unit", "Frame error rate unit",
            "Symbol error rate unit", "Block error rate unit", "Word error rate unit",
        }; // 200..255

        template <size_t N>
        constexpr size_t countOf(const char *const (&)[N])
        {
            return N;
        }

        std::mutex &registryMutex()
        {
            static std::mutex mutex;
            return mutex;
        }

        std::unordered_map<int, std::string> &registry()
        {
            static std::unordered_map<int, std::string> extra;
            return extra;
        }

        bool containsAny(const std::string &lower, std::initializer_list<const char *> tokens)
        {
            for (const char *token : tokens)
            {
                if (lower.find(token) != std::string::npos)
                {
                    return true;
                }
            }
            return false;
        }
    } // namespace

    std::optional<bool> StatusParser::toBool(const std::string &value)
    {
        const std::string v = StringUtils::toLowerCase(StringUtils::trim(value));
        if (v == "true" || v == "on" || v == "1" || v == "yes" || v == "y" ||
            v == "enabled" || v == "active")
        {
            return true;
        }
        if (v == "false" || v == "off" || v == "0" || v == "no" || v == "n" ||
            v == "disabled" || v == "inactive")
        {
            return false;
        }
        return std::nullopt;
    }

    std::optional<int> StatusParser::toInt(const std::string &value)
    {
        const std::string trimmed = StringUtils::trim(value);
        if (trimmed.empty())
        {
            return std::nullopt;
        }

        char *end = nullptr;
        errno = 0;
        long parsed = std::strtol(trimmed.c_str(), &end, 10);
        if (end && *end == '\0')
        {
            if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX)
            {
                return std::nullopt;
            }
            return static_cast<int>(parsed);
        }

        auto number = extractNumber(trimmed);
        if (number && std::isfinite(*number) && *number >= static_cast<double>(INT_MIN) &&
            *number <= static_cast<double>(INT_MAX))
        {
            return static_cast<int>(*number);
        }
        return std::nullopt;
    }

    std::optional<double> StatusParser::toDouble(const std::string &value)
    {
        const std::string trimmed = StringUtils::trim(value);
        if (trimmed.empty())
        {
            return std::nullopt;
        }

        char *end = nullptr;
        double parsed = std::strtod(trimmed.c_str(), &end);
        if (end && *end == '\0')
        {
            return parsed;
        }
        return extractNumber(trimmed);
    }

    std::optional<double> StatusParser::extractNumber(const std::string &value)
    {
        static const std::regex number(R"((-?\d+\.?\d*))");
        if (value.empty())
        {
            return std::nullopt;
        }

        std::smatch match;
        if (!std::regex_search(value, match, number))
        {
            return std::nullopt;
        }

        char *end = nullptr;
        const std::string text = match[1].str();
        double parsed = std::strtod(text.c_str(), &end);
        if (end == text.c_str())
        {
            return std::nullopt;
        }
        return parsed;
    }

    std::string StatusParser::normalizeStatus(const std::string &status)
    {
        return StringUtils::collapseWhitespace(StringUtils::stripQuotes(StringUtils::trim(status)));
    }

    bool StatusParser::isStatusOk(const std::string &status)
    {
        const std::string lower = StringUtils::toLowerCase(status);
        return containsAny(lower, {"ok", "ready", "normal", "idle"});
    }

    bool StatusParser::isStatusBusy(const std::string &status)
    {
        const std::string lower = StringUtils::toLowerCase(status);
        return containsAny(lower, {"busy", "printing", "processing", "receiving",
                                   "buffering", "warming", "initializing"});
    }

    bool StatusParser::hasMedia(const std::string &status)
    {
        const std::string lower = StringUtils::toLowerCase(status);
        if (containsAny(lower, {"ok", "ready", "loaded", "present"}))
        {
            return true;
        }
        // "out", "empty", "missing", "absent" and anything unrecognised
        return false;
    }

    bool StatusParser::isHeadClosed(const std::string &status)
    {
        const std::string lower = StringUtils::toLowerCase(status);
        if (containsAny(lower, {"open", "unlocked"}))
        {
            return false;
        }
        return containsAny(lower, {"closed", "ok", "locked"});
    }

    std::optional<std::string> StatusParser::parseTextError(const std::string &status)
    {
        if (status.empty())
        {
            return std::nullopt;
        }

        const std::string lower = StringUtils::toLowerCase(status);
        if (lower.find("paper out") != std::string::npos)
            return std::string("Out of paper");
        if (lower.find("ribbon out") != std::string::npos)
            return std::string("Out of ribbon");
        if (lower.find("head open") != std::string::npos)
            return std::string("Print head open");
        if (lower.find("head cold") != std::string::npos)
            return std::string("Print head cold");
        if (lower.find("head over temp") != std::string::npos)
            return std::string("Print head overheated");
        if (lower.find("pause") != std::string::npos)
            return std::string("Printer paused");
        if (lower.find("error") != std::string::npos)
            return status;
        return std::nullopt;
    }

    HostStatusInfo StatusParser::parseHostStatus(const std::string &status)
    {
        const std::string cleaned = normalizeStatus(status);
        if (cleaned.empty())
        {
            HostStatusInfo info;
            info.isOk = false;
            info.errorMessage = "No status response";
            return info;
        }

        if (cleaned.find(',') == std::string::npos)
        {
            return parseTextHostStatus(cleaned);
        }
        return parseFieldHostStatus(cleaned);
    }

    HostStatusInfo StatusParser::parseTextHostStatus(const std::string &status)
    {
        HostStatusInfo info;
        info.isOk = isStatusOk(status);
        if (!info.isOk)
        {
            auto text = parseTextError(status);
            info.errorMessage = text ? *text : "Printer error: " + status;
        }
        info.details["rawStatus"] = status;
        info.details["statusType"] = "text";
        return info;
    }

    HostStatusInfo StatusParser::parseFieldHostStatus(const std::string &status)
    {
        HostStatusInfo info;
        const auto parts = StringUtils::split(status, ",");

        bool allEmpty = true;
        for (const auto &part : parts)
        {
            if (!StringUtils::trim(part).empty())
            {
                allEmpty = false;
                break;
            }
        }

        info.details["rawStatus"] = status;
        if (allEmpty)
        {
            info.isOk = false;
            info.errorMessage = "Invalid status format";
            return info;
        }

        info.details["statusType"] = "comma_separated";
        info.details["fieldCount"] = std::to_string(parts.size());
        for (size_t i = 1; i < parts.size(); ++i)
        {
            info.details["field" + std::to_string(i)] = StringUtils::trim(parts[i]);
        }

        info.errorCode = toInt(parts[0]);
        info.isOk = info.errorCode.has_value() && *info.errorCode == 0;
        if (!info.isOk)
        {
            info.errorMessage = info.errorCode
                                    ? hostErrorMessage(*info.errorCode)
                                    : "Invalid status format";
        }
        LABELLINK_LOG_TRACE("Host status parsed: code={}, fields={}",
                            info.errorCode ? *info.errorCode : -1, parts.size());
        return info;
    }

    std::string StatusParser::hostErrorMessage(int code)
    {
        {
            std::lock_guard<std::mutex> lock(registryMutex());
            auto it = registry().find(code);
            if (it != registry().end())
            {
                return it->second;
            }
        }

        if (code >= 1 && code <= 30)
        {
            return kStateMessages[code - 1];
        }
        if (code >= 100 && code < 100 + static_cast<int>(countOf(kHeadMessages)))
        {
            return kHeadMessages[code - 100];
        }
        if (code >= 150 && code < 150 + static_cast<int>(countOf(kSensorMessages)))
        {
            return kSensorMessages[code - 150];
        }
        if (code >= 200 && code < 200 + static_cast<int>(countOf(kMismatchSubjects)))
        {
            return std::string(kMismatchSubjects[code - 200]) + " mismatch";
        }
        return "Unknown error code: " + std::to_string(code);
    }

    void StatusParser::registerHostErrorMessage(int code, const std::string &message)
    {
        std::lock_guard<std::mutex> lock(registryMutex());
        registry()[code] = message;
    }

    // ========== HostStatusInfo ==========

    bool HostStatusInfo::flagAt(size_t index) const
    {
        auto it = details.find("field" + std::to_string(index));
        if (it == details.end())
        {
            return false;
        }
        auto value = StatusParser::toInt(it->second);
        return value.has_value() && *value == 1;
    }

    std::vector<std::string> HostStatusInfo::blockingIssues() const
    {
        std::vector<std::string> issues;
        if (isPaperOut())
            issues.emplace_back("Out of paper");
        if (isRibbonOut())
            issues.emplace_back("Out of ribbon");
        if (isHeadOpen())
            issues.emplace_back("Print head open");
        if (isHeadCold())
            issues.emplace_back("Print head cold");
        if (isHeadTooHot())
            issues.emplace_back("Print head overheated");
        return issues;
    }
} // namespace llink
