#pragma once

#include <optional>
#include <string>
#include "types/printer.h"

namespace llink
{
    /**
     * Decoder for printer health responses
     * Handles free-text statuses and comma separated host status fields.
     * None of the functions throw.
     */
    class StatusParser
    {
    public:
        /**
         * Coerce a setting value to a boolean
         * true/on/1/yes/y/enabled/active and their false counterparts,
         * case and whitespace insensitive
         * @return nullopt when the value is not in the vocabulary
         */
        static std::optional<bool> toBool(const std::string &value);

        static std::optional<int> toInt(const std::string &value);
        static std::optional<double> toDouble(const std::string &value);

        /**
         * First signed integer or decimal found in the text, e.g. "203 dpi" -> 203
         */
        static std::optional<double> extractNumber(const std::string &value);

        /**
         * Strip enclosing quotes and collapse whitespace
         */
        static std::string normalizeStatus(const std::string &status);

        static bool isStatusOk(const std::string &status);
        static bool isStatusBusy(const std::string &status);
        static bool hasMedia(const std::string &status);
        static bool isHeadClosed(const std::string &status);

        /**
         * Map a free-text status to a canonical fault message
         * @return nullopt when no fault keyword is present
         */
        static std::optional<std::string> parseTextError(const std::string &status);

        /**
         * Decode device.host_status in either shape
         */
        static HostStatusInfo parseHostStatus(const std::string &status);

        /**
         * Canonical message for a non-zero primary host code
         * Unknown codes yield "Unknown error code: {n}"
         */
        static std::string hostErrorMessage(int code);

        /**
         * Add or override a primary code message for printer models
         * whose firmware reports codes outside the built-in table
         */
        static void registerHostErrorMessage(int code, const std::string &message);

    private:
        static HostStatusInfo parseTextHostStatus(const std::string &status);
        static HostStatusInfo parseFieldHostStatus(const std::string &status);
    };
} // namespace llink
