#pragma once

#include <optional>
#include <string>
#include "types/printer.h"

namespace llink
{
    /**
     * Well-known setting keys
     */
    namespace sgd_keys
    {
        constexpr const char *MEDIA_STATUS = "media.status";
        constexpr const char *HEAD_LATCH = "head.latch";
        constexpr const char *DEVICE_PAUSE = "device.pause";
        constexpr const char *HOST_STATUS = "device.host_status";
        constexpr const char *LANGUAGES = "device.languages";
    } // namespace sgd_keys

    /**
     * Codec for the textual getvar/setvar/do control protocol
     * All functions are total: malformed input yields an empty value, never an exception
     */
    class SgdCodec
    {
    public:
        /**
         * Encode a read request: ! U1 getvar "<key>"\r\n
         */
        static std::string get(const std::string &key);

        /**
         * Encode a write request: ! U1 setvar "<key>" "<value>"\r\n
         */
        static std::string set(const std::string &key, const std::string &value);

        /**
         * Encode an action request: ! U1 do "<action>" "<value>"\r\n
         */
        static std::string doAction(const std::string &action, const std::string &value);

        /**
         * Decode a response
         * "key" : "value" yields value; a bare quoted value is unquoted;
         * anything else is trimmed. Empty input yields nullopt.
         */
        static std::optional<std::string> parseResponse(const std::string &response);

        /**
         * Classify a print payload by its language markers
         * ZPL (^XA anywhere) wins over CPCL (leading '!')
         */
        static PrintLanguage detectLanguage(const std::string &data);

        /**
         * Whether the language reported by the printer satisfies the expected one
         */
        static bool isLanguageMatch(const std::string &currentLanguage, PrintLanguage expected);

        // Value written to device.languages to select a language
        static std::string languageSettingValue(PrintLanguage language);

        // Fixed control commands
        static std::string unpauseCommand();
        static std::string setLanguageCommand(PrintLanguage language);
        static std::string clearErrorsCommand();
        static std::string clearBufferCommand();
        static std::string flushBufferCommand();
        static std::string calibrateCommand();
    };
} // namespace llink
