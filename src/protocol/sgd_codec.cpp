#include "protocol/sgd_codec.h"
#include "utils/utils.h"
#include <regex>

namespace llink
{
    namespace
    {
        const char *const kPrefix = "! U1 ";
        const char *const kTerminator = "\r\n";

        std::string quoted(const std::string &value)
        {
            return "\"" + value + "\"";
        }
    } // namespace

    std::string SgdCodec::get(const std::string &key)
    {
        return std::string(kPrefix) + "getvar " + quoted(key) + kTerminator;
    }

    std::string SgdCodec::set(const std::string &key, const std::string &value)
    {
        return std::string(kPrefix) + "setvar " + quoted(key) + " " + quoted(value) + kTerminator;
    }

    std::string SgdCodec::doAction(const std::string &action, const std::string &value)
    {
        return std::string(kPrefix) + "do " + quoted(action) + " " + quoted(value) + kTerminator;
    }

    std::optional<std::string> SgdCodec::parseResponse(const std::string &response)
    {
        static const std::regex keyValue(R"re("[^"]*"\s*:\s*"([^"]*)")re");

        try
        {
            std::smatch match;
            if (std::regex_search(response, match, keyValue) && match.size() > 1)
            {
                return match[1].str();
            }
        }
        catch (const std::regex_error &)
        {
            // Fall through to the literal form
        }

        const std::string trimmed = StringUtils::trim(response);
        if (trimmed.size() >= 2 && trimmed.front() == '"' && trimmed.back() == '"')
        {
            return trimmed.substr(1, trimmed.size() - 2);
        }

        if (trimmed.empty())
        {
            return std::nullopt;
        }
        return trimmed;
    }

    PrintLanguage SgdCodec::detectLanguage(const std::string &data)
    {
        const std::string trimmed = StringUtils::trim(data);
        if (trimmed.empty())
        {
            return PrintLanguage::UNKNOWN;
        }
        if (trimmed.find("^XA") != std::string::npos)
        {
            return PrintLanguage::ZPL;
        }
        // Covers "! 0" job headers and "! U1" utility commands
        if (trimmed.front() == '!')
        {
            return PrintLanguage::CPCL;
        }
        return PrintLanguage::UNKNOWN;
    }

    bool SgdCodec::isLanguageMatch(const std::string &currentLanguage, PrintLanguage expected)
    {
        const std::string current = StringUtils::toLowerCase(currentLanguage);
        switch (expected)
        {
        case PrintLanguage::ZPL:
            return current.find("zpl") != std::string::npos;
        case PrintLanguage::CPCL:
            return current.find("line_print") != std::string::npos ||
                   current.find("cpcl") != std::string::npos;
        default:
            return false;
        }
    }

    std::string SgdCodec::languageSettingValue(PrintLanguage language)
    {
        return language == PrintLanguage::CPCL ? "line_print" : "zpl";
    }

    std::string SgdCodec::unpauseCommand()
    {
        return set(sgd_keys::DEVICE_PAUSE, "false");
    }

    std::string SgdCodec::setLanguageCommand(PrintLanguage language)
    {
        return set(sgd_keys::LANGUAGES, languageSettingValue(language));
    }

    std::string SgdCodec::clearErrorsCommand()
    {
        return "~JA";
    }

    std::string SgdCodec::clearBufferCommand()
    {
        return std::string(1, '\x18');
    }

    std::string SgdCodec::flushBufferCommand()
    {
        return std::string(1, '\x03');
    }

    std::string SgdCodec::calibrateCommand()
    {
        return "~jc^xa^jus^xz";
    }
} // namespace llink
