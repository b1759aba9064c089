#include "utils/utils.h"
#include <algorithm>
#include <cctype>

namespace llink
{
    // ========== StringUtils Implementation ==========

    std::vector<std::string> StringUtils::split(const std::string &str, const std::string &delimiter)
    {
        std::vector<std::string> tokens;
        size_t start = 0;
        size_t end = str.find(delimiter);

        while (end != std::string::npos)
        {
            tokens.push_back(str.substr(start, end - start));
            start = end + delimiter.length();
            end = str.find(delimiter, start);
        }

        tokens.push_back(str.substr(start));
        return tokens;
    }

    std::string StringUtils::trim(const std::string &str)
    {
        size_t start = str.find_first_not_of(" \t\n\r\f\v");
        if (start == std::string::npos)
        {
            return "";
        }

        size_t end = str.find_last_not_of(" \t\n\r\f\v");
        return str.substr(start, end - start + 1);
    }

    std::string StringUtils::toLowerCase(const std::string &str)
    {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::string StringUtils::toUpperCase(const std::string &str)
    {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    bool StringUtils::startsWith(const std::string &str, const std::string &prefix)
    {
        return str.length() >= prefix.length() &&
               str.compare(0, prefix.length(), prefix) == 0;
    }

    bool StringUtils::containsIgnoreCase(const std::string &haystack, const std::string &needle)
    {
        return toLowerCase(haystack).find(toLowerCase(needle)) != std::string::npos;
    }

    std::string StringUtils::collapseWhitespace(const std::string &str)
    {
        std::string result;
        result.reserve(str.size());
        bool inSpace = false;
        for (unsigned char c : str)
        {
            if (std::isspace(c))
            {
                if (!inSpace)
                {
                    result.push_back(' ');
                }
                inSpace = true;
            }
            else
            {
                result.push_back(static_cast<char>(c));
                inSpace = false;
            }
        }
        return trim(result);
    }

    std::string StringUtils::stripQuotes(const std::string &str)
    {
        if (str.size() >= 2 && str.front() == '"' && str.back() == '"')
        {
            return str.substr(1, str.size() - 2);
        }
        return str;
    }

    // ========== TimeUtils Implementation ==========

    long long TimeUtils::getCurrentTimestamp()
    {
        return toEpochMillis(std::chrono::system_clock::now());
    }

    long long TimeUtils::toEpochMillis(const std::chrono::system_clock::time_point &tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    long long TimeUtils::elapsedMillis(const std::chrono::steady_clock::time_point &start)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    }

} // namespace llink
