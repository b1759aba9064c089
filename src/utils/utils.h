#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace llink
{
    /**
     * String utility class
     */
    class StringUtils
    {
    public:
        /**
         * Split a string
         * @param str Input string
         * @param delimiter Delimiter
         * @return List of split strings, always at least one element
         */
        static std::vector<std::string> split(const std::string &str, const std::string &delimiter);

        /**
         * Trim whitespace characters from the beginning and end of a string
         */
        static std::string trim(const std::string &str);

        static std::string toLowerCase(const std::string &str);
        static std::string toUpperCase(const std::string &str);

        static bool startsWith(const std::string &str, const std::string &prefix);

        /**
         * Case-insensitive containment check
         * @param haystack Text to search
         * @param needle Lowercase token to look for
         */
        static bool containsIgnoreCase(const std::string &haystack, const std::string &needle);

        /**
         * Replace every run of whitespace with a single space
         */
        static std::string collapseWhitespace(const std::string &str);

        /**
         * Remove one pair of enclosing double quotes, if present
         */
        static std::string stripQuotes(const std::string &str);
    };

    /**
     * Time utility class
     */
    class TimeUtils
    {
    public:
        /**
         * Get the current timestamp (milliseconds)
         */
        static long long getCurrentTimestamp();

        static long long toEpochMillis(const std::chrono::system_clock::time_point &tp);

        static long long elapsedMillis(const std::chrono::steady_clock::time_point &start);
    };

} // namespace llink
