#pragma once

#include <string>
#include <chrono>
#include "types/result.h"

namespace llink
{
    /**
     * @brief Error Handling Utility Class
     *
     * Maps native transport failures onto LLINK_ERROR_CODE values
     */
    class ErrorHandler
    {
    public:
        /**
         * @brief Map a connection error code based on the native error message
         * @param errorMessage Error message reported by the OS or driver
         * @return Corresponding error code
         */
        static LLINK_ERROR_CODE mapConnectionErrorCode(const std::string &errorMessage);

        /**
         * @brief Map a POSIX errno value from a socket call
         */
        static LLINK_ERROR_CODE mapErrno(int err);

        /**
         * @brief Create connection failure error
         * @param errorCode Error code
         * @param title Error title
         * @param details Error details
         */
        static ErrorInfo createConnectionFailure(
            LLINK_ERROR_CODE errorCode,
            const std::string &title,
            const std::string &details);

        /**
         * @brief Create timeout error for a single transport call
         * @param operation Operation name
         * @param startTime Start time of the call
         */
        static ErrorInfo createTimeoutFailure(
            const std::string &operation,
            std::chrono::steady_clock::time_point startTime);
    };

} // namespace llink
