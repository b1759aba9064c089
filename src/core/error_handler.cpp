#include "core/error_handler.h"
#include "utils/utils.h"
#include <cerrno>

namespace llink
{
    LLINK_ERROR_CODE ErrorHandler::mapConnectionErrorCode(const std::string &errorMessage)
    {
        const std::string lower = StringUtils::toLowerCase(errorMessage);
        if (lower.find("timeout") != std::string::npos ||
            lower.find("timed out") != std::string::npos)
        {
            return LLINK_ERROR_CODE::CONNECTION_TIMEOUT;
        }
        else if (lower.find("refused") != std::string::npos)
        {
            return LLINK_ERROR_CODE::CONNECTION_REFUSED;
        }
        else if (lower.find("permission") != std::string::npos ||
                 lower.find("denied") != std::string::npos)
        {
            return LLINK_ERROR_CODE::CONNECTION_PERMISSION;
        }
        else if (lower.find("not found") != std::string::npos ||
                 lower.find("invalid address") != std::string::npos ||
                 lower.find("resolve") != std::string::npos)
        {
            return LLINK_ERROR_CODE::INVALID_DEVICE_ADDRESS;
        }
        else if (lower.find("network") != std::string::npos ||
                 lower.find("unreachable") != std::string::npos)
        {
            return LLINK_ERROR_CODE::NETWORK_ERROR;
        }
        else if (lower.find("reset") != std::string::npos ||
                 lower.find("broken pipe") != std::string::npos ||
                 lower.find("closed") != std::string::npos)
        {
            return LLINK_ERROR_CODE::CONNECTION_LOST;
        }
        return LLINK_ERROR_CODE::CONNECTION_ERROR;
    }

    LLINK_ERROR_CODE ErrorHandler::mapErrno(int err)
    {
        switch (err)
        {
        case ETIMEDOUT:
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
            return LLINK_ERROR_CODE::CONNECTION_TIMEOUT;
        case ECONNREFUSED:
            return LLINK_ERROR_CODE::CONNECTION_REFUSED;
        case EACCES:
        case EPERM:
            return LLINK_ERROR_CODE::CONNECTION_PERMISSION;
        case ENETUNREACH:
        case EHOSTUNREACH:
        case ENETDOWN:
            return LLINK_ERROR_CODE::NETWORK_ERROR;
        case ECONNRESET:
        case EPIPE:
        case ENOTCONN:
            return LLINK_ERROR_CODE::CONNECTION_LOST;
        default:
            return LLINK_ERROR_CODE::CONNECTION_ERROR;
        }
    }

    ErrorInfo ErrorHandler::createConnectionFailure(
        LLINK_ERROR_CODE errorCode,
        const std::string &title,
        const std::string &details)
    {
        std::string message = title;
        if (!details.empty())
        {
            message += ": " + details;
        }
        return ErrorInfo::withMessage(errorCode, message);
    }

    ErrorInfo ErrorHandler::createTimeoutFailure(
        const std::string &operation,
        std::chrono::steady_clock::time_point startTime)
    {
        return ErrorInfo::withMessage(
            LLINK_ERROR_CODE::OPERATION_TIMEOUT,
            operation + " timed out after " + std::to_string(TimeUtils::elapsedMillis(startTime)) + " ms");
    }

} // namespace llink
