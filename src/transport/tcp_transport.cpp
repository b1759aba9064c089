#include "transport/tcp_transport.h"
#include "core/error_handler.h"
#include "policies/retry_policy.h"
#include "protocol/sgd_codec.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace llink
{
    namespace
    {
        constexpr int INVALID_SOCKET_FD = -1;
        // Quiet period that ends a response once its quotes are balanced
        constexpr long kResponseGraceMs = 50;

        timeval toTimeval(std::chrono::milliseconds ms)
        {
            timeval tv;
            tv.tv_sec = static_cast<long>(ms.count() / 1000);
            tv.tv_usec = static_cast<long>((ms.count() % 1000) * 1000);
            return tv;
        }

        // 1 ready, 0 timeout, -1 error
        int waitFor(int fd, short events, std::chrono::milliseconds timeout)
        {
            pollfd entry{};
            entry.fd = fd;
            entry.events = events;
            const int activity = ::poll(&entry, 1, static_cast<int>(std::max<long long>(0, timeout.count())));
            if (activity > 0)
            {
                return 1;
            }
            return activity == 0 ? 0 : -1;
        }

        int waitReadable(int fd, std::chrono::milliseconds timeout)
        {
            return waitFor(fd, POLLIN, timeout);
        }

        bool setNonBlocking(int fd, bool enabled)
        {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0)
            {
                return false;
            }
            flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            return fcntl(fd, F_SETFL, flags) == 0;
        }

        bool isCompleteResponse(const std::string &response)
        {
            const auto quotes = std::count(response.begin(), response.end(), '"');
            return quotes >= 2 && quotes % 2 == 0;
        }

        ErrorInfo socketFailure(const std::string &title, int err)
        {
            return ErrorHandler::createConnectionFailure(ErrorHandler::mapErrno(err), title, std::strerror(err));
        }
    } // namespace

    TcpTransport::TcpTransport(TransportConfig config)
        : m_config(config)
    {
    }

    TcpTransport::~TcpTransport()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        closeSocket();
    }

    bool TcpTransport::parseAddress(const std::string &address, int defaultPort, std::string &host, int &port)
    {
        const std::string trimmed = StringUtils::trim(address);
        const auto colon = trimmed.rfind(':');
        host = trimmed;
        port = defaultPort;

        if (colon != std::string::npos && trimmed.find(':') == colon)
        {
            host = trimmed.substr(0, colon);
            const std::string portText = trimmed.substr(colon + 1);
            if (portText.empty() || !std::all_of(portText.begin(), portText.end(),
                                                       [](unsigned char c)
                                                       { return std::isdigit(c) != 0; }) || portText.size() > 5)
            {
                return false;
            }
            port = std::stoi(portText);
        }
        return !host.empty() && port > 0 && port <= 65535;
    }

    void TcpTransport::closeSocket()
    {
        if (m_socket != INVALID_SOCKET_FD)
        {
            ::close(m_socket);
            m_socket = INVALID_SOCKET_FD;
            LABELLINK_LOG_DEBUG("TcpTransport: Socket closed");
        }
    }

    VoidResult TcpTransport::connectOnce(const std::string &host, int port)
    {
        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo *results = nullptr;
        const std::string service = std::to_string(port);
        int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
        if (rc != 0)
        {
            return VoidResult::Error(ErrorHandler::createConnectionFailure(
                LLINK_ERROR_CODE::INVALID_DEVICE_ADDRESS, "Cannot resolve " + host, gai_strerror(rc)));
        }
        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(results, &freeaddrinfo);

        ErrorInfo lastError = ErrorInfo::fromCode(LLINK_ERROR_CODE::CONNECTION_ERROR);
        for (addrinfo *ai = results; ai != nullptr; ai = ai->ai_next)
        {
            int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd == INVALID_SOCKET_FD)
            {
                lastError = socketFailure("Failed to create socket", errno);
                continue;
            }

            if (!setNonBlocking(fd, true))
            {
                lastError = socketFailure("Failed to configure socket", errno);
                ::close(fd);
                continue;
            }

            rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc != 0 && errno != EINPROGRESS)
            {
                lastError = socketFailure("Failed to connect to " + host, errno);
                ::close(fd);
                continue;
            }

            if (rc != 0)
            {
                int activity = waitFor(fd, POLLOUT, m_config.connectTimeout);
                if (activity == 0)
                {
                    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(m_config.connectTimeout).count();
                    lastError = ErrorInfo::fromCode(LLINK_ERROR_CODE::CONNECTION_TIMEOUT, seconds);
                    ::close(fd);
                    continue;
                }
                int soError = 0;
                socklen_t len = sizeof(soError);
                if (activity < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0)
                {
                    lastError = socketFailure("Failed to connect to " + host, soError != 0 ? soError : errno);
                    ::close(fd);
                    continue;
                }
            }

            setNonBlocking(fd, false);
            int optval = 1;
            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof(optval)) < 0)
            {
                LABELLINK_LOG_WARN("TcpTransport: Failed to set TCP_NODELAY: {}", std::strerror(errno));
            }
            timeval sendTimeout = toTimeval(m_config.readTimeout);
            if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &sendTimeout, sizeof(sendTimeout)) < 0)
            {
                LABELLINK_LOG_WARN("TcpTransport: Failed to set send timeout: {}", std::strerror(errno));
            }

            m_socket = fd;
            return VoidResult::Success();
        }
        return VoidResult::Error(lastError);
    }

    VoidResult TcpTransport::connect(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string host;
        int port = 0;
        if (!parseAddress(address, m_config.defaultPort, host, port))
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_DEVICE_ADDRESS, address);
        }

        closeSocket();
        LABELLINK_LOG_INFO("TcpTransport: Connecting to {}:{}", host, port);

        auto policy = RetryPolicy::ofWithDelay(m_config.connectAttempts, m_config.connectRetryDelay);
        auto outcome = policy.execute<std::monostate>(
            [this, &host, port]()
            { return connectOnce(host, port); },
            "TCP connect");

        if (outcome.isSuccess())
        {
            m_address = address;
            LABELLINK_LOG_INFO("TcpTransport: Connected to {} after {} attempt(s)", address, outcome.attempts);
            return VoidResult::Success();
        }
        LABELLINK_LOG_WARN("TcpTransport: Connection to {} failed: {}", address, outcome.result.error().message);
        return outcome.result;
    }

    VoidResult TcpTransport::disconnect()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_socket != INVALID_SOCKET_FD)
        {
            LABELLINK_LOG_INFO("TcpTransport: Disconnecting from {}", m_address);
        }
        closeSocket();
        m_address.clear();
        return VoidResult::Success();
    }

    Result<bool> TcpTransport::isConnected() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_socket == INVALID_SOCKET_FD)
        {
            return Result<bool>::Ok(false);
        }

        // A readable socket with nothing to peek has been closed by the peer
        if (waitReadable(m_socket, std::chrono::milliseconds(0)) > 0)
        {
            char byte;
            ssize_t peeked = recv(m_socket, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
            if (peeked == 0)
            {
                return Result<bool>::Ok(false);
            }
        }
        return Result<bool>::Ok(true);
    }

    VoidResult TcpTransport::writeAll(const std::string &data)
    {
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(m_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                const int err = errno;
                closeSocket();
                return VoidResult::Error(socketFailure("Failed to send data", err));
            }
            sent += static_cast<size_t>(n);
        }
        LABELLINK_LOG_TRACE("TcpTransport: Sent {} bytes", sent);
        return VoidResult::Success();
    }

    void TcpTransport::drainPending()
    {
        char buffer[1024];
        while (waitReadable(m_socket, std::chrono::milliseconds(0)) > 0)
        {
            ssize_t n = recv(m_socket, buffer, sizeof(buffer), MSG_DONTWAIT);
            if (n <= 0)
            {
                break;
            }
            LABELLINK_LOG_TRACE("TcpTransport: Discarded {} stale bytes", n);
        }
    }

    Result<std::string> TcpTransport::readResponse()
    {
        std::string response;
        char buffer[1024];
        const auto deadline = std::chrono::steady_clock::now() + m_config.readTimeout;

        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (isCompleteResponse(response))
            {
                remaining = std::min(remaining, std::chrono::milliseconds(kResponseGraceMs));
            }
            if (remaining.count() <= 0)
            {
                break;
            }

            int ready = waitReadable(m_socket, remaining);
            if (ready == 0)
            {
                break;
            }
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return Result<std::string>::Error(socketFailure("Failed to wait for response", errno));
            }

            ssize_t n = recv(m_socket, buffer, sizeof(buffer), 0);
            if (n == 0)
            {
                closeSocket();
                return Result<std::string>::Error(LLINK_ERROR_CODE::CONNECTION_LOST);
            }
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                const int err = errno;
                closeSocket();
                return Result<std::string>::Error(socketFailure("Failed to read response", err));
            }
            response.append(buffer, static_cast<size_t>(n));
        }

        if (response.empty())
        {
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(m_config.readTimeout).count();
            return Result<std::string>::Error(LLINK_ERROR_CODE::STATUS_TIMEOUT, seconds);
        }
        return Result<std::string>::Ok(response);
    }

    Result<std::string> TcpTransport::query(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_socket == INVALID_SOCKET_FD)
        {
            return Result<std::string>::Error(LLINK_ERROR_CODE::NOT_CONNECTED);
        }

        drainPending();
        auto sent = writeAll(SgdCodec::get(key));
        if (sent.isError())
        {
            return Result<std::string>::Error(sent.error());
        }

        auto response = readResponse();
        if (response.isSuccess())
        {
            LABELLINK_LOG_TRACE("TcpTransport: {} -> {}", key, response.value());
        }
        return response;
    }

    VoidResult TcpTransport::sendRaw(const std::string &data)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_socket == INVALID_SOCKET_FD)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::NOT_CONNECTED);
        }
        return writeAll(data);
    }
} // namespace llink
