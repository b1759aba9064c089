#pragma once

#include <mutex>
#include <string>
#include "config.h"
#include "labellink_export.h"
#include "transport/transport.h"

namespace llink
{
    /**
     * Raw TCP transport to a network printer (port 9100 by default)
     *
     * Addresses are "host" or "host:port". Every call is bounded by the
     * configured connect or read timeout. Calls are serialized internally.
     */
    class LABELLINK_API TcpTransport : public ITransport
    {
    public:
        explicit TcpTransport(TransportConfig config = TransportConfig{});
        ~TcpTransport() override;

        TcpTransport(const TcpTransport &) = delete;
        TcpTransport &operator=(const TcpTransport &) = delete;

        VoidResult connect(const std::string &address) override;
        VoidResult disconnect() override;
        Result<bool> isConnected() const override;
        Result<std::string> query(const std::string &key) override;
        VoidResult sendRaw(const std::string &data) override;

        const TransportConfig &config() const { return m_config; }

        /**
         * Split "host[:port]"
         * @return false for an empty host or an invalid port
         */
        static bool parseAddress(const std::string &address, int defaultPort, std::string &host, int &port);

    private:
        VoidResult connectOnce(const std::string &host, int port);
        VoidResult writeAll(const std::string &data);
        Result<std::string> readResponse();
        void drainPending();
        void closeSocket();

        TransportConfig m_config;
        mutable std::mutex m_mutex;
        int m_socket = -1;
        std::string m_address;
    };
} // namespace llink
