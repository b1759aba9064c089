#pragma once

#include <string>
#include "types/result.h"

namespace llink
{
    /**
     * Byte transport to a single printer
     *
     * Implementations must never throw. Native failures are classified into
     * an ErrorInfo exactly once, here, and forwarded unchanged by callers.
     * Every call is bounded by the implementation's own per-call timeout.
     */
    class ITransport
    {
    public:
        virtual ~ITransport() = default;

        /**
         * Open a connection
         * @param address Device address (MAC, host or host:port)
         */
        virtual VoidResult connect(const std::string &address) = 0;

        virtual VoidResult disconnect() = 0;

        virtual Result<bool> isConnected() const = 0;

        /**
         * Read a setting
         * @param key Setting name, e.g. "media.status"
         * @return Raw response text as received
         */
        virtual Result<std::string> query(const std::string &key) = 0;

        /**
         * Write bytes without waiting for a reply
         */
        virtual VoidResult sendRaw(const std::string &bytes) = 0;
    };
} // namespace llink
