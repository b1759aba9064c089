#pragma once

#include <map>
#include <mutex>
#include <string>
#include "labellink_export.h"

namespace llink
{
    /**
     * Per-address connection outcome counters, kept for the process lifetime
     * All members are safe to call concurrently.
     */
    class LABELLINK_API ConnectionHistory
    {
    public:
        ConnectionHistory() = default;
        ConnectionHistory(const ConnectionHistory &) = delete;
        ConnectionHistory &operator=(const ConnectionHistory &) = delete;

        /**
         * Increment the success counter of an address
         * @return the new count
         */
        int recordSuccessfulConnection(const std::string &address);

        // Failures are tracked for diagnostics only and do not affect scoring
        int recordFailedConnection(const std::string &address);

        int successCount(const std::string &address) const;
        int failureCount(const std::string &address) const;

        std::map<std::string, int> allSuccessCounts() const;

        void clear();

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, int> m_successCounts;
        std::map<std::string, int> m_failureCounts;
    };
} // namespace llink
