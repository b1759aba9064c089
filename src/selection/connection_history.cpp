#include "selection/connection_history.h"
#include "utils/logger.h"

namespace llink
{
    int ConnectionHistory::recordSuccessfulConnection(const std::string &address)
    {
        int count = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            count = ++m_successCounts[address];
        }
        LABELLINK_LOG_INFO("ConnectionHistory: Recorded successful connection for {} (total {})", address, count);
        return count;
    }

    int ConnectionHistory::recordFailedConnection(const std::string &address)
    {
        int count = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            count = ++m_failureCounts[address];
        }
        LABELLINK_LOG_INFO("ConnectionHistory: Recorded failed connection for {} (total {})", address, count);
        return count;
    }

    int ConnectionHistory::successCount(const std::string &address) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_successCounts.find(address);
        return it != m_successCounts.end() ? it->second : 0;
    }

    int ConnectionHistory::failureCount(const std::string &address) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_failureCounts.find(address);
        return it != m_failureCounts.end() ? it->second : 0;
    }

    std::map<std::string, int> ConnectionHistory::allSuccessCounts() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_successCounts;
    }

    void ConnectionHistory::clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_successCounts.clear();
        m_failureCounts.clear();
    }
} // namespace llink
