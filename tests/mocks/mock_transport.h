#pragma once

/**
 * Scriptable in-memory printer for tests
 *
 * Answers getvar queries from a key -> response table, applies setvar
 * commands to that table so verification loops see the change, and
 * records every call. Failures and latency can be injected per call kind.
 *
 * MockTransport printer;
 * printer.setSetting("device.pause", "true");
 * auto result = printer.query("device.pause"); // "\"true\""
 */

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "transport/transport.h"

namespace llink
{
    namespace test
    {
        class MockTransport : public ITransport
        {
        public:
            MockTransport()
            {
                m_settings["media.status"] = "\"ok\"";
                m_settings["head.latch"] = "\"ok\"";
                m_settings["device.pause"] = "\"false\"";
                m_settings["device.host_status"] = "\"0,0,0,0,0,0\"";
                m_settings["device.languages"] = "\"zpl\"";
            }

            MockTransport(const MockTransport &) = delete;
            MockTransport &operator=(const MockTransport &) = delete;

            // =================================================================
            // ITransport
            // =================================================================

            VoidResult connect(const std::string &address) override
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_connectCalls;
                m_lastAddress = address;
                if (m_connectFailures > 0)
                {
                    --m_connectFailures;
                    return VoidResult::Error(m_connectError);
                }
                m_connected = true;
                return VoidResult::Success();
            }

            VoidResult disconnect() override
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_disconnectCalls;
                m_connected = false;
                return VoidResult::Success();
            }

            Result<bool> isConnected() const override
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_isConnectedCalls;
                return Result<bool>::Ok(m_connected);
            }

            Result<std::string> query(const std::string &key) override
            {
                std::chrono::milliseconds latency{0};
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    ++m_queryCounts[key];
                    m_callLog.push_back("query:" + key);
                    latency = m_queryLatency;
                }

                if (latency.count() > 0)
                {
                    std::this_thread::sleep_for(latency);
                }

                std::lock_guard<std::mutex> lock(m_mutex);
                auto failure = m_queryFailures.find(key);
                if (failure != m_queryFailures.end())
                {
                    return Result<std::string>::Error(failure->second);
                }

                auto queued = m_queuedResponses.find(key);
                if (queued != m_queuedResponses.end() && !queued->second.empty())
                {
                    std::string response = queued->second.front();
                    queued->second.pop_front();
                    return Result<std::string>::Ok(response);
                }

                auto it = m_settings.find(key);
                if (it == m_settings.end())
                {
                    return Result<std::string>::Error(LLINK_ERROR_CODE::STATUS_TIMEOUT, 3);
                }
                return Result<std::string>::Ok(it->second);
            }

            VoidResult sendRaw(const std::string &bytes) override
            {
                std::chrono::milliseconds latency{0};
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_sent.push_back(bytes);
                    m_callLog.push_back("send:" + bytes);
                    latency = m_sendLatency;
                }

                if (latency.count() > 0)
                {
                    std::this_thread::sleep_for(latency);
                }

                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_sendFailures > 0)
                {
                    --m_sendFailures;
                    return VoidResult::Error(m_sendError);
                }
                if (m_applySetvar)
                {
                    applySetvar(bytes);
                }
                return VoidResult::Success();
            }

            // =================================================================
            // Test Control Methods
            // =================================================================

            /**
             * Store a setting value, quoted the way the printer answers
             */
            void setSetting(const std::string &key, const std::string &value)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_settings[key] = "\"" + value + "\"";
            }

            // Store an exact response text
            void setRawResponse(const std::string &key, const std::string &response)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_settings[key] = response;
            }

            void removeSetting(const std::string &key)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_settings.erase(key);
            }

            // Responses returned once each, before the table
            void queueResponses(const std::string &key, const std::vector<std::string> &responses)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto &queue = m_queuedResponses[key];
                queue.insert(queue.end(), responses.begin(), responses.end());
            }

            void failQuery(const std::string &key, ErrorInfo error)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queryFailures[key] = std::move(error);
            }

            void clearQueryFailure(const std::string &key)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queryFailures.erase(key);
            }

            void failNextConnects(int count, ErrorInfo error)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_connectFailures = count;
                m_connectError = std::move(error);
            }

            void failNextSends(int count, ErrorInfo error)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_sendFailures = count;
                m_sendError = std::move(error);
            }

            void setQueryLatency(std::chrono::milliseconds latency)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queryLatency = latency;
            }

            void setSendLatency(std::chrono::milliseconds latency)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_sendLatency = latency;
            }

            void setConnected(bool connected)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_connected = connected;
            }

            // When false, setvar commands are recorded but never change a setting
            void setApplySetvar(bool apply)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_applySetvar = apply;
            }

            void resetCounters()
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queryCounts.clear();
                m_sent.clear();
                m_callLog.clear();
                m_connectCalls = 0;
                m_disconnectCalls = 0;
                m_isConnectedCalls = 0;
            }

            // =================================================================
            // Inspection
            // =================================================================

            int queryCount(const std::string &key) const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_queryCounts.find(key);
                return it == m_queryCounts.end() ? 0 : it->second;
            }

            int totalQueries() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                int total = 0;
                for (const auto &entry : m_queryCounts)
                {
                    total += entry.second;
                }
                return total;
            }

            std::vector<std::string> sentCommands() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_sent;
            }

            bool wasSent(const std::string &bytes) const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (const auto &sent : m_sent)
                {
                    if (sent == bytes)
                    {
                        return true;
                    }
                }
                return false;
            }

            // "query:<key>" and "send:<bytes>" entries in call order
            std::vector<std::string> callLog() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_callLog;
            }

            // Queries and sends, connection checks excluded
            int transportCalls() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return static_cast<int>(m_callLog.size());
            }

            int connectCalls() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_connectCalls;
            }

            int disconnectCalls() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_disconnectCalls;
            }

            int isConnectedCalls() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_isConnectedCalls;
            }

            std::string lastAddress() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_lastAddress;
            }

        private:
            // ! U1 setvar "<key>" "<value>"\r\n
            void applySetvar(const std::string &bytes)
            {
                const std::string prefix = "! U1 setvar \"";
                if (bytes.compare(0, prefix.size(), prefix) != 0)
                {
                    return;
                }
                const size_t keyEnd = bytes.find('"', prefix.size());
                if (keyEnd == std::string::npos)
                {
                    return;
                }
                const size_t valueStart = bytes.find('"', keyEnd + 1);
                if (valueStart == std::string::npos)
                {
                    return;
                }
                const size_t valueEnd = bytes.find('"', valueStart + 1);
                if (valueEnd == std::string::npos)
                {
                    return;
                }
                const std::string key = bytes.substr(prefix.size(), keyEnd - prefix.size());
                const std::string value = bytes.substr(valueStart + 1, valueEnd - valueStart - 1);
                m_settings[key] = "\"" + value + "\"";
            }

            mutable std::mutex m_mutex;
            std::map<std::string, std::string> m_settings;
            std::map<std::string, std::deque<std::string>> m_queuedResponses;
            std::map<std::string, ErrorInfo> m_queryFailures;
            std::map<std::string, int> m_queryCounts;
            std::vector<std::string> m_sent;
            std::vector<std::string> m_callLog;

            bool m_connected = false;
            bool m_applySetvar = true;
            std::string m_lastAddress;
            int m_connectCalls = 0;
            int m_disconnectCalls = 0;
            mutable int m_isConnectedCalls = 0;

            int m_connectFailures = 0;
            ErrorInfo m_connectError;
            int m_sendFailures = 0;
            ErrorInfo m_sendError;

            std::chrono::milliseconds m_queryLatency{0};
            std::chrono::milliseconds m_sendLatency{0};
        };
    } // namespace test
} // namespace llink
