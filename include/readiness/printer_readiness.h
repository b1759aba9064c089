#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "labellink_export.h"
#include "transport/transport.h"
#include "types/printer.h"
#include "types/readiness.h"
#include "types/result.h"

namespace llink
{
    /**
     * Lazy, caching view of a printer's readiness
     *
     * Each dimension is queried on first access and cached until reset.
     * Concurrent first accesses to one dimension share a single in-flight
     * query. isReady() only reads cached state and never queries.
     * Dimensions not enabled in the options stay Unchecked.
     */
    class LABELLINK_API PrinterReadiness
    {
    public:
        explicit PrinterReadiness(std::shared_ptr<ITransport> transport,
                                  ReadinessOptions options = ReadinessOptions::all());

        PrinterReadiness(const PrinterReadiness &) = delete;
        PrinterReadiness &operator=(const PrinterReadiness &) = delete;

        /**
         * Read a dimension if needed and return its verdict
         * Issues at most one transport query per dimension between resets.
         */
        DimensionState ensure(ReadinessDimension dimension);

        DimensionState connection() { return ensure(ReadinessDimension::CONNECTION); }
        DimensionState media() { return ensure(ReadinessDimension::MEDIA); }
        DimensionState head() { return ensure(ReadinessDimension::HEAD); }
        DimensionState pause() { return ensure(ReadinessDimension::PAUSE); }
        DimensionState host() { return ensure(ReadinessDimension::HOST); }
        DimensionState language() { return ensure(ReadinessDimension::LANGUAGE); }

        /**
         * Eagerly populate every configured dimension
         */
        void readAllStatuses();

        /**
         * Query device.languages bypassing the cache
         * The fresh value replaces the cached language reading.
         * @return nullopt when the printer did not answer
         */
        std::optional<std::string> readLanguageFresh();

        /**
         * Stop issuing transport queries from this snapshot
         * Reads already in flight complete; later reads return the cached state.
         */
        void abandon();
        bool isAbandoned() const { return m_abandoned; }

        // ---- Pure reads of cached state, never query ----

        /**
         * Logical AND of the good conditions of every checked dimension
         */
        bool isReady() const;

        DimensionState cachedState(ReadinessDimension dimension) const;
        std::optional<std::string> cachedRaw(ReadinessDimension dimension) const;
        std::optional<ErrorInfo> cachedError(ReadinessDimension dimension) const;
        bool wasRead(ReadinessDimension dimension) const;

        std::optional<bool> cachedIsConnected() const;
        std::optional<bool> cachedHasMedia() const;
        std::optional<bool> cachedIsHeadClosed() const;
        std::optional<bool> cachedIsPaused() const;
        std::optional<HostStatusInfo> cachedHostStatus() const;

        // Host status errors, empty when healthy or unread
        std::vector<std::string> errors() const;
        // Unrecognised values and read failures
        std::vector<std::string> warnings() const;

        /**
         * Details of every checked dimension currently Bad
         */
        std::vector<std::string> blockingIssues() const;

        // dimension name -> whether it has been read
        std::map<std::string, bool> readStatus() const;

        std::chrono::system_clock::time_point checkedAt() const;

        std::string toString() const;

        /**
         * JSON dump of every dimension: state, raw reply, read flag and any read error
         */
        std::string cachedValues() const;

        // ---- Cache control ----

        void reset(ReadinessDimension dimension);
        void resetAll();

        void setCachedConnection(bool connected);
        void setCachedMedia(const std::string &status);
        void setCachedHead(const std::string &status);
        void setCachedPause(const std::string &status);
        void setCachedHost(const std::string &status);
        void setCachedLanguage(const std::string &status);

        const ReadinessOptions &options() const { return m_options; }
        const std::shared_ptr<ITransport> &transport() const { return m_transport; }

    private:
        struct Reading
        {
            DimensionState state = Unchecked{};
            std::optional<std::string> raw;
            std::optional<ErrorInfo> error;
            std::optional<HostStatusInfo> hostStatus;
            std::vector<std::string> errors;
            std::vector<std::string> warnings;
        };

        struct Slot
        {
            Reading reading;
            bool read = false;
            unsigned long generation = 0;
            std::shared_future<void> pending;
        };

        Reading performRead(ReadinessDimension dimension) const;
        Reading interpret(ReadinessDimension dimension, const std::string &raw) const;
        void store(ReadinessDimension dimension, Reading reading);

        Slot &slot(ReadinessDimension dimension) { return m_slots[static_cast<size_t>(dimension)]; }
        const Slot &slot(ReadinessDimension dimension) const { return m_slots[static_cast<size_t>(dimension)]; }

        std::shared_ptr<ITransport> m_transport;
        ReadinessOptions m_options;

        mutable std::mutex m_mutex;
        std::array<Slot, kReadinessDimensionCount> m_slots;
        std::chrono::system_clock::time_point m_checkedAt;
        std::atomic<bool> m_abandoned{false};
    };
} // namespace llink
