#include "readiness/printer_readiness.h"
#include "protocol/sgd_codec.h"
#include "protocol/status_parser.h"
#include "utils/logger.h"
#include "types/internal/json_serializer.h"
#include <sstream>

namespace llink
{
    namespace
    {
        const char *settingKey(ReadinessDimension dimension)
        {
            switch (dimension)
            {
            case ReadinessDimension::MEDIA:
                return sgd_keys::MEDIA_STATUS;
            case ReadinessDimension::HEAD:
                return sgd_keys::HEAD_LATCH;
            case ReadinessDimension::PAUSE:
                return sgd_keys::DEVICE_PAUSE;
            case ReadinessDimension::HOST:
                return sgd_keys::HOST_STATUS;
            case ReadinessDimension::LANGUAGE:
                return sgd_keys::LANGUAGES;
            default:
                return "";
            }
        }

        std::string describeState(const DimensionState &state)
        {
            if (isGood(state))
            {
                return "good";
            }
            if (const Bad *bad = std::get_if<Bad>(&state))
            {
                return "bad(" + bad->detail + ")";
            }
            return "unchecked";
        }

        const ReadinessDimension kAllDimensions[] = {
            ReadinessDimension::CONNECTION,
            ReadinessDimension::MEDIA,
            ReadinessDimension::HEAD,
            ReadinessDimension::PAUSE,
            ReadinessDimension::HOST,
            ReadinessDimension::LANGUAGE,
        };
    } // namespace

    PrinterReadiness::PrinterReadiness(std::shared_ptr<ITransport> transport, ReadinessOptions options)
        : m_transport(std::move(transport)), m_options(std::move(options)), m_checkedAt(std::chrono::system_clock::now())
    {
    }

    DimensionState PrinterReadiness::ensure(ReadinessDimension dimension)
    {
        if (!m_options.checks(dimension))
        {
            return cachedState(dimension);
        }

        while (true)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            Slot &s = slot(dimension);
            if (s.read)
            {
                LABELLINK_LOG_DEBUG("PrinterReadiness: {} already read, using cached value", readinessDimensionName(dimension));
                return s.reading.state;
            }

            if (s.pending.valid())
            {
                // Another caller is reading this dimension, share its result
                auto pending = s.pending;
                const unsigned long waitedGeneration = s.generation;
                lock.unlock();
                pending.wait();
                lock.lock();
                const Slot &after = slot(dimension);
                if (after.read && after.generation == waitedGeneration)
                {
                    return after.reading.state;
                }
                // Reset while reading, start over
                continue;
            }

            if (m_abandoned)
            {
                LABELLINK_LOG_DEBUG("PrinterReadiness: Abandoned, not reading {}", readinessDimensionName(dimension));
                return s.reading.state;
            }

            std::promise<void> promise;
            s.pending = promise.get_future().share();
            const unsigned long generation = s.generation;
            lock.unlock();

            Reading reading;
            try
            {
                reading = performRead(dimension);
            }
            catch (const std::exception &e)
            {
                // Waiters must still be released
                LABELLINK_LOG_ERROR("PrinterReadiness: Error reading {} status: {}", readinessDimensionName(dimension), e.what());
                reading.error = ErrorInfo::fromCode(LLINK_ERROR_CODE::STATUS_CHECK_FAILED, e.what());
                reading.state = Bad{reading.error->message};
            }

            lock.lock();
            Slot &current = slot(dimension);
            const bool stillCurrent = current.generation == generation;
            if (stillCurrent)
            {
                current.reading = std::move(reading);
                current.read = true;
                current.pending = std::shared_future<void>();
                m_checkedAt = std::chrono::system_clock::now();
            }
            else
            {
                LABELLINK_LOG_DEBUG("PrinterReadiness: {} was reset during read, discarding result",
                                    readinessDimensionName(dimension));
            }
            DimensionState state = current.reading.state;
            lock.unlock();

            promise.set_value();
            if (stillCurrent)
            {
                return state;
            }
        }
    }

    void PrinterReadiness::readAllStatuses()
    {
        LABELLINK_LOG_INFO("PrinterReadiness: Reading all statuses based on options");
        for (auto dimension : kAllDimensions)
        {
            if (m_abandoned)
            {
                LABELLINK_LOG_DEBUG("PrinterReadiness: Abandoned, skipping remaining reads");
                break;
            }
            ensure(dimension);
        }
    }

    void PrinterReadiness::abandon()
    {
        m_abandoned = true;
    }

    std::optional<std::string> PrinterReadiness::readLanguageFresh()
    {
        if (m_abandoned)
        {
            return std::nullopt;
        }
        Reading reading = performRead(ReadinessDimension::LANGUAGE);
        std::optional<std::string> value = reading.raw;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Slot &s = slot(ReadinessDimension::LANGUAGE);
            s.reading = std::move(reading);
            s.read = true;
            ++s.generation;
            m_checkedAt = std::chrono::system_clock::now();
        }
        return value;
    }

    PrinterReadiness::Reading PrinterReadiness::performRead(ReadinessDimension dimension) const
    {
        const char *name = readinessDimensionName(dimension);
        LABELLINK_LOG_INFO("PrinterReadiness: Reading {} status", name);

        Reading reading;
        if (dimension == ReadinessDimension::CONNECTION)
        {
            auto result = m_transport->isConnected();
            if (result.isError())
            {
                reading.state = Bad{result.error().message};
                reading.error = result.error();
                reading.warnings.push_back("Failed to read connection status: " + result.error().message);
            }
            else if (result.value())
            {
                reading.state = Good{};
            }
            else
            {
                reading.state = Bad{describeError(LLINK_ERROR_CODE::NOT_CONNECTED).messageTemplate};
            }
            LABELLINK_LOG_INFO("PrinterReadiness: Connection status read: {}", describeState(reading.state));
            return reading;
        }

        auto result = m_transport->query(settingKey(dimension));
        if (result.isError())
        {
            LABELLINK_LOG_WARN("PrinterReadiness: Failed to read {} status: {}", name, result.error().message);
            reading.state = Bad{result.error().message};
            reading.error = result.error();
            reading.warnings.push_back(std::string("Failed to read ") + name + " status: " + result.error().message);
            return reading;
        }

        auto parsed = SgdCodec::parseResponse(result.value());
        if (!parsed)
        {
            LABELLINK_LOG_WARN("PrinterReadiness: Empty {} status response", name);
            reading.state = Bad{describeError(LLINK_ERROR_CODE::INVALID_STATUS_RESPONSE).messageTemplate};
            reading.warnings.push_back(std::string("Empty ") + name + " status response");
            return reading;
        }

        reading = interpret(dimension, *parsed);
        LABELLINK_LOG_INFO("PrinterReadiness: {} status read: '{}' -> {}", name, *parsed, describeState(reading.state));
        return reading;
    }

    PrinterReadiness::Reading PrinterReadiness::interpret(ReadinessDimension dimension, const std::string &raw) const
    {
        Reading reading;
        reading.raw = raw;

        switch (dimension)
        {
        case ReadinessDimension::MEDIA:
            if (StatusParser::hasMedia(raw))
                reading.state = Good{};
            else
                reading.state = Bad{describeError(LLINK_ERROR_CODE::OUT_OF_PAPER).messageTemplate};
            break;

        case ReadinessDimension::HEAD:
            if (StatusParser::isHeadClosed(raw))
                reading.state = Good{};
            else
                reading.state = Bad{describeError(LLINK_ERROR_CODE::HEAD_OPEN).messageTemplate};
            break;

        case ReadinessDimension::PAUSE:
        {
            auto paused = StatusParser::toBool(raw);
            if (paused && *paused)
            {
                reading.state = Bad{describeError(LLINK_ERROR_CODE::PRINTER_PAUSED).messageTemplate};
            }
            else
            {
                reading.state = Good{};
                if (!paused)
                {
                    reading.warnings.push_back("Unrecognised pause status: " + raw);
                }
            }
            break;
        }

        case ReadinessDimension::HOST:
        {
            HostStatusInfo info = StatusParser::parseHostStatus(raw);
            if (info.isOk)
            {
                reading.state = Good{};
            }
            else
            {
                const std::string message = info.errorMessage ? *info.errorMessage : "Printer error: " + raw;
                reading.errors.push_back(message);
                if (info.errorCode)
                {
                    reading.errors.push_back("Error code: " + std::to_string(*info.errorCode));
                }
                auto issues = info.blockingIssues();
                reading.errors.insert(reading.errors.end(), issues.begin(), issues.end());
                reading.state = Bad{message};
            }
            reading.hostStatus = std::move(info);
            break;
        }

        case ReadinessDimension::LANGUAGE:
            reading.state = Good{};
            break;

        case ReadinessDimension::CONNECTION:
        {
            auto connected = StatusParser::toBool(raw);
            if (connected && *connected)
                reading.state = Good{};
            else
                reading.state = Bad{describeError(LLINK_ERROR_CODE::NOT_CONNECTED).messageTemplate};
            break;
        }
        }
        return reading;
    }

    void PrinterReadiness::store(ReadinessDimension dimension, Reading reading)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Slot &s = slot(dimension);
        s.reading = std::move(reading);
        s.read = true;
        ++s.generation;
        m_checkedAt = std::chrono::system_clock::now();
    }

    bool PrinterReadiness::isReady() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto dimension : kAllDimensions)
        {
            if (!m_options.checks(dimension))
            {
                continue;
            }
            if (!isGood(slot(dimension).reading.state))
            {
                return false;
            }
        }
        return true;
    }

    DimensionState PrinterReadiness::cachedState(ReadinessDimension dimension) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return slot(dimension).reading.state;
    }

    std::optional<std::string> PrinterReadiness::cachedRaw(ReadinessDimension dimension) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return slot(dimension).reading.raw;
    }

    std::optional<ErrorInfo> PrinterReadiness::cachedError(ReadinessDimension dimension) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return slot(dimension).reading.error;
    }

    bool PrinterReadiness::wasRead(ReadinessDimension dimension) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return slot(dimension).read;
    }

    std::optional<bool> PrinterReadiness::cachedIsConnected() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto &state = slot(ReadinessDimension::CONNECTION).reading.state;
        if (isUnchecked(state))
        {
            return std::nullopt;
        }
        return isGood(state);
    }

    std::optional<bool> PrinterReadiness::cachedHasMedia() const
    {
        auto raw = cachedRaw(ReadinessDimension::MEDIA);
        if (!raw)
        {
            return std::nullopt;
        }
        return StatusParser::hasMedia(*raw);
    }

    std::optional<bool> PrinterReadiness::cachedIsHeadClosed() const
    {
        auto raw = cachedRaw(ReadinessDimension::HEAD);
        if (!raw)
        {
            return std::nullopt;
        }
        return StatusParser::isHeadClosed(*raw);
    }

    std::optional<bool> PrinterReadiness::cachedIsPaused() const
    {
        auto raw = cachedRaw(ReadinessDimension::PAUSE);
        if (!raw)
        {
            return std::nullopt;
        }
        return StatusParser::toBool(*raw);
    }

    std::optional<HostStatusInfo> PrinterReadiness::cachedHostStatus() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return slot(ReadinessDimension::HOST).reading.hostStatus;
    }

    std::vector<std::string> PrinterReadiness::errors() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return slot(ReadinessDimension::HOST).reading.errors;
    }

    std::vector<std::string> PrinterReadiness::warnings() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> all;
        for (const auto &s : m_slots)
        {
            all.insert(all.end(), s.reading.warnings.begin(), s.reading.warnings.end());
        }
        return all;
    }

    std::vector<std::string> PrinterReadiness::blockingIssues() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> issues;
        for (auto dimension : kAllDimensions)
        {
            if (!m_options.checks(dimension))
            {
                continue;
            }
            const auto &state = slot(dimension).reading.state;
            if (const Bad *bad = std::get_if<Bad>(&state))
            {
                issues.push_back(bad->detail);
            }
            else if (isUnchecked(state))
            {
                issues.push_back(std::string(readinessDimensionName(dimension)) + " status not checked");
            }
        }
        return issues;
    }

    std::map<std::string, bool> PrinterReadiness::readStatus() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::map<std::string, bool> status;
        for (auto dimension : kAllDimensions)
        {
            status[readinessDimensionName(dimension)] = slot(dimension).read;
        }
        return status;
    }

    std::chrono::system_clock::time_point PrinterReadiness::checkedAt() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_checkedAt;
    }

    std::string PrinterReadiness::toString() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::ostringstream out;
        out << "PrinterReadiness(";
        bool first = true;
        for (auto dimension : kAllDimensions)
        {
            if (!first)
            {
                out << ", ";
            }
            first = false;
            out << readinessDimensionName(dimension) << ": " << describeState(slot(dimension).reading.state);
        }
        out << ")";
        return out.str();
    }

    std::string PrinterReadiness::cachedValues() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        nlohmann::json j = nlohmann::json::object();
        for (auto dimension : kAllDimensions)
        {
            const Slot &entry = slot(dimension);
            nlohmann::json value = entry.reading.state;
            value["read"] = entry.read;
            value["checked"] = m_options.checks(dimension);
            value["raw"] = entry.reading.raw ? nlohmann::json(*entry.reading.raw) : nlohmann::json(nullptr);
            if (entry.reading.error)
            {
                value["error"] = *entry.reading.error;
            }
            if (entry.reading.hostStatus)
            {
                value["hostStatus"] = *entry.reading.hostStatus;
            }
            j[readinessDimensionName(dimension)] = value;
        }
        j["checkedAt"] = toJsonMillis(m_checkedAt);
        return j.dump();
    }

    void PrinterReadiness::reset(ReadinessDimension dimension)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Slot &s = slot(dimension);
        s.reading = Reading{};
        s.read = false;
        s.pending = std::shared_future<void>();
        ++s.generation;
    }

    void PrinterReadiness::resetAll()
    {
        for (auto dimension : kAllDimensions)
        {
            reset(dimension);
        }
    }

    void PrinterReadiness::setCachedConnection(bool connected)
    {
        Reading reading;
        if (connected)
            reading.state = Good{};
        else
            reading.state = Bad{describeError(LLINK_ERROR_CODE::NOT_CONNECTED).messageTemplate};
        store(ReadinessDimension::CONNECTION, std::move(reading));
    }

    void PrinterReadiness::setCachedMedia(const std::string &status)
    {
        store(ReadinessDimension::MEDIA, interpret(ReadinessDimension::MEDIA, status));
    }

    void PrinterReadiness::setCachedHead(const std::string &status)
    {
        store(ReadinessDimension::HEAD, interpret(ReadinessDimension::HEAD, status));
    }

    void PrinterReadiness::setCachedPause(const std::string &status)
    {
        store(ReadinessDimension::PAUSE, interpret(ReadinessDimension::PAUSE, status));
    }

    void PrinterReadiness::setCachedHost(const std::string &status)
    {
        store(ReadinessDimension::HOST, interpret(ReadinessDimension::HOST, status));
    }

    void PrinterReadiness::setCachedLanguage(const std::string &status)
    {
        store(ReadinessDimension::LANGUAGE, interpret(ReadinessDimension::LANGUAGE, status));
    }
} // namespace llink
