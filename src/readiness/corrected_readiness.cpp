#include "readiness/corrected_readiness.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace llink
{
    CorrectedReadiness::CorrectedReadiness(std::shared_ptr<PrinterReadiness> readiness)
        : m_readiness(std::move(readiness)), m_timestamp(std::chrono::system_clock::now())
    {
    }

    void CorrectedReadiness::recordCorrection(const std::string &name, bool success, const std::string &error)
    {
        m_corrections.push_back(CorrectionEntry{name, success, success ? std::string() : error});
        m_timestamp = std::chrono::system_clock::now();
    }

    bool CorrectedReadiness::allSucceeded() const
    {
        return std::all_of(m_corrections.begin(), m_corrections.end(),
                           [](const CorrectionEntry &entry)
                           { return entry.success; });
    }

    bool CorrectedReadiness::anyFailed() const
    {
        return std::any_of(m_corrections.begin(), m_corrections.end(),
                           [](const CorrectionEntry &entry)
                           { return !entry.success; });
    }

    bool CorrectedReadiness::anySucceeded() const
    {
        return std::any_of(m_corrections.begin(), m_corrections.end(),
                           [](const CorrectionEntry &entry)
                           { return entry.success; });
    }

    bool CorrectedReadiness::succeeded(const std::string &name) const
    {
        for (auto it = m_corrections.rbegin(); it != m_corrections.rend(); ++it)
        {
            if (it->name == name)
            {
                return it->success;
            }
        }
        return false;
    }

    std::string CorrectedReadiness::summary() const
    {
        if (m_corrections.empty())
        {
            return "No corrections applied";
        }

        std::string fixed;
        std::string failed;
        for (const auto &entry : m_corrections)
        {
            std::string &target = entry.success ? fixed : failed;
            if (!target.empty())
            {
                target += ", ";
            }
            target += entry.name;
        }

        std::string result;
        if (!fixed.empty())
        {
            result = "Fixed: " + fixed;
        }
        if (!failed.empty())
        {
            if (!result.empty())
            {
                result += "; ";
            }
            result += "Failed: " + failed;
        }
        return result;
    }

    std::string CorrectedReadiness::detailedCorrectionInfo() const
    {
        if (m_corrections.empty())
        {
            return "No corrections attempted";
        }

        const std::time_t when = std::chrono::system_clock::to_time_t(m_timestamp);
        std::tm tm{};
#ifdef _WIN32
        gmtime_s(&tm, &when);
#else
        gmtime_r(&when, &tm);
#endif
        std::ostringstream out;
        out << "Corrections applied at " << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ") << ":\n";
        for (const auto &entry : m_corrections)
        {
            out << "  - " << entry.name << ": " << (entry.success ? "SUCCESS" : "FAILED");
            if (!entry.error.empty())
            {
                out << " (" << entry.error << ")";
            }
            out << "\n";
        }
        return out.str();
    }
} // namespace llink
