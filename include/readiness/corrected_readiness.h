#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "labellink_export.h"
#include "readiness/printer_readiness.h"
#include "types/readiness.h"

namespace llink
{
    /**
     * Correction names recorded in the log
     */
    namespace correction_names
    {
        constexpr const char *UNPAUSE = "unpause";
        constexpr const char *CLEAR_ERRORS = "clearErrors";
        constexpr const char *CALIBRATE = "calibrate";
        constexpr const char *SWITCH_LANGUAGE = "switchLanguage";
        constexpr const char *CLEAR_BUFFER = "clearBuffer";
        constexpr const char *FLUSH_BUFFER = "flushBuffer";
    } // namespace correction_names

    /**
     * Readiness snapshot plus the append-only log of corrections applied to it
     */
    class LABELLINK_API CorrectedReadiness
    {
    public:
        explicit CorrectedReadiness(std::shared_ptr<PrinterReadiness> readiness);

        void recordCorrection(const std::string &name, bool success, const std::string &error = "");

        const std::vector<CorrectionEntry> &corrections() const { return m_corrections; }
        const std::shared_ptr<PrinterReadiness> &readiness() const { return m_readiness; }
        std::chrono::system_clock::time_point timestamp() const { return m_timestamp; }

        bool hasCorrections() const { return !m_corrections.empty(); }
        bool allSucceeded() const;
        bool anyFailed() const;
        bool anySucceeded() const;

        // Latest outcome of a named correction, false if never attempted
        bool succeeded(const std::string &name) const;

        bool isPausedFixed() const { return succeeded(correction_names::UNPAUSE); }
        bool isErrorsFixed() const { return succeeded(correction_names::CLEAR_ERRORS); }
        bool isMediaFixed() const { return succeeded(correction_names::CALIBRATE); }
        bool isLanguageFixed() const { return succeeded(correction_names::SWITCH_LANGUAGE); }
        bool isBufferCleared() const { return succeeded(correction_names::CLEAR_BUFFER); }

        /**
         * "No corrections applied", or "Fixed: a, b; Failed: c"
         */
        std::string summary() const;

        /**
         * Multi-line report with one line per correction
         */
        std::string detailedCorrectionInfo() const;

    private:
        std::shared_ptr<PrinterReadiness> m_readiness;
        std::vector<CorrectionEntry> m_corrections;
        std::chrono::system_clock::time_point m_timestamp;
    };
} // namespace llink
