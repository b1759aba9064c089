#pragma once

#include <functional>
#include <memory>
#include <string>
#include "core/cancellation_token.h"
#include "labellink_export.h"
#include "readiness/corrected_readiness.h"
#include "readiness/printer_readiness.h"
#include "transport/transport.h"
#include "types/readiness.h"
#include "types/result.h"

namespace llink
{
    /**
     * Correction progress notification: correction name and a human readable message
     */
    using CorrectionStatusCallback = std::function<void(const std::string &, const std::string &)>;

    /**
     * Bounded self-healing against a readiness snapshot
     *
     * Triggers are evaluated from cached readiness state only, so a healthy
     * snapshot costs no transport calls. Every correction is independent:
     * a failure is recorded and the remaining corrections still run.
     */
    class LABELLINK_API AutoCorrector
    {
    public:
        AutoCorrector(std::shared_ptr<ITransport> transport,
                      AutoCorrectionOptions options,
                      const CancellationToken *cancellation = nullptr);

        void setStatusCallback(CorrectionStatusCallback callback) { m_statusCallback = std::move(callback); }

        /**
         * Apply every enabled correction whose trigger holds
         * @param readiness snapshot to correct; corrected dimensions are updated or reset
         * @param log receives one entry per attempted correction
         * @return true if at least one correction was attempted and succeeded
         */
        bool correctReadiness(PrinterReadiness &readiness, CorrectedReadiness &log);

        CorrectedReadiness correct(const std::shared_ptr<PrinterReadiness> &readiness);

        /**
         * Make the printer language match the payload
         *
         * The current language is read fresh. A switch is only issued on
         * mismatch and only counts once the printer reports the new language.
         * When either language cannot be determined no action is taken.
         */
        VoidResult switchLanguageForData(const std::string &data,
                                         PrinterReadiness &readiness,
                                         CorrectedReadiness *log = nullptr);

        /**
         * Clear and/or flush the printer's receive buffer, as enabled
         * @return false if an enabled buffer operation failed
         */
        bool prepareBuffer(CorrectedReadiness &log);

        const AutoCorrectionOptions &options() const { return m_options; }

    private:
        VoidResult unpause(PrinterReadiness &readiness);
        VoidResult clearErrors(PrinterReadiness &readiness);
        VoidResult calibrate(PrinterReadiness &readiness);

        void record(CorrectedReadiness &log, const char *name, const VoidResult &result);
        void notify(const std::string &name, const std::string &message);

        std::shared_ptr<ITransport> m_transport;
        AutoCorrectionOptions m_options;
        const CancellationToken *m_cancellation;
        CorrectionStatusCallback m_statusCallback;
    };
} // namespace llink
