#pragma once

#include <memory>
#include <string>
#include <vector>
#include "config.h"
#include "events/event_system.h"
#include "labellink_export.h"
#include "readiness/printer_readiness.h"
#include "selection/connection_history.h"
#include "selection/smart_device_selector.h"
#include "transport/transport.h"
#include "types/print.h"
#include "types/result.h"
#include "workflow/print_workflow.h"

namespace llink
{
    /**
     * LabelLink - SDK entry point
     *
     * Owns the process-wide configuration and connection history and
     * creates the per-printer objects that use them:
     * 1. TCP transports to network label printers
     * 2. Readiness snapshots
     * 3. Print workflows
     * 4. Device selection over discovered printers
     */
    class LABELLINK_API LabelLink
    {
    public:
        using Config = LabelLinkConfig;

    public:
        /**
         * Get singleton instance
         */
        static LabelLink &getInstance();

        ~LabelLink();

        LabelLink(const LabelLink &) = delete;
        LabelLink &operator=(const LabelLink &) = delete;

        /**
         * Initialize logging and store the configuration
         * @return true if successful
         */
        bool initialize(const Config &config = Config());

        void cleanup();

        bool isInitialized() const;

        const Config &getConfig() const;

        static std::string getVersion();

        /**
         * New TCP transport using the configured timeouts
         */
        std::shared_ptr<ITransport> createTransport() const;

        std::shared_ptr<PrinterReadiness> createReadiness(std::shared_ptr<ITransport> transport,
                                                          const ReadinessOptions &options = ReadinessOptions::all()) const;

        /**
         * New workflow sharing the process connection history
         */
        std::unique_ptr<PrintWorkflow> createWorkflow(std::shared_ptr<ITransport> transport) const;

        SmartDeviceSelector createSelector() const;

        std::shared_ptr<ConnectionHistory> getConnectionHistory() const;

        /**
         * Pick the best device of a discovered list
         * @return empty selection for an empty list
         */
        SmartDiscoveryResult selectPrinter(const std::vector<DeviceInfo> &devices,
                                           const std::optional<DeviceInfo> &previouslySelected = std::nullopt,
                                           TransportType preferredTransport = TransportType::NETWORK) const;

        /**
         * Connect, print and disconnect in one call
         */
        VoidResult print(const std::string &address,
                         const std::string &data,
                         const PrintOptions &options = PrintOptions::defaults());

    private:
        LabelLink();

        class Impl;
        std::unique_ptr<Impl> pImpl_;
    };
} // namespace llink
