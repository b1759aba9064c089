#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "labellink_export.h"
#include "selection/connection_history.h"
#include "types/printer.h"

namespace llink
{
    /**
     * Device with its total score and the contribution of each factor
     */
    struct ScoredDevice
    {
        DeviceInfo device;
        int score = 0;
        int transportScore = 0;
        int modelScore = 0;
        int historyScore = 0;
        int availabilityScore = 0;
        int previousSelectionBonus = 0;
    };

    struct SmartDiscoveryResult
    {
        std::optional<DeviceInfo> selected;
        std::vector<ScoredDevice> ranked; // Highest score first, ties in input order
        std::string reason;
        bool usedPreviousSelection = false;
    };

    /**
     * Picks a default printer from a discovered list
     */
    class LABELLINK_API SmartDeviceSelector
    {
    public:
        explicit SmartDeviceSelector(std::shared_ptr<ConnectionHistory> history = nullptr,
                                     SelectorWeights weights = SelectorWeights{});

        /**
         * Score every device and select the best one
         * @param previouslySelected when present in the list it is selected outright
         * @return empty selection for an empty list
         */
        SmartDiscoveryResult selectOptimal(const std::vector<DeviceInfo> &devices,
                                           const std::optional<DeviceInfo> &previouslySelected = std::nullopt,
                                           TransportType preferredTransport = TransportType::NETWORK) const;

        std::optional<DeviceInfo> selectOptimalPrinter(const std::vector<DeviceInfo> &devices,
                                                       const std::optional<DeviceInfo> &previouslySelected = std::nullopt,
                                                       TransportType preferredTransport = TransportType::NETWORK) const
        {
            return selectOptimal(devices, previouslySelected, preferredTransport).selected;
        }

        ScoredDevice score(const DeviceInfo &device,
                           TransportType preferredTransport,
                           const std::optional<DeviceInfo> &previouslySelected = std::nullopt) const;

        int modelScore(const DeviceInfo &device) const;
        int historyScore(int successCount) const;
        int availabilityScore(DeviceAvailability availability) const;

        void recordSuccessfulConnection(const std::string &address) { m_history->recordSuccessfulConnection(address); }
        void recordFailedConnection(const std::string &address) { m_history->recordFailedConnection(address); }

        const std::shared_ptr<ConnectionHistory> &history() const { return m_history; }
        const SelectorWeights &weights() const { return m_weights; }

    private:
        std::shared_ptr<ConnectionHistory> m_history;
        SelectorWeights m_weights;
    };
} // namespace llink
