#include "selection/smart_device_selector.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>

namespace llink
{
    SmartDeviceSelector::SmartDeviceSelector(std::shared_ptr<ConnectionHistory> history, SelectorWeights weights)
        : m_history(history ? std::move(history) : std::make_shared<ConnectionHistory>()), m_weights(weights)
    {
    }

    int SmartDeviceSelector::modelScore(const DeviceInfo &device) const
    {
        // Most specific first
        const std::pair<const char *, int> priorities[] = {
            {"RW420", m_weights.modelRW420},
            {"ZQ521", m_weights.modelZQ521},
            {"ZQ520", m_weights.modelZQ520},
            {"ZQ510", m_weights.modelZQ510},
            {"ZQ", m_weights.modelZQ},
            {"ZEBRA", m_weights.modelZebra},
        };

        const std::string text = StringUtils::toUpperCase(device.model + " " + device.name);
        for (const auto &[key, value] : priorities)
        {
            if (text.find(key) != std::string::npos)
            {
                return value;
            }
        }
        return m_weights.modelUnknown;
    }

    int SmartDeviceSelector::historyScore(int successCount) const
    {
        if (successCount >= 5)
            return m_weights.historyFivePlus;
        if (successCount >= 3)
            return m_weights.historyThreePlus;
        if (successCount >= 1)
            return m_weights.historyOnePlus;
        return 0;
    }

    int SmartDeviceSelector::availabilityScore(DeviceAvailability availability) const
    {
        switch (availability)
        {
        case DeviceAvailability::CONNECTED:
            return m_weights.availabilityConnected;
        case DeviceAvailability::READY:
            return m_weights.availabilityReady;
        case DeviceAvailability::DISCOVERED:
            return m_weights.availabilityDiscovered;
        default:
            return m_weights.availabilityOther;
        }
    }

    ScoredDevice SmartDeviceSelector::score(const DeviceInfo &device,
                                            TransportType preferredTransport,
                                            const std::optional<DeviceInfo> &previouslySelected) const
    {
        ScoredDevice scored;
        scored.device = device;
        scored.transportScore = device.transport == preferredTransport ? m_weights.preferredTransport
                                                                       : m_weights.otherTransport;
        scored.modelScore = modelScore(device);
        scored.historyScore = historyScore(m_history->successCount(device.address));
        scored.availabilityScore = availabilityScore(device.availability);
        if (previouslySelected && *previouslySelected == device)
        {
            scored.previousSelectionBonus = m_weights.previousSelectionBonus;
        }
        scored.score = scored.transportScore + scored.modelScore + scored.historyScore +
                       scored.availabilityScore + scored.previousSelectionBonus;
        return scored;
    }

    SmartDiscoveryResult SmartDeviceSelector::selectOptimal(const std::vector<DeviceInfo> &devices,
                                                            const std::optional<DeviceInfo> &previouslySelected,
                                                            TransportType preferredTransport) const
    {
        SmartDiscoveryResult result;
        if (devices.empty())
        {
            result.reason = "No devices available";
            return result;
        }

        LABELLINK_LOG_INFO("SmartDeviceSelector: Selecting optimal printer from {} devices", devices.size());

        result.ranked.reserve(devices.size());
        for (const auto &device : devices)
        {
            result.ranked.push_back(score(device, preferredTransport, previouslySelected));
        }
        std::stable_sort(result.ranked.begin(), result.ranked.end(),
                         [](const ScoredDevice &a, const ScoredDevice &b)
                         { return a.score > b.score; });

        if (previouslySelected)
        {
            auto it = std::find(devices.begin(), devices.end(), *previouslySelected);
            if (it != devices.end())
            {
                LABELLINK_LOG_INFO("SmartDeviceSelector: Using previously selected printer: {}", it->name);
                result.selected = *it;
                result.usedPreviousSelection = true;
                result.reason = "Previously selected printer is available";
                return result;
            }
        }

        const ScoredDevice &best = result.ranked.front();
        LABELLINK_LOG_INFO("SmartDeviceSelector: Selected printer: {} (score: {})", best.device.name, best.score);
        result.selected = best.device;
        result.reason = "Highest score " + std::to_string(best.score) + " of " + std::to_string(devices.size()) +
                        " devices";
        return result;
    }
} // namespace llink
