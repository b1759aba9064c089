#include "labellink.h"
#include "transport/tcp_transport.h"
#include "utils/logger.h"
#include "version.h"
#include <mutex>

namespace llink
{
    // ========== Private Implementation Class ==========
    class LabelLink::Impl
    {
    public:
        Impl() : history_(std::make_shared<ConnectionHistory>()) {}

        ~Impl()
        {
            cleanup();
        }

        bool initialize(const LabelLink::Config &config)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (initialized_)
            {
                LABELLINK_LOG_WARN("LabelLink already initialized");
                return true;
            }
            config_ = config;

            LogConfig logConfig;
            logConfig.level = static_cast<LogLevel>(config.log.logLevel);
            logConfig.enableConsole = config.log.logEnableConsole;
            logConfig.enableFile = config.log.logEnableFile;
            logConfig.fileName = config.log.logFileName;
            logConfig.maxFileSize = config.log.logMaxFileSize;
            logConfig.maxFiles = config.log.logMaxFiles;
            Logger::getInstance().initialize(logConfig);

            LABELLINK_LOG_INFO("LabelLink {} initialized", LABELLINK_VERSION);
            initialized_ = true;
            return true;
        }

        void cleanup()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!initialized_)
            {
                return;
            }
            LABELLINK_LOG_INFO("LabelLink cleanup");
            Logger::getInstance().flush();
            initialized_ = false;
        }

        bool isInitialized() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return initialized_;
        }

        const LabelLink::Config &getConfig() const { return config_; }
        const std::shared_ptr<ConnectionHistory> &history() const { return history_; }

    private:
        mutable std::mutex mutex_;
        bool initialized_ = false;
        LabelLink::Config config_;
        std::shared_ptr<ConnectionHistory> history_;
    };

    // ========== LabelLink Implementation ==========

    LabelLink::LabelLink() : pImpl_(std::make_unique<Impl>())
    {
    }

    LabelLink::~LabelLink() = default;

    LabelLink &LabelLink::getInstance()
    {
        static LabelLink instance;
        return instance;
    }

    bool LabelLink::initialize(const Config &config)
    {
        return pImpl_->initialize(config);
    }

    void LabelLink::cleanup()
    {
        pImpl_->cleanup();
    }

    bool LabelLink::isInitialized() const
    {
        return pImpl_->isInitialized();
    }

    const LabelLink::Config &LabelLink::getConfig() const
    {
        return pImpl_->getConfig();
    }

    std::string LabelLink::getVersion()
    {
        return LABELLINK_VERSION;
    }

    std::shared_ptr<ITransport> LabelLink::createTransport() const
    {
        return std::make_shared<TcpTransport>(pImpl_->getConfig().transport);
    }

    std::shared_ptr<PrinterReadiness> LabelLink::createReadiness(std::shared_ptr<ITransport> transport,
                                                                 const ReadinessOptions &options) const
    {
        return std::make_shared<PrinterReadiness>(std::move(transport), options);
    }

    std::unique_ptr<PrintWorkflow> LabelLink::createWorkflow(std::shared_ptr<ITransport> transport) const
    {
        return std::make_unique<PrintWorkflow>(std::move(transport), pImpl_->history(), pImpl_->getConfig().dwell);
    }

    SmartDeviceSelector LabelLink::createSelector() const
    {
        return SmartDeviceSelector(pImpl_->history(), pImpl_->getConfig().selector);
    }

    std::shared_ptr<ConnectionHistory> LabelLink::getConnectionHistory() const
    {
        return pImpl_->history();
    }

    SmartDiscoveryResult LabelLink::selectPrinter(const std::vector<DeviceInfo> &devices,
                                                  const std::optional<DeviceInfo> &previouslySelected,
                                                  TransportType preferredTransport) const
    {
        return createSelector().selectOptimal(devices, previouslySelected, preferredTransport);
    }

    VoidResult LabelLink::print(const std::string &address, const std::string &data, const PrintOptions &options)
    {
        if (!isInitialized())
        {
            return VoidResult::ErrorMessage(LLINK_ERROR_CODE::OPERATION_ERROR, "LabelLink is not initialized");
        }

        auto transport = createTransport();
        auto workflow = createWorkflow(transport);
        auto result = workflow->print(data, address, options);

        auto disconnected = transport->disconnect();
        if (disconnected.isError())
        {
            LABELLINK_LOG_WARN("Disconnect after print failed: {}", disconnected.error().message);
        }
        return result;
    }
} // namespace llink
