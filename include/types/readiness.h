#pragma once

#include <chrono>
#include <string>
#include <variant>

namespace llink
{
    /**
     * Readiness dimensions, each read and cached independently
     */
    enum class ReadinessDimension
    {
        CONNECTION = 0,
        MEDIA,
        HEAD,
        PAUSE,
        HOST,
        LANGUAGE,
    };

    constexpr int kReadinessDimensionCount = 6;

    inline const char *readinessDimensionName(ReadinessDimension dimension)
    {
        switch (dimension)
        {
        case ReadinessDimension::CONNECTION:
            return "connection";
        case ReadinessDimension::MEDIA:
            return "media";
        case ReadinessDimension::HEAD:
            return "head";
        case ReadinessDimension::PAUSE:
            return "pause";
        case ReadinessDimension::HOST:
            return "host";
        case ReadinessDimension::LANGUAGE:
            return "language";
        default:
            return "unknown";
        }
    }

    // Per-dimension verdict
    struct Unchecked
    {
    };
    struct Good
    {
    };
    struct Bad
    {
        std::string detail;
    };
    using DimensionState = std::variant<Unchecked, Good, Bad>;

    inline bool isUnchecked(const DimensionState &state) { return std::holds_alternative<Unchecked>(state); }
    inline bool isGood(const DimensionState &state) { return std::holds_alternative<Good>(state); }
    inline bool isBad(const DimensionState &state) { return std::holds_alternative<Bad>(state); }

    /**
     * Which dimensions to read and which faults may be fixed
     */
    struct ReadinessOptions
    {
        bool checkConnection = false;
        bool checkMedia = false;
        bool checkHead = false;
        bool checkPause = false;
        bool checkErrors = false;
        bool checkLanguage = false;

        bool fixPausedPrinter = false;
        bool fixPrinterErrors = false;
        bool fixMediaCalibration = false;
        bool fixLanguageMismatch = false;
        bool clearBuffer = false;
        bool flushBuffer = false;

        std::chrono::milliseconds checkDelay{100};
        int maxAttempts = 3;

        bool checks(ReadinessDimension dimension) const
        {
            switch (dimension)
            {
            case ReadinessDimension::CONNECTION:
                return checkConnection;
            case ReadinessDimension::MEDIA:
                return checkMedia;
            case ReadinessDimension::HEAD:
                return checkHead;
            case ReadinessDimension::PAUSE:
                return checkPause;
            case ReadinessDimension::HOST:
                return checkErrors;
            case ReadinessDimension::LANGUAGE:
                return checkLanguage;
            default:
                return false;
            }
        }

        static ReadinessOptions all()
        {
            ReadinessOptions o;
            o.checkConnection = o.checkMedia = o.checkHead = o.checkPause = o.checkErrors = o.checkLanguage = true;
            return o;
        }

        // Basic checks with the cheap fixes
        static ReadinessOptions quick()
        {
            ReadinessOptions o;
            o.checkConnection = o.checkMedia = o.checkHead = o.checkPause = o.checkLanguage = true;
            o.fixPausedPrinter = o.fixPrinterErrors = o.fixLanguageMismatch = true;
            return o;
        }

        static ReadinessOptions forPrinting()
        {
            ReadinessOptions o;
            o.checkConnection = o.checkMedia = o.checkHead = o.checkPause = o.checkErrors = true;
            o.fixPausedPrinter = o.fixPrinterErrors = true;
            o.clearBuffer = o.flushBuffer = true;
            return o;
        }

        static ReadinessOptions smartOptimized()
        {
            ReadinessOptions o = all();
            o.fixPausedPrinter = o.fixPrinterErrors = o.fixLanguageMismatch = true;
            o.clearBuffer = o.flushBuffer = true;
            return o;
        }

        static ReadinessOptions comprehensive()
        {
            ReadinessOptions o = smartOptimized();
            o.fixMediaCalibration = true;
            return o;
        }
    };

    /**
     * Corrections the auto-corrector may attempt
     */
    struct AutoCorrectionOptions
    {
        bool enableUnpause = false;
        bool enableClearErrors = false;
        bool enableCalibration = false;
        bool enableLanguageSwitch = false;
        bool enableClearBuffer = false;
        bool enableFlushBuffer = false;
        int maxAttempts = 3;
        std::chrono::milliseconds attemptDelay{500};

        bool hasAnyEnabled() const
        {
            return enableUnpause || enableClearErrors || enableCalibration ||
                   enableLanguageSwitch || enableClearBuffer || enableFlushBuffer;
        }

        static AutoCorrectionOptions none() { return AutoCorrectionOptions{}; }

        // Corrections with no lasting side effect on printer configuration
        static AutoCorrectionOptions safe()
        {
            AutoCorrectionOptions o;
            o.enableUnpause = true;
            o.enableClearErrors = true;
            return o;
        }

        static AutoCorrectionOptions all()
        {
            AutoCorrectionOptions o;
            o.enableUnpause = o.enableClearErrors = o.enableCalibration = true;
            o.enableLanguageSwitch = o.enableClearBuffer = o.enableFlushBuffer = true;
            return o;
        }

        static AutoCorrectionOptions fromReadinessOptions(const ReadinessOptions &readiness)
        {
            AutoCorrectionOptions o;
            o.enableUnpause = readiness.fixPausedPrinter;
            o.enableClearErrors = readiness.fixPrinterErrors;
            o.enableCalibration = readiness.fixMediaCalibration;
            o.enableLanguageSwitch = readiness.fixLanguageMismatch;
            o.enableClearBuffer = readiness.clearBuffer;
            o.enableFlushBuffer = readiness.flushBuffer;
            o.maxAttempts = readiness.maxAttempts;
            return o;
        }
    };

    /**
     * One entry of the correction log
     */
    struct CorrectionEntry
    {
        std::string name;
        bool success = false;
        std::string error; // Empty on success
    };
} // namespace llink
