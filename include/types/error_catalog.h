#pragma once

#include <string>
#include "types/base.h"
#include "labellink_export.h"

namespace llink
{
    /**
     * Static description of an error code
     * messageTemplate uses {} placeholders filled by Result<T>::Error(code, args...)
     */
    struct ErrorDescriptor
    {
        const char *name;
        const char *messageTemplate;
        const char *recoveryHint;
    };

    /**
     * Look up the descriptor of a code
     * Unknown codes resolve to the UNKNOWN_ERROR descriptor
     */
    LABELLINK_API const ErrorDescriptor &describeError(LLINK_ERROR_CODE code);

    /**
     * Stable string name of a code, e.g. "HEAD_OPEN"
     */
    LABELLINK_API std::string errorCodeName(LLINK_ERROR_CODE code);

    LABELLINK_API std::string errorCategoryName(ErrorCategory category);
} // namespace llink
