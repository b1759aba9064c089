#include "policies/timeout_policy.h"

namespace llink
{
    ThreadPool &TimeoutPolicy::pool()
    {
        static ThreadPool instance(4);
        return instance;
    }
} // namespace llink
