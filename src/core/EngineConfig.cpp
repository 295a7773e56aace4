#include "lockbox/core/EngineConfig.hpp"

namespace lockbox::core
{

bool EngineConfig::isValid() const noexcept
{
    if (sessionTimeout.count() <= 0)
    {
        return false;
    }
    if (maxFailedAttempts == 0U || failureWindow.count() <= 0 || lockoutDuration.count() <= 0)
    {
        return false;
    }
    if (!lockbox::crypto::isIterationCountAccepted(kdfIterations) ||
        !lockbox::crypto::isIterationCountAccepted(shareKdfIterations))
    {
        return false;
    }
    return defaultShareTtl.count() > 0;
}

} // namespace lockbox::core
