#include "classifier.h"

namespace chkcert
{
    CheckResult Classify(const std::string& hostname, const ProbeOutcome& outcome, TimePoint now)
    {
        if (outcome.HasError())
            return CheckResult{hostname, now, now, kError};
        return CheckResult{hostname, outcome.not_before, outcome.not_after, kOk};
    }
} // namespace chkcert
