#include "cert_types.h"

#include <utility>

namespace chkcert
{
    ProbeOutcome ProbeOutcome::Success(TimePoint not_before, TimePoint not_after)
    {
        return ProbeOutcome{kSuccess, not_before, not_after, std::string()};
    }

    ProbeOutcome ProbeOutcome::Failure(ProbeStatus status, std::string reason)
    {
        return ProbeOutcome{status, TimePoint(), TimePoint(), std::move(reason)};
    }

    bool ProbeOutcome::HasError() const
    {
        return status != kSuccess;
    }

    std::string_view ProbeOutcome::Message() const
    {
        switch (status)
        {
        case kSuccess:
            return "success";
        case kResolveError:
            return "resolve target domain name failed";
        case kConnectError:
            return "connect to target endpoint failed";
        case kHandshakeError:
            return "handshake with target endpoint failed";
        case kNoCertificate:
            return "target endpoint presented no certificate";
        case kTimeout:
            return "target endpoint timed out";
        default:
            return "unknown";
        }
    }

    bool CheckResult::HasError() const
    {
        return status != kOk;
    }

    std::string_view StatusName(CheckStatus status)
    {
        return status == kOk ? "ok" : "error";
    }
} // namespace chkcert
