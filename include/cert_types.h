#ifndef __CERT_TYPES_H__
#define __CERT_TYPES_H__

#include <chrono>
#include <string>
#include <string_view>

namespace chkcert
{
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::system_clock::time_point;

    struct Endpoint
    {
        std::string address;
        unsigned short port;
    };

    enum ProbeStatus
    {
        kSuccess = 0,
        kResolveError,
        kConnectError,
        kHandshakeError,
        kNoCertificate,
        kTimeout,
    };

    // What a single TLS probe learned about one host.
    struct ProbeOutcome
    {
        ProbeStatus status;
        TimePoint not_before;
        TimePoint not_after;
        std::string reason;

        static ProbeOutcome Success(TimePoint not_before, TimePoint not_after);
        static ProbeOutcome Failure(ProbeStatus status, std::string reason);

        bool HasError() const;
        std::string_view Message() const;
    };

    enum CheckStatus
    {
        kOk = 0,
        kError,
    };

    // Canonical per-host record. On kError both timestamps hold the check time.
    struct CheckResult
    {
        std::string hostname;
        TimePoint not_before;
        TimePoint not_after;
        CheckStatus status;

        bool HasError() const;
    };

    std::string_view StatusName(CheckStatus status);
} // namespace chkcert

#endif
