#ifndef __CERT_PROBE_H__
#define __CERT_PROBE_H__

#include <chrono>
#include <string_view>

#include "cert_types.h"
#include "logger.h"

namespace chkcert
{
    static constexpr unsigned short kDefaultPort = 443;
    static constexpr std::chrono::milliseconds kDefaultConnectTimeout{10000};

    // Splits "host", "host:port" or "[v6addr]:port". A port that does not
    // parse leaves the whole text as the address so the probe reports it.
    Endpoint ParseEndpoint(std::string_view text, unsigned short default_port = kDefaultPort);

    // true when address is not an IPv4/IPv6 literal, i.e. it needs SNI.
    bool IsDomain(std::string_view address);

    class Prober
    {
    public:
        virtual ~Prober() = default;
        // Must not throw; every failure is reported in the outcome.
        virtual ProbeOutcome Probe(const Endpoint& endpoint) = 0;
    };

    // Fetches the leaf certificate validity window over a real TLS handshake.
    // Connect and handshake share one deadline. Name resolution runs through
    // getaddrinfo, which the deadline cannot interrupt, so a slow resolver is
    // bounded by the libc resolver timeouts instead. Safe to call from
    // several threads at once: every call owns its own io_context.
    class TlsProber : public Prober
    {
    public:
        explicit TlsProber(Logger logger);
        ~TlsProber() override;

        ProbeOutcome Probe(const Endpoint& endpoint) override;
        void SetConnectTimeout(std::chrono::milliseconds timeout);

    protected:
        Logger logger_;
        std::chrono::milliseconds connect_timeout_;
    };
} // namespace chkcert

#endif
