#include <openssl/asn1.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <ctime>
#include <memory>
#include <string>
#include <utility>
#include "cert_probe.h"

namespace chkcert
{
    namespace
    {
        bool Asn1TimeToTimePoint(const ASN1_TIME* asn1_time, TimePoint& out)
        {
            if (asn1_time == nullptr) return false;
            struct tm time_tm = {};
            if (ASN1_TIME_to_tm(asn1_time, &time_tm) != 1) return false;
            out = Clock::from_time_t(timegm(&time_tm));
            return true;
        }

        ProbeOutcome ReadPeerCertificate(SSL* ssl)
        {
            std::unique_ptr<X509, decltype(&X509_free)> cert(SSL_get_peer_certificate(ssl), X509_free);
            if (!cert) return ProbeOutcome::Failure(kNoCertificate, "no peer certificate");
            TimePoint not_before;
            TimePoint not_after;
            if (!Asn1TimeToTimePoint(X509_get0_notBefore(cert.get()), not_before) ||
                !Asn1TimeToTimePoint(X509_get0_notAfter(cert.get()), not_after))
                return ProbeOutcome::Failure(kNoCertificate, "unreadable certificate validity");
            return ProbeOutcome::Success(not_before, not_after);
        }
    } // namespace

    Endpoint ParseEndpoint(std::string_view text, unsigned short default_port)
    {
        std::string_view host = text;
        std::string_view port;
        if (!text.empty() && text.front() == '[')
        {
            size_t close = text.find(']');
            if (close == std::string_view::npos) return Endpoint{std::string(text), default_port};
            host = text.substr(1, close - 1);
            if (close + 1 < text.size())
            {
                if (text[close + 1] != ':') return Endpoint{std::string(text), default_port};
                port = text.substr(close + 2);
            }
        }
        else
        {
            size_t colon = text.find(':');
            // More than one colon is a bare IPv6 literal.
            if (colon != std::string_view::npos && text.find(':', colon + 1) == std::string_view::npos)
            {
                host = text.substr(0, colon);
                port = text.substr(colon + 1);
            }
        }
        if (port.empty()) return Endpoint{std::string(host), default_port};
        unsigned long value = 0;
        for (char c : port)
        {
            if (c < '0' || c > '9') return Endpoint{std::string(text), default_port};
            value = value * 10 + static_cast<unsigned long>(c - '0');
            if (value > 65535) return Endpoint{std::string(text), default_port};
        }
        if (value == 0) return Endpoint{std::string(text), default_port};
        return Endpoint{std::string(host), static_cast<unsigned short>(value)};
    }

    bool IsDomain(std::string_view address)
    {
        std::error_code ec;
        asio::ip::make_address(std::string(address), ec);
        return static_cast<bool>(ec);
    }

    TlsProber::TlsProber(Logger logger)
        : logger_(std::move(logger)),
          connect_timeout_(kDefaultConnectTimeout)
    {
    }

    TlsProber::~TlsProber()
    {
    }

    void TlsProber::SetConnectTimeout(std::chrono::milliseconds timeout)
    {
        connect_timeout_ = timeout;
    }

    ProbeOutcome TlsProber::Probe(const Endpoint& endpoint)
    {
        const std::string& address = endpoint.address;
        logger_->info("Starting https ssl certificate validation for {}:{}", address, endpoint.port);
        try
        {
            asio::io_context ios;
            asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
            // Only the leaf's dates are wanted, an untrusted chain still has them.
            ssl_ctx.set_verify_mode(asio::ssl::verify_none);
            asio::ip::tcp::resolver resolver(ios);
            asio::ssl::stream<asio::ip::tcp::socket> stream(ios, ssl_ctx);
            asio::steady_timer timer(ios);

            bool timed_out = false;
            ProbeOutcome outcome = ProbeOutcome::Failure(kTimeout, "probe did not complete");

            auto fail = [&](ProbeStatus status, const std::error_code& ec)
            {
                if (timed_out)
                    outcome = ProbeOutcome::Failure(kTimeout, "no answer within " + std::to_string(connect_timeout_.count()) + " ms");
                else
                    outcome = ProbeOutcome::Failure(status, ec.message());
                timer.cancel();
            };

            timer.expires_after(connect_timeout_);
            timer.async_wait([&](const std::error_code& ec) -> void
                             {
                                 if (ec) return;
                                 timed_out = true;
                                 resolver.cancel();
                                 std::error_code close_ec;
                                 stream.lowest_layer().close(close_ec);
                                 if (close_ec)
                                     logger_->debug("Closing socket for {} after timeout: {}", address, close_ec.message());
                             });

            resolver.async_resolve(
                address, std::to_string(endpoint.port),
                [&](const std::error_code& ec, asio::ip::tcp::resolver::results_type results) -> void
                {
                    // getaddrinfo is not cancellable; a late answer still counts as a timeout.
                    if (ec || timed_out)
                    {
                        fail(kResolveError, ec);
                        return;
                    }
                    asio::async_connect(
                        stream.lowest_layer(), results,
                        [&](const std::error_code& ec, const asio::ip::tcp::endpoint& peer) -> void
                        {
                            if (ec)
                            {
                                fail(kConnectError, ec);
                                return;
                            }
                            logger_->debug("Connected to {} for {}", peer.address().to_string(), address);
                            if (IsDomain(address) && !SSL_set_tlsext_host_name(stream.native_handle(), address.c_str()))
                            {
                                outcome = ProbeOutcome::Failure(kHandshakeError, "failed to set server name indication");
                                timer.cancel();
                                return;
                            }
                            stream.async_handshake(
                                asio::ssl::stream_base::client,
                                [&](const std::error_code& ec) -> void
                                {
                                    if (ec)
                                    {
                                        fail(kHandshakeError, ec);
                                        return;
                                    }
                                    timer.cancel();
                                    outcome = ReadPeerCertificate(stream.native_handle());
                                });
                        });
                });

            ios.run();

            if (outcome.HasError())
                logger_->warn("Can't read certificate of {}: {} ({})", address, outcome.Message(), outcome.reason);
            else
                logger_->info("{} Not before {} Not after {}", address,
                              Clock::to_time_t(outcome.not_before), Clock::to_time_t(outcome.not_after));
            return outcome;
        }
        catch (const std::exception& e)
        {
            // asio throws from context setup (e.g. no SSL method available).
            logger_->warn("Probe of {} failed: {}", address, e.what());
            return ProbeOutcome::Failure(kHandshakeError, e.what());
        }
    }
} // namespace chkcert
