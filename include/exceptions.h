#ifndef __CHKCERT_EXCEPTIONS_H__
#define __CHKCERT_EXCEPTIONS_H__

#include <stdexcept>
#include <string>

namespace chkcert
{
    // Base for everything that aborts a run. Per-host probe failures are
    // never thrown, they travel as ProbeOutcome / CheckResult data.
    class CertCheckException : public std::runtime_error
    {
    public:
        explicit CertCheckException(const std::string& message)
            : std::runtime_error(message) {}
    };

    // Missing or conflicting flags, missing credentials, unwritable paths.
    class ConfigException : public CertCheckException
    {
    public:
        explicit ConfigException(const std::string& message)
            : CertCheckException(message) {}
    };

    // A host list backend could not deliver a usable list.
    class BackendException : public CertCheckException
    {
    public:
        explicit BackendException(const std::string& message)
            : CertCheckException("Backend error: " + message) {}
    };
} // namespace chkcert

#endif
