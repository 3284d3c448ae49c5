#ifndef __EXPORTERS_H__
#define __EXPORTERS_H__

#include <ostream>
#include <string>
#include <vector>

#include "cert_types.h"
#include "formatter.h"
#include "logger.h"

namespace chkcert
{
    // hostname, not before, not after, days, status; columns padded to the
    // widest cell and separated by two spaces.
    void RenderTable(std::ostream& os, const std::vector<FormattedRow>& rows);

    void RenderNames(std::ostream& os, const std::vector<FormattedRow>& rows);

    // Prometheus text file with the days-until-expiry gauge.
    class MetricsExporter
    {
    public:
        static constexpr const char* kMetricName = "check_certificates_expiration";

        MetricsExporter(std::string path, Logger logger);

        // Checks up front that the file can be created and written, and
        // whether a temporary sibling can be created next to it. Throws
        // ConfigException when the file itself is not writable.
        void Prepare();

        // One line per result, in the order given. Overwrites the file through
        // a temporary sibling and a rename, or in place when Prepare found the
        // directory read-only. Throws CertCheckException on failure.
        void Write(const std::vector<CheckResult>& results, TimePoint now) const;

        static void Render(std::ostream& os, const std::vector<CheckResult>& results, TimePoint now);

    protected:
        std::string TempPath() const;
        void WriteInPlace(const std::vector<CheckResult>& results, TimePoint now) const;

        std::string path_;
        Logger logger_;
        bool replace_by_rename_;
    };
} // namespace chkcert

#endif
