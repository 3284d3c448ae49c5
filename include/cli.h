#ifndef __CLI_H__
#define __CLI_H__

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace chkcert
{
    static constexpr const char* kVersion = "2.0.0";

    enum SourceKind
    {
        kSourceNone = 0,
        kSourceFile,
        kSourceDomain,
        kSourceBackend,
    };

    struct CliOptions
    {
        std::string backend_name;
        std::string input_filename;
        std::string domain;
        bool sensor_mode = false;
        bool only_alerting = false;
        bool only_names = false;
        int alert_limit_days = 7;
        bool generate_metrics = false;
        size_t retries = 1;
        size_t timeout_secs = 10;
        size_t parallel = 1;
        bool verbose = false;
        bool help = false;
        bool version = false;

        SourceKind Source() const;
    };

    // Parses everything after argv[0]. Throws ConfigException on unknown
    // flags, repeated flags, missing or malformed values, and on a source
    // selection that is not exactly one of -i, -d, -b (unless -h or -V).
    CliOptions ParseArguments(const std::vector<std::string>& args);

    void PrintHelp(std::ostream& os, const std::string& program);
} // namespace chkcert

#endif
