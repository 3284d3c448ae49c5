#include "cli.h"

#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

#include "exceptions.h"

namespace chkcert
{
    namespace
    {
        long ParseLong(const std::string& flag, const std::string& value)
        {
            try
            {
                size_t idx = 0;
                long v = std::stol(value, &idx, 10);
                if (idx == value.size()) return v;
            }
            catch (const std::exception&)
            {
                // fall through to the uniform message below
            }
            throw ConfigException("Invalid value for " + flag + ": '" + value + "'");
        }

        int ParseInt(const std::string& flag, const std::string& value)
        {
            long v = ParseLong(flag, value);
            if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
                throw ConfigException("Value for " + flag + " is out of range: '" + value + "'");
            return static_cast<int>(v);
        }

        size_t ParsePositive(const std::string& flag, const std::string& value)
        {
            long v = ParseLong(flag, value);
            if (v <= 0) throw ConfigException("Value for " + flag + " must be a positive integer: '" + value + "'");
            return static_cast<size_t>(v);
        }
    } // namespace

    SourceKind CliOptions::Source() const
    {
        if (!input_filename.empty()) return kSourceFile;
        if (!domain.empty()) return kSourceDomain;
        if (!backend_name.empty()) return kSourceBackend;
        return kSourceNone;
    }

    CliOptions ParseArguments(const std::vector<std::string>& args)
    {
        CliOptions options;
        std::set<std::string> seen;

        // Returns the short form of a known flag, empty otherwise.
        auto canonical = [](const std::string& arg) -> std::string
        {
            static const std::pair<const char*, const char*> names[] = {
                {"-b", "--backend-name"}, {"-i", "--input-filename"}, {"-d", "--domain"},
                {"-s", "--sensor-mode"}, {"-l", "--only-alerting"}, {"-n", "--only-names"},
                {"-A", "--alert-limit"}, {"-G", "--generate-metrics"}, {"-R", "--retries"},
                {"-t", "--timeout"}, {"-P", "--parallel"}, {"-v", "--verbose"},
                {"-h", "--help"}, {"-V", "--version"},
            };
            for (const auto& name : names)
            {
                if (arg == name.first || arg == name.second) return name.first;
            }
            return std::string();
        };

        for (size_t i = 0; i < args.size(); i++)
        {
            const std::string flag = canonical(args[i]);
            if (flag.empty()) throw ConfigException("Unknown parameter passed: '" + args[i] + "'");
            if (!seen.insert(flag).second) throw ConfigException("Argument already set: " + flag);

            auto value = [&]() -> std::string
            {
                if (i + 1 >= args.size() || args[i + 1].empty())
                    throw ConfigException("Missing value for " + flag);
                return args[++i];
            };

            if (flag == "-b") options.backend_name = value();
            else if (flag == "-i") options.input_filename = value();
            else if (flag == "-d") options.domain = value();
            else if (flag == "-s") options.sensor_mode = true;
            else if (flag == "-l") options.only_alerting = true;
            else if (flag == "-n") options.only_names = true;
            else if (flag == "-A") options.alert_limit_days = ParseInt(flag, value());
            else if (flag == "-G") options.generate_metrics = true;
            else if (flag == "-R") options.retries = ParsePositive(flag, value());
            else if (flag == "-t") options.timeout_secs = ParsePositive(flag, value());
            else if (flag == "-P") options.parallel = ParsePositive(flag, value());
            else if (flag == "-v") options.verbose = true;
            else if (flag == "-h") options.help = true;
            else if (flag == "-V") options.version = true;
        }

        if (options.help || options.version) return options;

        int sources = static_cast<int>(!options.input_filename.empty()) +
                      static_cast<int>(!options.domain.empty()) +
                      static_cast<int>(!options.backend_name.empty());
        if (sources == 0)
            throw ConfigException("Specify one of these: input file, domain, domain backend");
        if (!options.input_filename.empty() && !options.domain.empty())
            throw ConfigException("Only one parameter is allowed: input file or domain");
        if (sources > 1)
            throw ConfigException("Only one parameter is allowed: input file, domain or domain backend");
        return options;
    }

    void PrintHelp(std::ostream& os, const std::string& program)
    {
        os << "SSL Certificate checker\n"
           << "Version: " << kVersion << "\n\n"
           << "Usage: " << program
           << " [-h] [-v] [-s] [-l] [-n] [-A n] [-G] [-R n] [-t secs] [-P n] -i input_filename | -d domain_name | -b backend_name\n"
           << R"(
   -b, --backend-name       Domain list backend name (pastebin)
   -i, --input-filename     Path to the list of domains to check
   -d, --domain             Domain name to check
   -s, --sensor-mode        Exit with non-zero if there was something to print out
   -l, --only-alerting      Show only alerting domains (expiring soon and erroneous)
   -n, --only-names         Show only domain names instead of the full table
   -A, --alert-limit        Set threshold of upcoming expiration alert to n days (default 7)
   -G, --generate-metrics   Generates a Prometheus metrics file (PROMETHEUS_EXPORT_FILENAME)
   -R, --retries            Attempts per domain, with doubling backoff (default 1)
   -t, --timeout            Seconds allowed for connect and handshake (default 10)
   -P, --parallel           Domains probed at once (default 1)
   -v, --verbose            Enable debug output
   -V, --version            Show version
   -h, --help               Show help

file format:
domain per line in the text file, optional :port, blank lines ignored.
www.google.com
github.com:443

configuration:
environment variables or a .config file of KEY=VALUE lines in the working
directory: PROMETHEUS_EXPORT_FILENAME, PASTEBIN_USERKEY, PASTEBIN_DEVKEY,
PASTEBIN_PASTEID, LOG_LEVEL.
)";
    }
} // namespace chkcert
