#include "app.h"

#include <curl/curl.h>
#include <optional>
#include <utility>

#include "exceptions.h"
#include "exporters.h"
#include "formatter.h"
#include "host_source.h"

namespace chkcert
{
    namespace
    {
        // Holds libcurl's global state for the duration of a backend fetch.
        class CurlGlobal
        {
        public:
            CurlGlobal()
            {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                    throw BackendException("curl_global_init failed");
            }
            ~CurlGlobal() { curl_global_cleanup(); }
            CurlGlobal(const CurlGlobal&) = delete;
            CurlGlobal& operator=(const CurlGlobal&) = delete;
        };
    } // namespace

    CheckRunner::CheckRunner(Prober& prober, const Config& config, Logger logger)
        : prober_(prober),
          config_(config),
          logger_(std::move(logger)),
          stop_(nullptr)
    {
    }

    void CheckRunner::SetStopFlag(const std::atomic_bool* stop)
    {
        stop_ = stop;
    }

    void CheckRunner::SetNowFunc(Aggregator::NowFunc now)
    {
        now_ = std::move(now);
    }

    std::vector<std::string> CheckRunner::LoadHosts(const CliOptions& options) const
    {
        switch (options.Source())
        {
        case kSourceFile:
            logger_->info("Reading domains from '{}'", options.input_filename);
            return ReadHostFile(options.input_filename);
        case kSourceDomain:
            return {options.domain};
        case kSourceBackend:
        {
            auto backend = BackendRegistry::WithDefaults().Create(options.backend_name, config_, logger_);
            CurlGlobal curl_global;
            std::vector<std::string> hosts;
            backend->Fetch(hosts);
            return hosts;
        }
        default:
            throw ConfigException("Specify one of these: input file, domain, domain backend");
        }
    }

    int CheckRunner::Run(const CliOptions& options, std::ostream& out)
    {
        std::optional<MetricsExporter> metrics;
        if (options.generate_metrics)
        {
            if (!config_.Has(Config::kPrometheusExportFilename))
                throw ConfigException("PROMETHEUS_EXPORT_FILENAME is not set");
            metrics.emplace(config_.GetString(Config::kPrometheusExportFilename), logger_);
            metrics->Prepare();
        }
        else
        {
            logger_->info("Prometheus metrics generation not requested");
        }

        std::vector<std::string> hosts = LoadHosts(options);

        Aggregator aggregator(prober_, logger_);
        aggregator.SetConcurrency(options.parallel);
        RetryPolicy retry_policy;
        retry_policy.attempts = options.retries;
        aggregator.SetRetryPolicy(retry_policy);
        aggregator.SetStopFlag(stop_);
        if (now_) aggregator.SetNowFunc(now_);

        std::vector<CheckResult> results = aggregator.Run(hosts);
        const TimePoint now = aggregator.StartedAt();

        FormatOptions format_options;
        format_options.alert_limit_days = options.alert_limit_days;
        format_options.only_alerting = options.only_alerting;
        format_options.only_names = options.only_names;
        std::vector<FormattedRow> rows = Format(results, now, format_options);

        if (format_options.only_names)
            RenderNames(out, rows);
        else
            RenderTable(out, rows);
        out.flush();

        // Metrics carry every result in aggregator order, unfiltered.
        if (metrics)
            metrics->Write(results, now);

        // Sensor mode alarms on anything printed, not only on errors.
        if (options.sensor_mode && !rows.empty()) return 1;
        return 0;
    }
} // namespace chkcert
