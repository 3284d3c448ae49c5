#ifndef __APP_H__
#define __APP_H__

#include <atomic>
#include <ostream>
#include <string>
#include <vector>

#include "aggregator.h"
#include "cert_probe.h"
#include "cli.h"
#include "config.h"
#include "logger.h"

namespace chkcert
{
    // One full check: metrics file preparation, host loading, probing,
    // table or names output, metrics export.
    class CheckRunner
    {
    public:
        CheckRunner(Prober& prober, const Config& config, Logger logger);

        // Returns the exit code: 1 in sensor mode when any row was printed,
        // 0 otherwise. Configuration problems throw before the first probe.
        int Run(const CliOptions& options, std::ostream& out);

        void SetStopFlag(const std::atomic_bool* stop);
        void SetNowFunc(Aggregator::NowFunc now);

    protected:
        std::vector<std::string> LoadHosts(const CliOptions& options) const;

        Prober& prober_;
        const Config& config_;
        Logger logger_;
        const std::atomic_bool* stop_;
        Aggregator::NowFunc now_;
    };
} // namespace chkcert

#endif
