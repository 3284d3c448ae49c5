#ifndef __AGGREGATOR_H__
#define __AGGREGATOR_H__

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "cert_probe.h"
#include "cert_types.h"
#include "logger.h"

namespace chkcert
{
    static constexpr size_t kMaxConcurrency = 64;

    struct RetryPolicy
    {
        // Total attempts per host, 1 means no retry.
        size_t attempts = 1;
        std::chrono::milliseconds initial_backoff{1000};
        std::chrono::milliseconds max_backoff{30000};
    };

    // Trimmed copy of every entry that is not blank, input order kept.
    std::vector<std::string> NonBlankEntries(const std::vector<std::string>& hosts);

    // Probes and classifies a host list. Produces exactly one CheckResult per
    // non-blank entry, in input order, whatever order the probes finish in.
    class Aggregator
    {
    public:
        using NowFunc = std::function<TimePoint()>;

        Aggregator(Prober& prober, Logger logger);
        ~Aggregator();

        std::vector<CheckResult> Run(const std::vector<std::string>& hosts);

        // Number of probes in flight at once; 1 keeps the batch sequential.
        void SetConcurrency(size_t concurrency_num);
        void SetRetryPolicy(const RetryPolicy& policy);
        // When the flag turns true no new host is started; in-flight ones finish.
        void SetStopFlag(const std::atomic_bool* stop);
        void SetNowFunc(NowFunc now);

        // Time taken at the start of the last Run. Failed hosts carry it as
        // both timestamps, so formatting must use the same value.
        TimePoint StartedAt() const;

    protected:
        CheckResult CheckOne(const std::string& entry);
        ProbeOutcome ProbeWithRetry(const Endpoint& endpoint);
        bool StopRequested() const;
        void Backoff(std::chrono::milliseconds delay) const;

        Prober& prober_;
        Logger logger_;
        size_t concurrency_num_;
        RetryPolicy retry_policy_;
        const std::atomic_bool* stop_;
        NowFunc now_;
        TimePoint started_at_;
    };
} // namespace chkcert

#endif
