#include "aggregator.h"

#include <algorithm>
#include <optional>
#include <thread>
#include <utility>

#include "classifier.h"

namespace chkcert
{
    std::vector<std::string> NonBlankEntries(const std::vector<std::string>& hosts)
    {
        static constexpr std::string_view empty_strs = " \t\r\n";
        std::vector<std::string> entries;
        entries.reserve(hosts.size());
        for (const auto& host : hosts)
        {
            size_t begin_index = host.find_first_not_of(empty_strs);
            if (begin_index == std::string::npos) continue;
            size_t end_index = host.find_last_not_of(empty_strs);
            entries.emplace_back(host, begin_index, end_index - begin_index + 1);
        }
        return entries;
    }

    Aggregator::Aggregator(Prober& prober, Logger logger)
        : prober_(prober),
          logger_(std::move(logger)),
          concurrency_num_(1),
          retry_policy_(),
          stop_(nullptr),
          now_([]() -> TimePoint { return Clock::now(); }),
          started_at_()
    {
    }

    Aggregator::~Aggregator()
    {
    }

    void Aggregator::SetConcurrency(size_t concurrency_num)
    {
        concurrency_num_ = std::clamp<size_t>(concurrency_num, 1, kMaxConcurrency);
    }

    void Aggregator::SetRetryPolicy(const RetryPolicy& policy)
    {
        retry_policy_ = policy;
        if (retry_policy_.attempts == 0) retry_policy_.attempts = 1;
    }

    void Aggregator::SetStopFlag(const std::atomic_bool* stop)
    {
        stop_ = stop;
    }

    void Aggregator::SetNowFunc(NowFunc now)
    {
        now_ = std::move(now);
    }

    TimePoint Aggregator::StartedAt() const
    {
        return started_at_;
    }

    bool Aggregator::StopRequested() const
    {
        return stop_ != nullptr && stop_->load();
    }

    void Aggregator::Backoff(std::chrono::milliseconds delay) const
    {
        static constexpr std::chrono::milliseconds slice{100};
        while (delay.count() > 0 && !StopRequested())
        {
            auto step = std::min(delay, slice);
            std::this_thread::sleep_for(step);
            delay -= step;
        }
    }

    ProbeOutcome Aggregator::ProbeWithRetry(const Endpoint& endpoint)
    {
        auto delay = retry_policy_.initial_backoff;
        ProbeOutcome outcome = prober_.Probe(endpoint);
        for (size_t attempt = 2; attempt <= retry_policy_.attempts && outcome.HasError(); attempt++)
        {
            if (StopRequested()) break;
            logger_->info("Retry #{} of {} for {} in {} ms", attempt, retry_policy_.attempts,
                          endpoint.address, delay.count());
            Backoff(delay);
            if (StopRequested()) break;
            outcome = prober_.Probe(endpoint);
            delay = std::min(delay * 2, retry_policy_.max_backoff);
        }
        return outcome;
    }

    CheckResult Aggregator::CheckOne(const std::string& entry)
    {
        logger_->info("Processing '{}'", entry);
        ProbeOutcome outcome = ProbeWithRetry(ParseEndpoint(entry));
        CheckResult result = Classify(entry, outcome, started_at_);
        if (result.HasError())
            logger_->warn("Labeling '{}' as failed to get validated", entry);
        else
            logger_->info("Adding item into full result: '{}'", entry);
        logger_->info("Finished processing '{}'", entry);
        return result;
    }

    std::vector<CheckResult> Aggregator::Run(const std::vector<std::string>& hosts)
    {
        started_at_ = now_();
        const std::vector<std::string> entries = NonBlankEntries(hosts);
        std::vector<std::optional<CheckResult>> slots(entries.size());
        std::atomic_size_t cursor(0);

        auto worker = [&]() -> void
        {
            for (;;)
            {
                if (StopRequested()) return;
                size_t index = cursor++;
                if (index >= entries.size()) return;
                slots[index] = CheckOne(entries[index]);
            }
        };

        size_t thread_num = std::min(concurrency_num_, entries.size());
        if (thread_num <= 1)
        {
            worker();
        }
        else
        {
            std::vector<std::thread> thread_list;
            thread_list.reserve(thread_num);
            for (size_t i = 0; i < thread_num; i++)
                thread_list.emplace_back(worker);
            for (auto& t : thread_list)
                t.join();
        }

        std::vector<CheckResult> results;
        results.reserve(entries.size());
        for (auto& slot : slots)
        {
            if (slot) results.push_back(std::move(*slot));
        }

        if (results.size() < entries.size())
            logger_->warn("Stopped early, {} of {} hosts were not checked", entries.size() - results.size(), entries.size());
        if (results.empty())
            logger_->warn("Couldn't process anything from the host list");
        else
            logger_->info("Processed '{}' items from the host list", results.size());
        return results;
    }
} // namespace chkcert
