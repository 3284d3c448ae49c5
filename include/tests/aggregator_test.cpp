#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "aggregator.h"
#include "logger.h"

using namespace chkcert;

namespace
{
    const TimePoint kNow = Clock::from_time_t(1700000000);
    const TimePoint kNotBefore = Clock::from_time_t(1690000000);
    const TimePoint kNotAfter = Clock::from_time_t(1710000000);

    // Answers from a per-host script; hosts without a script succeed.
    class FakeProber : public Prober
    {
    public:
        ProbeOutcome Probe(const Endpoint& endpoint) override
        {
            std::chrono::milliseconds delay{0};
            ProbeOutcome outcome = ProbeOutcome::Success(kNotBefore, kNotAfter);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                calls_.push_back(endpoint.address);
                auto it = scripts_.find(endpoint.address);
                if (it != scripts_.end() && !it->second.empty())
                {
                    outcome = it->second.front();
                    it->second.pop_front();
                }
                auto d = delays_.find(endpoint.address);
                if (d != delays_.end()) delay = d->second;
            }
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
            return outcome;
        }

        void Script(const std::string& host, std::deque<ProbeOutcome> outcomes)
        {
            scripts_[host] = std::move(outcomes);
        }

        void Delay(const std::string& host, std::chrono::milliseconds delay)
        {
            delays_[host] = delay;
        }

        size_t CallsFor(const std::string& host)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = 0;
            for (const auto& call : calls_)
                if (call == host) n++;
            return n;
        }

        std::vector<std::string> Calls()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

    private:
        std::mutex mutex_;
        std::map<std::string, std::deque<ProbeOutcome>> scripts_;
        std::map<std::string, std::chrono::milliseconds> delays_;
        std::vector<std::string> calls_;
    };

    ProbeOutcome Refused()
    {
        return ProbeOutcome::Failure(kConnectError, "Connection refused");
    }
} // namespace

class AggregatorTest : public ::testing::Test
{
protected:
    AggregatorTest()
        : aggregator_(prober_, MakeNullLogger())
    {
        aggregator_.SetNowFunc([]() -> TimePoint { return kNow; });
        RetryPolicy policy;
        policy.initial_backoff = std::chrono::milliseconds(0);
        aggregator_.SetRetryPolicy(policy);
    }

    FakeProber prober_;
    Aggregator aggregator_;
};

TEST_F(AggregatorTest, OneResultPerNonBlankEntry)
{
    std::vector<std::string> hosts = {"a.example", "", "b.example", "   ", "\t", "c.example"};
    auto results = aggregator_.Run(hosts);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].hostname, "a.example");
    EXPECT_EQ(results[1].hostname, "b.example");
    EXPECT_EQ(results[2].hostname, "c.example");
    EXPECT_EQ(prober_.Calls().size(), 3u);
}

TEST_F(AggregatorTest, BlankLineAndTwoHostsYieldTwoResultsInOrder)
{
    auto results = aggregator_.Run({"first.example", "", "second.example"});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].hostname, "first.example");
    EXPECT_EQ(results[1].hostname, "second.example");
}

TEST_F(AggregatorTest, TrimsSurroundingWhitespace)
{
    auto results = aggregator_.Run({"  padded.example\r"});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].hostname, "padded.example");
}

TEST_F(AggregatorTest, FailureDoesNotAbortBatch)
{
    prober_.Script("down.example", {Refused()});
    auto results = aggregator_.Run({"up.example", "down.example", "also-up.example"});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].status, kOk);
    EXPECT_EQ(results[1].status, kError);
    EXPECT_EQ(results[1].not_before, kNow);
    EXPECT_EQ(results[1].not_after, kNow);
    EXPECT_EQ(results[2].status, kOk);
    EXPECT_EQ(results[2].not_after, kNotAfter);
}

TEST_F(AggregatorTest, EmptyInputGivesEmptyResult)
{
    EXPECT_TRUE(aggregator_.Run({}).empty());
    EXPECT_TRUE(aggregator_.Run({"", " "}).empty());
    EXPECT_EQ(aggregator_.StartedAt(), kNow);
}

TEST_F(AggregatorTest, SingleAttemptByDefault)
{
    prober_.Script("flaky.example", {Refused(), Refused()});
    auto results = aggregator_.Run({"flaky.example"});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, kError);
    EXPECT_EQ(prober_.CallsFor("flaky.example"), 1u);
}

TEST_F(AggregatorTest, RetriesUntilSuccess)
{
    RetryPolicy policy;
    policy.attempts = 3;
    policy.initial_backoff = std::chrono::milliseconds(1);
    aggregator_.SetRetryPolicy(policy);
    prober_.Script("flaky.example", {Refused(), Refused()});

    auto results = aggregator_.Run({"flaky.example"});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, kOk);
    EXPECT_EQ(prober_.CallsFor("flaky.example"), 3u);
}

TEST_F(AggregatorTest, RetriesAreBounded)
{
    RetryPolicy policy;
    policy.attempts = 2;
    policy.initial_backoff = std::chrono::milliseconds(1);
    aggregator_.SetRetryPolicy(policy);
    prober_.Script("down.example", {Refused(), Refused(), Refused()});

    auto results = aggregator_.Run({"down.example"});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, kError);
    EXPECT_EQ(prober_.CallsFor("down.example"), 2u);
}

TEST_F(AggregatorTest, SuccessIsNotRetried)
{
    RetryPolicy policy;
    policy.attempts = 5;
    aggregator_.SetRetryPolicy(policy);
    aggregator_.Run({"up.example"});
    EXPECT_EQ(prober_.CallsFor("up.example"), 1u);
}

TEST_F(AggregatorTest, ParallelRunKeepsInputOrder)
{
    std::vector<std::string> hosts;
    for (int i = 0; i < 12; i++)
    {
        std::string host = "h" + std::to_string(i) + ".example";
        // Earlier hosts finish last.
        prober_.Delay(host, std::chrono::milliseconds((12 - i) * 5));
        if (i % 3 == 0) prober_.Script(host, {Refused()});
        hosts.push_back(host);
    }
    aggregator_.SetConcurrency(4);

    auto results = aggregator_.Run(hosts);

    ASSERT_EQ(results.size(), hosts.size());
    for (size_t i = 0; i < hosts.size(); i++)
    {
        EXPECT_EQ(results[i].hostname, hosts[i]);
        EXPECT_EQ(results[i].status, i % 3 == 0 ? kError : kOk);
    }
}

TEST_F(AggregatorTest, StopFlagPreventsNewProbes)
{
    std::atomic_bool stop(true);
    aggregator_.SetStopFlag(&stop);
    auto results = aggregator_.Run({"a.example", "b.example"});
    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(prober_.Calls().empty());
}

TEST_F(AggregatorTest, ExplicitPortIsPassedToProber)
{
    auto results = aggregator_.Run({"a.example:8443"});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].hostname, "a.example:8443");
    EXPECT_EQ(prober_.CallsFor("a.example"), 1u);
}

TEST(NonBlankEntriesTest, DropsBlankAndTrims)
{
    auto entries = NonBlankEntries({" x ", "", "\t\t", "y"});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0], "x");
    EXPECT_EQ(entries[1], "y");
}
