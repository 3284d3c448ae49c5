#include "formatter.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <ratio>
#include <sstream>

namespace chkcert
{
    namespace
    {
        constexpr std::int64_t kSecondsPerDay = 86400;
        constexpr const char* kErrorField = "error";

        std::int64_t SortKey(const FormattedRow& row)
        {
            return row.status == kOk ? row.days : std::numeric_limits<std::int64_t>::min();
        }
    } // namespace

    std::int64_t DaysRemaining(TimePoint not_after, TimePoint now)
    {
        using Days = std::chrono::duration<std::int64_t, std::ratio<kSecondsPerDay>>;
        return std::chrono::floor<Days>(not_after - now).count();
    }

    std::string FormatTimestamp(TimePoint tp)
    {
        std::time_t tt = Clock::to_time_t(tp);
        struct tm tm;
        localtime_r(&tt, &tm);
        std::stringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::vector<FormattedRow> Format(const std::vector<CheckResult>& results, TimePoint now,
                                     const FormatOptions& options)
    {
        std::vector<FormattedRow> rows;
        rows.reserve(results.size());
        for (const auto& result : results)
        {
            if (result.HasError())
            {
                rows.push_back(FormattedRow{result.hostname, kErrorField, kErrorField, kErrorField, 0, kError});
                continue;
            }
            std::int64_t days = DaysRemaining(result.not_after, now);
            if (options.only_alerting && days > options.alert_limit_days) continue;
            rows.push_back(FormattedRow{result.hostname,
                                        FormatTimestamp(result.not_before),
                                        FormatTimestamp(result.not_after),
                                        std::to_string(days),
                                        days,
                                        kOk});
        }
        std::stable_sort(rows.begin(), rows.end(),
                         [](const FormattedRow& a, const FormattedRow& b) -> bool
                         {
                             return SortKey(a) < SortKey(b);
                         });
        return rows;
    }
} // namespace chkcert
