#ifndef __FORMATTER_H__
#define __FORMATTER_H__

#include <cstdint>
#include <string>
#include <vector>

#include "cert_types.h"

namespace chkcert
{
    static constexpr int kDefaultAlertLimitDays = 7;

    struct FormatOptions
    {
        int alert_limit_days = kDefaultAlertLimitDays;
        bool only_alerting = false;
        bool only_names = false;
    };

    struct FormattedRow
    {
        std::string hostname;
        std::string not_before;
        std::string not_after;
        std::string days_remaining;
        // Meaningful only for kOk rows.
        std::int64_t days;
        CheckStatus status;
    };

    // floor((not_after - now) / 86400), negative once expired.
    std::int64_t DaysRemaining(TimePoint not_after, TimePoint now);

    // Local time as "YYYY-MM-DD HH:MM:SS".
    std::string FormatTimestamp(TimePoint tp);

    // Builds display rows: drops non-alerting ok rows when asked, then sorts
    // by days remaining. Error rows rank before every ok row; equal keys keep
    // input order.
    std::vector<FormattedRow> Format(const std::vector<CheckResult>& results, TimePoint now,
                                     const FormatOptions& options);
} // namespace chkcert

#endif
