#include "exporters.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string_view>
#include <utility>

#include "exceptions.h"

namespace chkcert
{
    namespace
    {
        std::string EscapeLabelValue(const std::string& value)
        {
            std::string out;
            out.reserve(value.size());
            for (char c : value)
            {
                switch (c)
                {
                case '\\':
                    out += "\\\\";
                    break;
                case '"':
                    out += "\\\"";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                default:
                    out += c;
                }
            }
            return out;
        }
    } // namespace

    void RenderTable(std::ostream& os, const std::vector<FormattedRow>& rows)
    {
        static constexpr size_t column_num = 5;
        std::array<size_t, column_num> widths{};
        auto cells = [](const FormattedRow& row) -> std::array<std::string_view, column_num>
        {
            return {row.hostname, row.not_before, row.not_after, row.days_remaining, StatusName(row.status)};
        };
        for (const auto& row : rows)
        {
            auto values = cells(row);
            for (size_t i = 0; i < column_num; i++)
                widths[i] = std::max(widths[i], values[i].size());
        }
        for (const auto& row : rows)
        {
            auto values = cells(row);
            for (size_t i = 0; i < column_num; i++)
            {
                os << values[i];
                if (i + 1 < column_num)
                    os << std::string(widths[i] - values[i].size() + 2, ' ');
            }
            os << '\n';
        }
    }

    void RenderNames(std::ostream& os, const std::vector<FormattedRow>& rows)
    {
        for (const auto& row : rows)
            os << row.hostname << '\n';
    }

    MetricsExporter::MetricsExporter(std::string path, Logger logger)
        : path_(std::move(path)),
          logger_(std::move(logger)),
          replace_by_rename_(true)
    {
    }

    std::string MetricsExporter::TempPath() const
    {
        return path_ + ".tmp";
    }

    void MetricsExporter::Prepare()
    {
        // Append mode creates the file but leaves the last run's metrics
        // visible until Write replaces them.
        {
            std::ofstream ofs(path_, std::ios::out | std::ios::app);
            if (!ofs.is_open())
                throw ConfigException("Can't create Prometheus metrics file '" + path_ + "'");
        }

        const std::string tmp_path = TempPath();
        bool tmp_created = false;
        {
            std::ofstream tmp(tmp_path, std::ios::out | std::ios::trunc);
            tmp_created = tmp.is_open();
        }
        if (tmp_created && std::remove(tmp_path.c_str()) != 0)
            throw ConfigException("Can't remove '" + tmp_path + "': " + std::strerror(errno));
        replace_by_rename_ = tmp_created;
        if (!replace_by_rename_)
            logger_->warn("Can't create '{}', metrics file will be overwritten in place", tmp_path);
        logger_->info("Prometheus metrics file touched: '{}'", path_);
    }

    void MetricsExporter::Render(std::ostream& os, const std::vector<CheckResult>& results, TimePoint now)
    {
        os << "# HELP " << kMetricName << " Days until HTTPs SSL certificate expires\n"
           << "# TYPE " << kMetricName << " gauge\n";
        for (const auto& result : results)
        {
            os << kMetricName
               << "{domain=\"" << EscapeLabelValue(result.hostname)
               << "\",outcome=\"" << StatusName(result.status) << "\"} "
               << DaysRemaining(result.not_after, now) << '\n';
        }
    }

    void MetricsExporter::WriteInPlace(const std::vector<CheckResult>& results, TimePoint now) const
    {
        std::ofstream ofs(path_, std::ios::out | std::ios::trunc);
        if (!ofs.is_open())
            throw CertCheckException("Can't write Prometheus metrics file '" + path_ + "'");
        Render(ofs, results, now);
        ofs.flush();
        if (!ofs)
            throw CertCheckException("Failed writing Prometheus metrics file '" + path_ + "'");
    }

    void MetricsExporter::Write(const std::vector<CheckResult>& results, TimePoint now) const
    {
        logger_->info("Exporting Prometheus metrics into file '{}'", path_);
        if (!replace_by_rename_)
        {
            WriteInPlace(results, now);
            logger_->info("Finished Prometheus metrics export, {} items", results.size());
            return;
        }
        const std::string tmp_path = TempPath();
        {
            std::ofstream ofs(tmp_path, std::ios::out | std::ios::trunc);
            if (!ofs.is_open())
                throw CertCheckException("Can't write Prometheus metrics file '" + tmp_path + "'");
            Render(ofs, results, now);
            ofs.flush();
            if (!ofs)
                throw CertCheckException("Failed writing Prometheus metrics file '" + tmp_path + "'");
        }
        if (std::rename(tmp_path.c_str(), path_.c_str()) != 0)
        {
            std::string reason = std::strerror(errno);
            if (std::remove(tmp_path.c_str()) != 0)
                logger_->warn("Can't remove '{}'", tmp_path);
            throw CertCheckException("Can't replace Prometheus metrics file '" + path_ + "': " + reason);
        }
        logger_->info("Finished Prometheus metrics export, {} items", results.size());
    }
} // namespace chkcert
