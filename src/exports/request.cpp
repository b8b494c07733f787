#include "exports.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace exports
{
    namespace
    {
        bool needs_year(ExportKind kind)
        {
            switch (kind)
            {
                case ExportKind::Year:
                case ExportKind::Month:
                case ExportKind::Statistics:
                case ExportKind::YearlyStatistics:
                    return true;
                default:
                    return false;
            }
        }

        bool is_month(const std::string& month)
        {
            if (month.size() != 2 || !util::is_digits(month))
                return false;

            auto [ec, value] { util::parse<int>(month) };
            return ec == std::errc{} && value >= 1 && value <= 12;
        }
    }

    std::optional<ExportKind> parse_kind(std::string_view name)
    {
        auto lowered = util::to_lower(std::string{name});
        if (lowered == "basic")
            return ExportKind::Basic;
        else if (lowered == "year")
            return ExportKind::Year;
        else if (lowered == "month")
            return ExportKind::Month;
        else if (lowered == "statistics" || lowered == "stats")
            return ExportKind::Statistics;
        else if (lowered == "yearly-statistics" || lowered == "yearly_statistics")
            return ExportKind::YearlyStatistics;
        else if (lowered == "items" || lowered == "products")
            return ExportKind::Items;
        return std::nullopt;
    }

    std::string_view kind_name(ExportKind kind)
    {
        switch (kind)
        {
            case ExportKind::Basic: return "basic";
            case ExportKind::Year: return "year";
            case ExportKind::Month: return "month";
            case ExportKind::Statistics: return "statistics";
            case ExportKind::YearlyStatistics: return "yearly-statistics";
            case ExportKind::Items: return "items";
        }
        return "unknown";
    }

    std::optional<Language> parse_language(std::string_view name)
    {
        auto lowered = util::to_lower(std::string{name});
        if (lowered == "en" || lowered == "english")
            return Language::English;
        else if (lowered == "es" || lowered == "spanish" || lowered == "español")
            return Language::Spanish;
        return std::nullopt;
    }

    void validate(const ExportRequest& request)
    {
        if (request.year && (request.year->size() != 4 || !util::is_digits(*request.year)))
            throw std::invalid_argument("year must be four digits, got '" + *request.year + "'");

        if (request.month && !is_month(*request.month))
            throw std::invalid_argument("month must be between 01 and 12, got '" + *request.month + "'");

        if (needs_year(request.kind) && !request.year)
            throw std::invalid_argument("the " + std::string{kind_name(request.kind)} + " export needs a year");

        if (request.kind == ExportKind::Month && !request.month)
            throw std::invalid_argument("the month export needs a month");

        if (request.month && !request.year)
            throw std::invalid_argument("a month was given without a year");
    }

    bool run_export(const ExportRequest& request, const TransactionList* transactions, sinks::FileSink& sink)
    {
        validate(request);

        if (transactions == nullptr)
            return false;

        switch (request.kind)
        {
            case ExportKind::Basic:
                return download_basic_data(transactions, sink);

            case ExportKind::Year:
                return download_year_transactions(transactions, *request.year, sink);

            case ExportKind::Month:
                return download_monthly_transactions(transactions, *request.year, *request.month, sink);

            case ExportKind::Statistics:
                return download_statistics(transactions, *request.year, sink);

            case ExportKind::YearlyStatistics:
                return download_yearly_statistics(transactions, *request.year, sink);

            case ExportKind::Items:
            {
                if (!request.year)
                    return download_aggregated_items(transactions, request.lang, sink);

                auto period = request.month ? *request.year + "-" + *request.month : *request.year;
                auto selected = select_period(*transactions, period);
                return download_aggregated_items(&selected, request.lang, sink, period);
            }
        }

        spdlog::error("Unhandled export kind {}", (int)request.kind);
        return false;
    }
}
