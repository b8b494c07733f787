#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "models.hpp"
#include "csv/csv.hpp"
#include "sinks/file_sink.hpp"
#include "helpers/utilities.hpp"

namespace exports
{
    using models::Transaction;
    using models::TransactionList;

    struct CsvDocument
    {
        std::string content;
        std::string filename;
    };

    enum class Language
    {
        English,
        Spanish
    };

    constexpr std::string_view YEARLY_TOTAL = "YEARLY TOTAL";

    /**
     * Brings a date to YYYY-MM-DD. Dates already in that shape are untouched,
     * timestamps such as "2025-01-15T10:30:00Z" are cut down to their date, and
     * anything else is returned as it came.
     */
    std::string format_date(const std::string& date);

    /**
     * The YYYY-MM prefix of a date, or nothing when the date doesn't start with
     * one.
     */
    std::optional<std::string> month_key(std::string_view date);

    /**
     * The transactions whose date starts with the given prefix, a year
     * ("2025") or a month ("2025-01").
     */
    TransactionList select_period(const TransactionList& transactions, std::string_view prefix);

    struct BasicRow
    {
        std::string date;
        std::string merchant;
        double total;
    };

    struct YearTransactionRow
    {
        std::string date;
        std::string merchant;
        std::string alias;
        std::string category;
        double total;
        size_t item_count;
    };

    struct MonthlyItemRow
    {
        std::string transaction_id;
        std::string date;
        std::string merchant;
        std::string category;
        std::string item_name;
        std::optional<double> item_qty;
        std::optional<double> item_price;
        std::string item_category;
        std::string item_subcategory;
    };

    struct StatisticsRow
    {
        std::string category;
        size_t transaction_count;
        double total;
        double average;
        double percentage;
    };

    struct YearlyStatisticsRow
    {
        std::string month;
        std::string category;
        double total;
        size_t transaction_count;
        std::optional<double> percentage_of_month;
    };

    struct AggregatedItemRow
    {
        std::string product;
        double total;
        std::string category;
        std::string subcategory;
        size_t transaction_count;
    };

    const std::vector<csv::Column<BasicRow>>& basic_columns();
    const std::vector<csv::Column<YearTransactionRow>>& year_transaction_columns();
    const std::vector<csv::Column<MonthlyItemRow>>& monthly_item_columns();
    const std::vector<csv::Column<StatisticsRow>>& statistics_columns();
    const std::vector<csv::Column<YearlyStatisticsRow>>& yearly_statistics_columns();
    const std::vector<csv::Column<AggregatedItemRow>>& aggregated_item_columns(Language lang);

    std::vector<BasicRow> basic_rows(const TransactionList& transactions);
    std::vector<YearTransactionRow> year_transaction_rows(const TransactionList& transactions);

    /**
     * One row per line item. Transactions without an id are numbered T1, T2, ...
     * by their position in the list, and a transaction without items still gets
     * one row, with every item field left blank.
     */
    std::vector<MonthlyItemRow> monthly_item_rows(const TransactionList& transactions);

    /**
     * Totals, counts, averages and share of overall spend per category, largest
     * total first.
     */
    std::vector<StatisticsRow> category_statistics(const TransactionList& transactions);

    /**
     * Per month and category totals for one year, months in ascending order and
     * categories by descending total inside each month, followed by a
     * "YEARLY TOTAL" row per category. Records without a YYYY-MM date are
     * skipped with a warning.
     */
    std::vector<YearlyStatisticsRow> yearly_statistics(const TransactionList& transactions, std::string_view year);

    /**
     * Groups every line item by product name and merchant, largest spend first.
     * Category names are translated for the requested language.
     */
    std::vector<AggregatedItemRow> aggregate_items(const TransactionList& transactions, Language lang = Language::English);

    /**
     * Year, month and statistics documents only cover transactions dated in the
     * requested period, and there is no document when none are.
     */
    std::optional<CsvDocument> build_basic_data(const TransactionList& transactions, const std::string& today);
    std::optional<CsvDocument> build_year_transactions(const TransactionList& transactions, const std::string& year);
    std::optional<CsvDocument> build_monthly_transactions(const TransactionList& transactions, const std::string& year, const std::string& month);
    std::optional<CsvDocument> build_statistics(const TransactionList& transactions, const std::string& year);
    std::optional<CsvDocument> build_yearly_statistics(const TransactionList& transactions, const std::string& year);
    std::optional<CsvDocument> build_aggregated_items(const TransactionList& transactions, Language lang, const std::string& month_label);

    /**
     * Each download builds its document and hands it to the sink. A missing or
     * empty transaction list, or one with nothing to report, is a silent no-op:
     * the sink isn't called and the function returns false.
     *
     * @throws sinks::SinkError Whatever the sink throws is passed on.
     */
    bool download_basic_data(const TransactionList* transactions, sinks::FileSink& sink, const std::string& today = util::today_iso());
    bool download_year_transactions(const TransactionList* transactions, const std::string& year, sinks::FileSink& sink);
    bool download_monthly_transactions(const TransactionList* transactions, const std::string& year, const std::string& month, sinks::FileSink& sink);
    bool download_statistics(const TransactionList* transactions, const std::string& year, sinks::FileSink& sink);
    bool download_yearly_statistics(const TransactionList* transactions, const std::string& year, sinks::FileSink& sink);
    bool download_aggregated_items(const TransactionList* transactions, Language lang, sinks::FileSink& sink, const std::string& month_label = util::current_month());

    std::string_view translate_item_category(std::string_view category, Language lang);

    enum class ExportKind
    {
        Basic,
        Year,
        Month,
        Statistics,
        YearlyStatistics,
        Items
    };

    /**
     * One export as asked for on the command line or over HTTP. `year` is four
     * digits and `month` is "01" to "12".
     */
    struct ExportRequest
    {
        ExportKind kind = ExportKind::Basic;
        std::optional<std::string> year;
        std::optional<std::string> month;
        Language lang = Language::English;
    };

    std::optional<ExportKind> parse_kind(std::string_view name);
    std::string_view kind_name(ExportKind kind);
    std::optional<Language> parse_language(std::string_view name);

    /**
     * @throws std::invalid_argument If the year or month is malformed, or the
     *                               kind needs a period that wasn't given.
     */
    void validate(const ExportRequest& request);

    /**
     * Runs the download matching the request's kind. The basic export always
     * covers the whole list, and the items export covers the requested period
     * when one is given.
     *
     * @returns Whether anything reached the sink.
     * @throws std::invalid_argument If the request doesn't validate.
     */
    bool run_export(const ExportRequest& request, const TransactionList* transactions, sinks::FileSink& sink);

    /**
     * The answer to an export asked for over http, independent of the server
     * that sends it.
     */
    struct ExportReply
    {
        int status;
        std::string body;
        std::string content_type;
        std::map<std::string, std::string> headers;
    };

    /**
     * A `{"error": message}` json body with the given status.
     */
    ExportReply error_reply(const std::string& message, int status);

    /**
     * Runs the request into memory. A request that doesn't validate answers 400,
     * an export with nothing in it 204, a delivered export 200 with the CSV and
     * a Content-Disposition header naming the file, and anything thrown while
     * exporting 500.
     */
    ExportReply reply_to(const ExportRequest& request, const TransactionList* transactions);
    ExportReply reply_to(const ExportRequest& request, const TransactionList* transactions, sinks::MemorySink& sink);

    /**
     * The items export takes its period as a single `month` of the form YYYY-MM,
     * or a bare `year`, and its language as `en` or `es`.
     *
     * @throws std::invalid_argument If the month or language is malformed.
     */
    ExportRequest items_request(const std::optional<std::string>& year, const std::optional<std::string>& month, const std::optional<std::string>& lang);
}
