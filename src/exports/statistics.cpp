#include "exports.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "deliver.hpp"

namespace exports
{
    using csv::column;

    namespace
    {
        struct CategoryTotals
        {
            std::string category;
            double total = 0;
            size_t count = 0;
        };

        /**
         * Category totals in first-seen order, so a later stable sort keeps ties
         * in the order the categories first showed up.
         */
        class CategoryLedger
        {
            std::vector<CategoryTotals> p_entries;
            std::unordered_map<std::string, size_t> p_index;
        public:
            CategoryTotals& operator[](const std::string& category)
            {
                auto it = p_index.find(category);
                if (it != p_index.end())
                    return p_entries[it->second];

                p_index.emplace(category, p_entries.size());
                p_entries.push_back(CategoryTotals{ category, 0, 0 });
                return p_entries.back();
            }

            void add(const std::string& category, double amount, size_t count = 1)
            {
                auto& entry = (*this)[category];
                entry.total += amount;
                entry.count += count;
            }

            [[nodiscard]] double total() const
            {
                double sum = 0;
                for (const auto& entry : p_entries)
                    sum += entry.total;
                return sum;
            }

            [[nodiscard]] inline const std::vector<CategoryTotals>& entries() const noexcept { return p_entries; }

            [[nodiscard]] std::vector<CategoryTotals> by_total_descending() const
            {
                auto sorted = p_entries;
                std::stable_sort(sorted.begin(), sorted.end(), [](const CategoryTotals& a, const CategoryTotals& b) {
                    return a.total > b.total;
                });
                return sorted;
            }
        };

        // Totals under half a cent count as zero
        double percentage_of(double part, double whole)
        {
            if (std::fabs(whole) < 0.005)
                return 0;
            return util::round_half_up(part / whole * 100);
        }
    }

    const std::vector<csv::Column<StatisticsRow>>& statistics_columns()
    {
        static const std::vector<csv::Column<StatisticsRow>> columns {
            column("Category", &StatisticsRow::category),
            column("Transaction Count", &StatisticsRow::transaction_count),
            column("Total Amount", &StatisticsRow::total),
            column("Average Amount", &StatisticsRow::average),
            column("% of Total", &StatisticsRow::percentage)
        };
        return columns;
    }

    const std::vector<csv::Column<YearlyStatisticsRow>>& yearly_statistics_columns()
    {
        static const std::vector<csv::Column<YearlyStatisticsRow>> columns {
            column("Month", &YearlyStatisticsRow::month),
            column("Category", &YearlyStatisticsRow::category),
            column("Total", &YearlyStatisticsRow::total),
            column("Transaction Count", &YearlyStatisticsRow::transaction_count),
            column("% of Monthly Spend", &YearlyStatisticsRow::percentage_of_month)
        };
        return columns;
    }

    std::vector<StatisticsRow> category_statistics(const TransactionList& transactions)
    {
        CategoryLedger ledger;
        for (const auto& t : transactions)
            ledger.add(t.category, t.total);

        double overall = ledger.total();

        std::vector<StatisticsRow> rows;
        rows.reserve(ledger.entries().size());
        for (const auto& entry : ledger.entries())
        {
            rows.push_back(StatisticsRow {
                entry.category,
                entry.count,
                util::round_to(entry.total),
                util::round_to(entry.total / (double)entry.count),
                percentage_of(entry.total, overall)
            });
        }

        std::stable_sort(rows.begin(), rows.end(), [](const StatisticsRow& a, const StatisticsRow& b) {
            return a.total > b.total;
        });
        return rows;
    }

    std::vector<YearlyStatisticsRow> yearly_statistics(const TransactionList& transactions, std::string_view year)
    {
        // std::map keeps YYYY-MM keys sorted, which is also chronological order.
        std::map<std::string, CategoryLedger> months;

        for (const auto& t : transactions)
        {
            if (!util::starts_with(t.date, year))
                continue;

            auto month = month_key(t.date);
            if (!month)
            {
                spdlog::warn("Skipping transaction dated '{}' at {}: no YYYY-MM prefix", t.date, t.merchant);
                continue;
            }

            months[*month].add(t.category, t.total);
        }

        std::vector<YearlyStatisticsRow> rows;
        CategoryLedger yearly;

        for (const auto& [month, ledger] : months)
        {
            double month_total = ledger.total();
            for (const auto& entry : ledger.by_total_descending())
            {
                double total = util::round_to(entry.total);
                rows.push_back(YearlyStatisticsRow {
                    month,
                    entry.category,
                    total,
                    entry.count,
                    percentage_of(entry.total, month_total)
                });

                // Summed from the rounded monthly figures, so the summary row
                // always matches what the monthly rows add up to.
                yearly.add(entry.category, total, entry.count);
            }
        }

        for (const auto& entry : yearly.by_total_descending())
        {
            rows.push_back(YearlyStatisticsRow {
                std::string{YEARLY_TOTAL},
                entry.category,
                util::round_to(entry.total),
                entry.count,
                std::nullopt
            });
        }

        return rows;
    }

    std::optional<CsvDocument> build_statistics(const TransactionList& transactions, const std::string& year)
    {
        auto selected = select_period(transactions, year);
        if (selected.empty())
            return std::nullopt;

        return CsvDocument {
            csv::generate_csv(category_statistics(selected), statistics_columns()),
            "boletapp-statistics-" + year + ".csv"
        };
    }

    std::optional<CsvDocument> build_yearly_statistics(const TransactionList& transactions, const std::string& year)
    {
        auto rows = yearly_statistics(transactions, year);
        if (rows.empty())
            return std::nullopt;

        return CsvDocument {
            csv::generate_csv(rows, yearly_statistics_columns()),
            "boletapp-statistics-" + year + ".csv"
        };
    }

    bool download_statistics(const TransactionList* transactions, const std::string& year, sinks::FileSink& sink)
    {
        return detail::deliver(transactions, sink, [&](const TransactionList& list) {
            return build_statistics(list, year);
        });
    }

    bool download_yearly_statistics(const TransactionList* transactions, const std::string& year, sinks::FileSink& sink)
    {
        return detail::deliver(transactions, sink, [&](const TransactionList& list) {
            return build_yearly_statistics(list, year);
        });
    }
}
