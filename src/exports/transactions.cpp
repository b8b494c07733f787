#include "exports.hpp"

#include <algorithm>
#include <iterator>

#include "deliver.hpp"

namespace exports
{
    using csv::column;

    namespace
    {
        bool is_iso_date(std::string_view str)
        {
            return str.size() == 10
                && util::is_digits(str.substr(0, 4)) && str[4] == '-'
                && util::is_digits(str.substr(5, 2)) && str[7] == '-'
                && util::is_digits(str.substr(8, 2));
        }
    }

    std::string format_date(const std::string& date)
    {
        if (is_iso_date(date))
            return date;

        std::string_view view{date};
        if (view.size() > 10 && is_iso_date(view.substr(0, 10)) && (view[10] == 'T' || view[10] == ' '))
            return date.substr(0, 10);

        return date;
    }

    std::optional<std::string> month_key(std::string_view date)
    {
        if (date.size() < 7 || !util::is_digits(date.substr(0, 4)) || date[4] != '-' || !util::is_digits(date.substr(5, 2)))
            return std::nullopt;

        if (date.size() > 7 && std::isdigit((unsigned char)date[7]))
            return std::nullopt;

        return std::string{date.substr(0, 7)};
    }

    TransactionList select_period(const TransactionList& transactions, std::string_view prefix)
    {
        TransactionList selected;
        std::copy_if(transactions.begin(), transactions.end(), std::back_inserter(selected), [&prefix](const Transaction& t) {
            return util::starts_with(t.date, prefix);
        });
        return selected;
    }

    const std::vector<csv::Column<BasicRow>>& basic_columns()
    {
        // Alias and category are left out on purpose, this is the minimal export.
        static const std::vector<csv::Column<BasicRow>> columns {
            column("Date", &BasicRow::date),
            column("Merchant", &BasicRow::merchant),
            column("Total", &BasicRow::total)
        };
        return columns;
    }

    const std::vector<csv::Column<YearTransactionRow>>& year_transaction_columns()
    {
        static const std::vector<csv::Column<YearTransactionRow>> columns {
            column("Date", &YearTransactionRow::date),
            column("Merchant", &YearTransactionRow::merchant),
            column("Alias", &YearTransactionRow::alias),
            column("Category", &YearTransactionRow::category),
            column("Total", &YearTransactionRow::total),
            column("Items", &YearTransactionRow::item_count)
        };
        return columns;
    }

    const std::vector<csv::Column<MonthlyItemRow>>& monthly_item_columns()
    {
        static const std::vector<csv::Column<MonthlyItemRow>> columns {
            column("Transaction ID", &MonthlyItemRow::transaction_id),
            column("Date", &MonthlyItemRow::date),
            column("Merchant", &MonthlyItemRow::merchant),
            column("Category", &MonthlyItemRow::category),
            column("Item Name", &MonthlyItemRow::item_name),
            column("Qty", &MonthlyItemRow::item_qty),
            column("Item Price", &MonthlyItemRow::item_price),
            column("Item Category", &MonthlyItemRow::item_category),
            column("Item Subcategory", &MonthlyItemRow::item_subcategory)
        };
        return columns;
    }

    std::vector<BasicRow> basic_rows(const TransactionList& transactions)
    {
        return util::vector_map(transactions, [](const Transaction& t) {
            return BasicRow { format_date(t.date), t.merchant, t.total };
        });
    }

    std::vector<YearTransactionRow> year_transaction_rows(const TransactionList& transactions)
    {
        return util::vector_map(transactions, [](const Transaction& t) {
            return YearTransactionRow {
                format_date(t.date),
                t.merchant,
                t.alias.value_or(""),
                t.category,
                t.total,
                t.items.size()
            };
        });
    }

    std::vector<MonthlyItemRow> monthly_item_rows(const TransactionList& transactions)
    {
        std::vector<MonthlyItemRow> rows;

        for (size_t i = 0; i < transactions.size(); ++i)
        {
            const auto& t = transactions[i];

            MonthlyItemRow base;
            base.transaction_id = t.id.value_or("T" + std::to_string(i + 1));
            base.date = format_date(t.date);
            base.merchant = t.merchant;
            base.category = t.category;

            if (t.items.empty())
            {
                rows.push_back(std::move(base));
                continue;
            }

            for (const auto& item : t.items)
            {
                MonthlyItemRow row = base;
                row.item_name = item.name;
                row.item_qty = (item.qty && *item.qty != 0) ? *item.qty : 1.0;
                row.item_price = item.price;
                row.item_category = item.category.value_or("");
                row.item_subcategory = item.subcategory.value_or("");
                rows.push_back(std::move(row));
            }
        }

        return rows;
    }

    std::optional<CsvDocument> build_basic_data(const TransactionList& transactions, const std::string& today)
    {
        if (transactions.empty())
            return std::nullopt;

        return CsvDocument {
            csv::generate_csv(basic_rows(transactions), basic_columns()),
            "boletapp-basic-" + today + ".csv"
        };
    }

    std::optional<CsvDocument> build_year_transactions(const TransactionList& transactions, const std::string& year)
    {
        auto selected = select_period(transactions, year);
        if (selected.empty())
            return std::nullopt;

        return CsvDocument {
            csv::generate_csv(year_transaction_rows(selected), year_transaction_columns()),
            "boletapp-year-" + year + ".csv"
        };
    }

    std::optional<CsvDocument> build_monthly_transactions(const TransactionList& transactions, const std::string& year, const std::string& month)
    {
        auto selected = select_period(transactions, year + "-" + month);
        if (selected.empty())
            return std::nullopt;

        return CsvDocument {
            csv::generate_csv(monthly_item_rows(selected), monthly_item_columns()),
            "boletapp-month-" + year + "-" + month + ".csv"
        };
    }

    bool download_basic_data(const TransactionList* transactions, sinks::FileSink& sink, const std::string& today)
    {
        return detail::deliver(transactions, sink, [&](const TransactionList& list) {
            return build_basic_data(list, today);
        });
    }

    bool download_year_transactions(const TransactionList* transactions, const std::string& year, sinks::FileSink& sink)
    {
        return detail::deliver(transactions, sink, [&](const TransactionList& list) {
            return build_year_transactions(list, year);
        });
    }

    bool download_monthly_transactions(const TransactionList* transactions, const std::string& year, const std::string& month, sinks::FileSink& sink)
    {
        return detail::deliver(transactions, sink, [&](const TransactionList& list) {
            return build_monthly_transactions(list, year, month);
        });
    }
}
