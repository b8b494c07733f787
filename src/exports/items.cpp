#include "exports.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "deliver.hpp"

namespace exports
{
    using csv::column;

    namespace
    {
        struct ItemGroup
        {
            std::string first_name;
            std::string category;
            std::string subcategory;
            double total = 0;

            // Raw name variants in first-seen order with how often each occurs
            std::vector<std::pair<std::string, size_t>> names;
            std::unordered_set<std::string> transaction_ids;

            void count_name(const std::string& name)
            {
                auto it = std::find_if(names.begin(), names.end(), [&name](const auto& entry) {
                    return entry.first == name;
                });

                if (it == names.end())
                    names.emplace_back(name, 1);
                else
                    ++it->second;
            }

            [[nodiscard]] const std::string& display_name() const
            {
                const std::string* best = &first_name;
                size_t best_count = 0;
                for (const auto& [name, count] : names)
                {
                    if (count > best_count)
                    {
                        best = &name;
                        best_count = count;
                    }
                }
                return *best;
            }
        };

        std::string group_key(const std::string& item_name, const std::string& merchant)
        {
            return util::normalize_whitespace(item_name) + "::"
                + util::normalize_whitespace(merchant.empty() ? "unknown" : merchant);
        }

        std::string translated(const std::string& category, Language lang)
        {
            if (category.empty())
                return category;
            return std::string{translate_item_category(category, lang)};
        }
    }

    const std::vector<csv::Column<AggregatedItemRow>>& aggregated_item_columns(Language lang)
    {
        static const std::vector<csv::Column<AggregatedItemRow>> english {
            column("Product", &AggregatedItemRow::product),
            column("Price", &AggregatedItemRow::total),
            column("Category", &AggregatedItemRow::category),
            column("Subcategory", &AggregatedItemRow::subcategory),
            column("Transactions", &AggregatedItemRow::transaction_count)
        };

        static const std::vector<csv::Column<AggregatedItemRow>> spanish {
            column("Producto", &AggregatedItemRow::product),
            column("Precio", &AggregatedItemRow::total),
            column("Categoría", &AggregatedItemRow::category),
            column("Subcategoría", &AggregatedItemRow::subcategory),
            column("Transacciones", &AggregatedItemRow::transaction_count)
        };

        return lang == Language::Spanish ? spanish : english;
    }

    std::vector<AggregatedItemRow> aggregate_items(const TransactionList& transactions, Language lang)
    {
        std::vector<ItemGroup> groups;
        std::unordered_map<std::string, size_t> index;

        for (size_t i = 0; i < transactions.size(); ++i)
        {
            const auto& t = transactions[i];
            auto transaction_id = t.id.value_or("T" + std::to_string(i + 1));

            for (const auto& item : t.items)
            {
                auto key = group_key(item.name, t.merchant);
                auto found = index.find(key);
                if (found == index.end())
                {
                    found = index.emplace(key, groups.size()).first;

                    ItemGroup group;
                    group.first_name = item.name;
                    group.category = item.category.value_or("");
                    group.subcategory = item.subcategory.value_or("");
                    groups.push_back(std::move(group));
                }

                auto& group = groups[found->second];
                group.count_name(item.name);
                group.total += item.price;
                group.transaction_ids.insert(transaction_id);
            }
        }

        std::vector<AggregatedItemRow> rows;
        rows.reserve(groups.size());
        for (const auto& group : groups)
        {
            rows.push_back(AggregatedItemRow {
                group.display_name(),
                util::round_to(group.total),
                translated(group.category, lang),
                translated(group.subcategory, lang),
                group.transaction_ids.size()
            });
        }

        std::stable_sort(rows.begin(), rows.end(), [](const AggregatedItemRow& a, const AggregatedItemRow& b) {
            return a.total > b.total;
        });
        return rows;
    }

    std::optional<CsvDocument> build_aggregated_items(const TransactionList& transactions, Language lang, const std::string& month_label)
    {
        auto rows = aggregate_items(transactions, lang);
        if (rows.empty())
            return std::nullopt;

        std::string label = lang == Language::Spanish ? "productos" : "products";
        return CsvDocument {
            csv::generate_csv(rows, aggregated_item_columns(lang)),
            "boletapp-" + label + "-" + month_label + ".csv"
        };
    }

    bool download_aggregated_items(const TransactionList* transactions, Language lang, sinks::FileSink& sink, const std::string& month_label)
    {
        return detail::deliver(transactions, sink, [&](const TransactionList& list) {
            return build_aggregated_items(list, lang, month_label);
        });
    }
}
