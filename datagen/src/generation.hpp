#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "models.hpp"

namespace generation
{
    struct ItemTemplate
    {
        std::string_view name;
        std::string_view category;
        std::string_view subcategory;
        uint32_t min_price;
        uint32_t max_price;
        uint32_t max_qty = 1;
    };

    struct MerchantTemplate
    {
        std::string_view name;
        std::string_view alias;
        std::string_view category;
        std::vector<ItemTemplate> items;
    };

    const std::vector<MerchantTemplate>& merchants();

    bool is_leap_year(int year);
    int days_in_month(int year, int month);

    /**
     * A random calendar date inside the year, formatted YYYY-MM-DD.
     */
    std::string random_date(int year, std::mt19937& gen);

    /**
     * One purchase at a random merchant, with between one and six of its items.
     * The total is the sum of price times quantity over the items.
     */
    models::Transaction generate_transaction(int year, std::mt19937& gen);

    /**
     * `count` transactions dated inside `year`, oldest first, with ids
     * "tx-<year>-<n>" numbered in that order.
     */
    models::TransactionList generate_year(int year, size_t count, std::mt19937& gen);
}
