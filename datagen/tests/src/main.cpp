#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "generation.hpp"
#include "exports/exports.hpp"

#include <cmath>
#include <set>

TEST_CASE("Leap years", "datagen::generation")
{
    REQUIRE(generation::is_leap_year(2024));
    REQUIRE(generation::is_leap_year(2000));
    REQUIRE_FALSE(generation::is_leap_year(1900));
    REQUIRE_FALSE(generation::is_leap_year(2025));

    REQUIRE(generation::days_in_month(2024, 2) == 29);
    REQUIRE(generation::days_in_month(2025, 2) == 28);
    REQUIRE(generation::days_in_month(2025, 4) == 30);
    REQUIRE(generation::days_in_month(2025, 12) == 31);
}

TEST_CASE("Random dates stay inside the year", "datagen::generation")
{
    std::mt19937 gen(42);
    for (int i = 0; i < 500; ++i)
    {
        auto date = generation::random_date(2024, gen);
        REQUIRE(date.size() == 10);
        REQUIRE(date.substr(0, 5) == "2024-");

        int month = std::stoi(date.substr(5, 2));
        int day = std::stoi(date.substr(8, 2));
        REQUIRE(month >= 1);
        REQUIRE(month <= 12);
        REQUIRE(day >= 1);
        REQUIRE(day <= generation::days_in_month(2024, month));
    }
}

TEST_CASE("Transaction totals match their items", "datagen::generation")
{
    std::mt19937 gen(7);
    for (int i = 0; i < 200; ++i)
    {
        auto t = generation::generate_transaction(2025, gen);
        REQUIRE_FALSE(t.items.empty());
        REQUIRE(t.items.size() <= 6);

        double sum = 0;
        std::set<std::string> names;
        for (const auto& item : t.items)
        {
            REQUIRE(item.qty.has_value());
            REQUIRE(*item.qty >= 1);
            REQUIRE(item.price > 0);
            sum += item.price * *item.qty;
            names.insert(item.name);
        }

        REQUIRE(std::fabs(sum - t.total) < 1e-6);
        REQUIRE(names.size() == t.items.size());
    }
}

TEST_CASE("A generated year is sorted and numbered", "datagen::generation")
{
    std::mt19937 gen(1234);
    auto transactions = generation::generate_year(2025, 120, gen);

    REQUIRE(transactions.size() == 120);
    REQUIRE(*transactions.front().id == "tx-2025-1");
    REQUIRE(*transactions.back().id == "tx-2025-120");

    for (size_t i = 1; i < transactions.size(); ++i)
        REQUIRE(transactions[i - 1].date <= transactions[i].date);
}

TEST_CASE("Generated data exports cleanly", "datagen::generation")
{
    std::mt19937 gen(99);
    auto transactions = generation::generate_year(2025, 60, gen);

    auto rows = exports::yearly_statistics(transactions, "2025");
    REQUIRE_FALSE(rows.empty());

    // The earliest transaction's month is never empty
    auto month = transactions.front().date.substr(5, 2);
    auto document = exports::build_monthly_transactions(transactions, "2025", month);
    REQUIRE(document.has_value());
    REQUIRE(document->filename == "boletapp-month-2025-" + month + ".csv");
}
