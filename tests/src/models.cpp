#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "models.hpp"

using nlohmann::json;
namespace fs = std::filesystem;

TEST_CASE("Transactions parse from an array", "models")
{
    auto document = json::parse(R"([
        {
            "id": "abc",
            "date": "2025-01-15",
            "merchant": "Jumbo",
            "alias": "Jumbo Las Condes",
            "category": "Supermarket",
            "total": 4580,
            "items": [
                { "name": "Leche", "price": 1290, "qty": 2, "category": "Dairy & Eggs", "subcategory": "Milk" },
                { "name": "Pan", "price": 2000 }
            ]
        },
        { "date": "2025-01-16", "merchant": "Copec", "category": "Transport", "total": -5.5, "alias": null }
    ])");

    auto list = models::parse_transactions(document);
    REQUIRE(list.size() == 2);

    REQUIRE(list[0].id == std::optional<std::string>{"abc"});
    REQUIRE(list[0].alias == std::optional<std::string>{"Jumbo Las Condes"});
    REQUIRE(list[0].total == 4580);
    REQUIRE(list[0].items.size() == 2);
    REQUIRE(list[0].items[0].qty == std::optional<double>{2});
    REQUIRE(list[0].items[0].subcategory == std::optional<std::string>{"Milk"});
    REQUIRE_FALSE(list[0].items[1].qty.has_value());
    REQUIRE_FALSE(list[0].items[1].category.has_value());

    REQUIRE_FALSE(list[1].id.has_value());
    REQUIRE_FALSE(list[1].alias.has_value());
    REQUIRE(list[1].total == -5.5);
    REQUIRE(list[1].items.empty());
}

TEST_CASE("Transactions parse from a wrapping object", "models")
{
    auto document = json::parse(R"({ "transactions": [
        { "date": "2025-02-01", "merchant": "A", "category": "Other", "total": 1 }
    ] })");

    REQUIRE(models::parse_transactions(document).size() == 1);
}

TEST_CASE("Bad documents name the offending record", "models")
{
    auto missing_total = json::parse(R"([
        { "date": "2025-02-01", "merchant": "A", "category": "Other", "total": 1 },
        { "date": "2025-02-02", "merchant": "B", "category": "Other" }
    ])");
    REQUIRE_THROWS_WITH(models::parse_transactions(missing_total), Catch::Contains("transactions[1]") && Catch::Contains("total"));

    auto bad_item = json::parse(R"([
        { "date": "2025-02-01", "merchant": "A", "category": "Other", "total": 1, "items": [ { "price": 1 } ] }
    ])");
    REQUIRE_THROWS_WITH(models::parse_transactions(bad_item), Catch::Contains("items[0]") && Catch::Contains("name"));

    auto wrong_type = json::parse(R"([ { "date": 20250201, "merchant": "A", "category": "Other", "total": 1 } ])");
    REQUIRE_THROWS_AS(models::parse_transactions(wrong_type), models::LoadError);

    REQUIRE_THROWS_AS(models::parse_transactions(json::parse(R"({ "rows": [] })")), models::LoadError);
    REQUIRE_THROWS_AS(models::parse_transactions(json::parse(R"([ 42 ])")), models::LoadError);
}

TEST_CASE("Transactions survive a trip through json", "models")
{
    models::Transaction t;
    t.id = "x1";
    t.date = "2025-03-03";
    t.merchant = "Cruz Verde";
    t.category = "Pharmacy";
    t.total = 990;
    t.items.push_back(models::LineItem{ "Paracetamol", 990, 1.0, std::string{"Pharmacy"}, std::nullopt });

    json document = models::TransactionList{ t };
    auto list = models::parse_transactions(document);

    REQUIRE(list.size() == 1);
    REQUIRE(list[0].id == t.id);
    REQUIRE(list[0].merchant == t.merchant);
    REQUIRE_FALSE(list[0].alias.has_value());
    REQUIRE(list[0].items[0].category == t.items[0].category);
    REQUIRE_FALSE(list[0].items[0].subcategory.has_value());
}

TEST_CASE("Loading from disk", "models")
{
    auto path = fs::temp_directory_path() / "boletapp-models-test.json";
    {
        std::ofstream out(path);
        out << R"([{ "date": "2025-04-01", "merchant": "A", "category": "Other", "total": 3 }])";
    }

    auto list = models::load_transactions(path.string());
    REQUIRE(list->size() == 1);
    fs::remove(path);

    REQUIRE_THROWS_AS(models::load_transactions(path.string()), models::LoadError);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    REQUIRE_THROWS_AS(models::load_transactions(path.string()), models::LoadError);
    fs::remove(path);
}
