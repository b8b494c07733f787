#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include "exports/exports.hpp"
#include "fixtures.hpp"

using fixtures::transaction;
using exports::ExportKind;
using exports::ExportRequest;

namespace
{
    class FailingSink : public sinks::MemorySink
    {
    public:
        void sink(const std::string&, const std::string&) override
        {
            throw sinks::SinkError("disk full");
        }
    };

    models::TransactionList reply_fixture()
    {
        return {
            transaction("2025-01-15", "Jumbo", "Supermarket", 75),
            transaction("2025-02-20", "Starbucks", "Restaurant", 25)
        };
    }

    std::string error_of(const exports::ExportReply& reply)
    {
        return nlohmann::json::parse(reply.body).at("error").get<std::string>();
    }
}

TEST_CASE("A delivered export answers 200 with a download", "exports::reply")
{
    auto list = reply_fixture();
    auto reply = exports::reply_to(ExportRequest{ ExportKind::Year, std::string{"2025"} }, &list);

    REQUIRE(reply.status == 200);
    REQUIRE(reply.content_type == "text/csv;charset=utf-8;");
    REQUIRE(reply.headers.at("Content-Disposition") == "attachment; filename=\"boletapp-year-2025.csv\"");
    REQUIRE(fixtures::lines(reply.body)[0] == "Date,Merchant,Alias,Category,Total,Items");
}

TEST_CASE("An export with nothing in it answers 204", "exports::reply")
{
    auto list = reply_fixture();

    auto other_year = exports::reply_to(ExportRequest{ ExportKind::Statistics, std::string{"2024"} }, &list);
    REQUIRE(other_year.status == 204);
    REQUIRE(other_year.body.empty());
    REQUIRE(other_year.headers.empty());

    models::TransactionList empty;
    REQUIRE(exports::reply_to(ExportRequest{}, &empty).status == 204);
    REQUIRE(exports::reply_to(ExportRequest{}, nullptr).status == 204);
}

TEST_CASE("A bad period answers 400", "exports::reply")
{
    auto list = reply_fixture();

    auto bad_year = exports::reply_to(ExportRequest{ ExportKind::Year, std::string{"25"} }, &list);
    REQUIRE(bad_year.status == 400);
    REQUIRE(bad_year.content_type == "application/json");
    REQUIRE_THAT(error_of(bad_year), Catch::Contains("four digits"));

    auto bad_month = exports::reply_to(ExportRequest{ ExportKind::Month, std::string{"2025"}, std::string{"13"} }, &list);
    REQUIRE(bad_month.status == 400);

    auto missing_year = exports::reply_to(ExportRequest{ ExportKind::YearlyStatistics }, &list);
    REQUIRE(missing_year.status == 400);
}

TEST_CASE("A failing export answers 500 without details", "exports::reply")
{
    auto list = reply_fixture();
    FailingSink sink;

    auto reply = exports::reply_to(ExportRequest{ ExportKind::Year, std::string{"2025"} }, &list, sink);
    REQUIRE(reply.status == 500);
    REQUIRE(reply.content_type == "application/json");
    REQUIRE(error_of(reply).find("disk full") == std::string::npos);
}

TEST_CASE("Items requests take a YYYY-MM month", "exports::reply")
{
    auto request = exports::items_request(std::nullopt, std::string{"2025-02"}, std::string{"es"});
    REQUIRE(request.kind == ExportKind::Items);
    REQUIRE(request.year == std::optional<std::string>{"2025"});
    REQUIRE(request.month == std::optional<std::string>{"02"});
    REQUIRE(request.lang == exports::Language::Spanish);

    auto by_year = exports::items_request(std::string{"2025"}, std::nullopt, std::nullopt);
    REQUIRE(by_year.year == std::optional<std::string>{"2025"});
    REQUIRE_FALSE(by_year.month.has_value());
    REQUIRE(by_year.lang == exports::Language::English);

    REQUIRE_THROWS_AS(exports::items_request(std::nullopt, std::string{"2025/02"}, std::nullopt), std::invalid_argument);
    REQUIRE_THROWS_AS(exports::items_request(std::nullopt, std::string{"202502"}, std::nullopt), std::invalid_argument);
    REQUIRE_THROWS_AS(exports::items_request(std::nullopt, std::nullopt, std::string{"fr"}), std::invalid_argument);
}

TEST_CASE("Items replies carry the period in the filename", "exports::reply")
{
    auto list = reply_fixture();
    list[1].items.push_back(fixtures::item("Latte", 25));

    auto reply = exports::reply_to(exports::items_request(std::nullopt, std::string{"2025-02"}, std::string{"es"}), &list);
    REQUIRE(reply.status == 200);
    REQUIRE(reply.headers.at("Content-Disposition") == "attachment; filename=\"boletapp-productos-2025-02.csv\"");

    // A well formed but impossible month still fails validation
    auto impossible = exports::reply_to(exports::items_request(std::nullopt, std::string{"2025-1x"}, std::nullopt), &list);
    REQUIRE(impossible.status == 400);

    auto nothing = exports::reply_to(exports::items_request(std::nullopt, std::string{"2025-06"}, std::nullopt), &list);
    REQUIRE(nothing.status == 204);
}
