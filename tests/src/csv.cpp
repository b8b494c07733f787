#include <catch2/catch.hpp>

#include <sstream>

#include "csv/csv.hpp"
#include "fixtures.hpp"

namespace
{
    struct Row
    {
        std::string name;
        double amount;
        std::optional<std::string> note;
    };

    const std::vector<csv::Column<Row>>& row_columns()
    {
        static const std::vector<csv::Column<Row>> columns {
            csv::column("Name", &Row::name),
            csv::column("Amount", &Row::amount),
            csv::column("Note", &Row::note)
        };
        return columns;
    }
}

TEST_CASE("Sanitize prefixes formula characters", "csv")
{
    REQUIRE(csv::sanitize("=1+1") == "'=1+1");
    REQUIRE(csv::sanitize("+1") == "'+1");
    REQUIRE(csv::sanitize("-1") == "'-1");
    REQUIRE(csv::sanitize("@SUM(A1)") == "'@SUM(A1)");
    REQUIRE(csv::sanitize("\tcell") == "'\tcell");
    REQUIRE(csv::sanitize("\rcell") == "'\rcell");
    REQUIRE(csv::sanitize("=SUM(A1:A10)") == "'=SUM(A1:A10)");
}

TEST_CASE("Sanitize leaves other values alone", "csv")
{
    REQUIRE(csv::sanitize("").empty());
    REQUIRE(csv::sanitize("Normal text") == "Normal text");
    REQUIRE(csv::sanitize("a=b") == "a=b");
    REQUIRE(csv::sanitize(" =1") == " =1");
}

TEST_CASE("Sanitize stringifies values first", "csv")
{
    REQUIRE(csv::sanitize_value(std::nullopt).empty());
    REQUIRE(csv::sanitize_value(std::optional<double>{}).empty());
    REQUIRE(csv::sanitize_value(42.0) == "42");
    REQUIRE(csv::sanitize_value(-5.0) == "'-5");
    REQUIRE(csv::sanitize_value(std::string{"@home"}) == "'@home");
}

TEST_CASE("Escape quotes values holding a comma or quote or line feed", "csv")
{
    REQUIRE(csv::escape("Hello, World") == "\"Hello, World\"");
    REQUIRE(csv::escape("Say \"Hi\"") == "\"Say \"\"Hi\"\"\"");
    REQUIRE(csv::escape("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("Escape passes plain values through", "csv")
{
    REQUIRE(csv::escape("Plain value") == "Plain value");
    REQUIRE(csv::escape("").empty());
    REQUIRE(csv::escape("Café") == "Café");
}

TEST_CASE("A lone carriage return is not quoted", "csv")
{
    REQUIRE(csv::escape("a\rb") == "a\rb");
}

TEST_CASE("Escape sanitizes before quoting", "csv")
{
    REQUIRE(csv::escape("=A1,B1") == "\"'=A1,B1\"");
    REQUIRE(csv::escape("-5") == "'-5");
}

TEST_CASE("Numbers are written like a JavaScript number", "csv")
{
    REQUIRE(util::format_number(42) == "42");
    REQUIRE(util::format_number(1234.56) == "1234.56");
    REQUIRE(util::format_number(0) == "0");
    REQUIRE(util::format_number(-0.0) == "0");
    REQUIRE(util::format_number(-5) == "-5");
    REQUIRE(util::format_number(0.1 + 0.2) == "0.30000000000000004");
    REQUIRE(util::format_number(100000) == "100000");
    REQUIRE(util::format_number(1e21) == "1e+21");
    REQUIRE(util::format_number(1e-7) == "1e-7");
}

TEST_CASE("Large integers pad with zeros past their significant digits", "csv")
{
    REQUIRE(util::format_number(1.2345678901234568e20) == "123456789012345680000");
    REQUIRE(util::format_number(-1.2345678901234568e20) == "-123456789012345680000");
    REQUIRE(util::format_number(1e20) == "100000000000000000000");
    REQUIRE(util::format_number(123456789012345678.0) == "123456789012345680");
}

TEST_CASE("Small fractions keep plain notation", "csv")
{
    REQUIRE(util::format_number(0.00123) == "0.00123");
    REQUIRE(util::format_number(1e-6) == "0.000001");
    REQUIRE(util::format_number(-0.5) == "-0.5");
    REQUIRE(util::format_number(10.13) == "10.13");
}

TEST_CASE("Rounding is half up", "csv")
{
    REQUIRE(util::round_half_up(2.5) == 3);
    REQUIRE(util::round_half_up(-2.5) == -2);
    REQUIRE(util::round_half_up(33.333) == 33);
    REQUIRE(util::round_to(10.005 + 0.0001) == Approx(10.01));
    REQUIRE(util::round_to(1.234) == Approx(1.23));
}

TEST_CASE("An empty table is a BOM and its header line", "csv")
{
    auto text = csv::generate_csv(std::vector<Row>{}, row_columns());

    REQUIRE(text.rfind(csv::UTF8_BOM, 0) == 0);
    REQUIRE(text == std::string{csv::UTF8_BOM} + "Name,Amount,Note");
    REQUIRE(fixtures::lines(text).size() == 1);
}

TEST_CASE("Rows follow the header without a trailing newline", "csv")
{
    std::vector<Row> rows {
        { "Coffee", 2.5, std::nullopt },
        { "Tea, green", -1, std::string{"refund"} }
    };

    auto text = csv::generate_csv(rows, row_columns());
    REQUIRE(text == std::string{csv::UTF8_BOM} + "Name,Amount,Note\nCoffee,2.5,\n\"Tea, green\",'-1,refund");

    auto lines = fixtures::lines(text);
    REQUIRE(lines.size() == rows.size() + 1);
    REQUIRE(text.back() != '\n');
}

TEST_CASE("Only one BOM is written", "csv")
{
    std::vector<Row> rows { { "x", 1, std::nullopt } };
    auto text = csv::generate_csv(rows, row_columns());

    REQUIRE(text.find(csv::UTF8_BOM, csv::UTF8_BOM.size()) == std::string::npos);
}

TEST_CASE("Headers are escaped too", "csv")
{
    std::vector<csv::Column<Row>> columns {
        csv::column("Name, full", &Row::name),
        csv::column("=Amount", &Row::amount)
    };

    auto text = csv::generate_csv(std::vector<Row>{}, columns);
    REQUIRE(text == std::string{csv::UTF8_BOM} + "\"Name, full\",'=Amount");
}

TEST_CASE("The streaming writer matches generate_csv", "csv")
{
    std::vector<Row> rows {
        { "Bread", 1990, std::nullopt },
        { "Say \"Hi\"", 0.5, std::string{"@note"} }
    };

    std::ostringstream out;
    csv::write_csv(out, rows.begin(), rows.end(), row_columns());
    REQUIRE(out.str() == csv::generate_csv(rows, row_columns()));
}

TEST_CASE("Output is deterministic", "csv")
{
    std::vector<Row> rows { { "a", 1, std::nullopt }, { "b", 2, std::nullopt } };
    REQUIRE(csv::generate_csv(rows, row_columns()) == csv::generate_csv(rows, row_columns()));
}
