#pragma once

#include <functional>
#include <iterator>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "helpers/utilities.hpp"

namespace csv
{
    // U+FEFF encoded as UTF-8, so spreadsheets detect the encoding.
    constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";
    constexpr std::string_view MIME_TYPE = "text/csv;charset=utf-8;";

    /**
     * Neutralizes spreadsheet formula injection. A value starting with one of
     * = + - @ \t \r gets an apostrophe prefix, anything else is returned as is.
     *
     * @code
     * sanitize("=SUM(A1:A10)") // "'=SUM(A1:A10)"
     * sanitize("Normal text")  // "Normal text"
     * @endcode
     */
    std::string sanitize(std::string_view value);

    /**
     * Sanitizes, then quotes the value if it holds a comma, a double quote or a
     * line feed, doubling every quote inside. A bare carriage return does not
     * cause quoting.
     *
     * @code
     * escape("Hello, World") // "\"Hello, World\""
     * escape("Say \"Hi\"")   // "\"Say \"\"Hi\"\"\""
     * @endcode
     */
    std::string escape(std::string_view value);

    /**
     * Turns a field into its unescaped cell text. Absent values become empty,
     * numbers use util::format_number.
     */
    template<typename T>
    std::string to_cell(const T& value)
    {
        if constexpr(std::is_same_v<T, std::nullopt_t>)
        {
            return std::string{};
        }
        else if constexpr(util::is_optional_v<T>)
        {
            return value.has_value() ? to_cell(*value) : std::string{};
        }
        else if constexpr(std::is_same_v<T, bool>)
        {
            return value ? "true" : "false";
        }
        else if constexpr(std::is_arithmetic_v<T>)
        {
            return util::format_number((double)value);
        }
        else
        {
            return std::string{std::string_view{value}};
        }
    }

    template<typename T>
    std::string sanitize_value(const T& value) { return sanitize(to_cell(value)); }

    template<typename T>
    std::string escape_value(const T& value) { return escape(to_cell(value)); }

    template<typename Row>
    struct Column
    {
        std::string header;
        std::function<std::string(const Row&)> key;
    };

    /**
     * Makes a column reading a data member of the row type, e.g.
     * `column("Date", &BasicRow::date)`.
     */
    template<typename Row, typename Field>
    Column<Row> column(std::string header, Field Row::* field)
    {
        return Column<Row> {
            std::move(header),
            [field](const Row& row) { return to_cell(row.*field); }
        };
    }

    /**
     * Streams a table as CSV: BOM, header line, then one line per row, with "\n"
     * between lines and none after the last one.
     */
    template<typename Row, typename Iter>
    void write_csv(std::ostream& out, Iter first, Iter last, const std::vector<Column<Row>>& columns)
    {
        out << UTF8_BOM;
        for (size_t i = 0; i < columns.size(); ++i)
        {
            if (i != 0)
                out << ',';
            out << escape(columns[i].header);
        }

        for (; first != last; ++first)
        {
            const Row& row = *first;
            out << '\n';
            for (size_t i = 0; i < columns.size(); ++i)
            {
                if (i != 0)
                    out << ',';
                out << escape(columns[i].key(row));
            }
        }
    }

    template<typename Row>
    std::string generate_csv(const std::vector<Row>& rows, const std::vector<Column<Row>>& columns)
    {
        std::ostringstream out;
        write_csv(out, rows.begin(), rows.end(), columns);
        return out.str();
    }
}
