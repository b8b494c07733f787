#pragma once

#include <string_view>
#include <string>
#include <cctype>
#include <charconv>
#include <optional>
#include <vector>
#include <algorithm>
#include <type_traits>
#include <system_error>

namespace util
{
    template<class N> struct is_optional { static constexpr bool value = false; };
    template<class N> struct is_optional<std::optional<N>> { static constexpr bool value = true; };
    template<class T> inline constexpr bool is_optional_v = is_optional<T>::value;

    inline bool is_integer(const std::string_view& str)
    {
        if (str.empty())
            return false;

        size_t start = (str[0] == '-' || str[0] == '+') ? 1 : 0;
        if (start == str.size())
            return false;

        return std::all_of(str.begin() + start, str.end(), [](char c) { return std::isdigit((unsigned char)c) != 0; });
    }

    inline bool is_digits(const std::string_view& str)
    {
        return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return std::isdigit((unsigned char)c) != 0; });
    }

    inline bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
    }

    inline std::string to_lower(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return str;
    }

    std::string read_file(const std::string_view& filename);

    /**
     * Lower-cases, trims and collapses every run of whitespace into a single
     * space, so "  Leche   Entera " and "leche entera" compare equal.
     */
    std::string normalize_whitespace(const std::string_view& str);

    /**
     * Writes a number in the shortest form that reads back to the same value,
     * e.g. 42, 1234.56, 0.3 or 1e+21. Negative zero is written as "0".
     */
    std::string format_number(double value);

    /**
     * Rounds half up (towards positive infinity), so 2.5 -> 3 and -2.5 -> -2.
     */
    double round_half_up(double value);

    /**
     * Rounds to a fixed number of decimal places with round_half_up.
     */
    double round_to(double value, int decimals = 2);

    // Local calendar date as YYYY-MM-DD
    std::string today_iso();
    // Local calendar month as YYYY-MM
    std::string current_month();

    template<typename T>
    struct parse_result
    {
        std::errc ec{};
        T value{};
    };

    template<typename T>
    auto parse(const std::string_view& str) -> parse_result<T>
    {
        static_assert(std::is_arithmetic_v<T>);
        parse_result<T> ret;
        if constexpr(std::is_same_v<bool, T>)
        {
            if (str == "true" || str == "on" || str == "1")
                ret.value = true;
            else if (str == "false" || str == "off" || str == "0")
                ret.value = false;
            else ret.ec = std::errc::invalid_argument;
        }
        else
        {
            const char* end = str.data() + str.size();
            auto [ptr, ec] { std::from_chars(str.data(), end, ret.value) };
            ret.ec = ec;
            if (ec == std::errc{} && ptr != end)
                ret.ec = std::errc::invalid_argument;
        }
        return ret;
    }

    template<typename T1, typename Func>
    auto vector_map(const std::vector<T1>& vec, Func func) -> std::vector<decltype(func(vec[0]))>
    {
        std::vector<decltype(func(vec[0]))> new_vec;
        new_vec.reserve(vec.size());
        for (const auto& v : vec)
            new_vec.emplace_back(func(v));
        return new_vec;
    }
}
