#include "utilities.hpp"

#include <array>
#include <cmath>
#include <ctime>
#include <fstream>

std::string util::read_file(const std::string_view& filename)
{
    constexpr auto read_size = std::size_t(4096);
    auto stream = std::ifstream(std::string{filename});
    stream.exceptions(std::ios_base::badbit);

    auto out = std::string();
    auto buf = std::string(read_size, '\0');
    while (stream.read(&buf[0], read_size))
        out.append(buf, 0, static_cast<unsigned long>(stream.gcount()));
    out.append(buf, 0, static_cast<unsigned long>(stream.gcount()));
    return out;
}

std::string util::normalize_whitespace(const std::string_view& str)
{
    std::string out;
    out.reserve(str.size());

    bool pending_space = false;
    for (char c : str)
    {
        if (std::isspace((unsigned char)c))
        {
            pending_space = !out.empty();
            continue;
        }

        if (pending_space)
            out += ' ';
        pending_space = false;
        out += (char)std::tolower((unsigned char)c);
    }

    return out;
}

std::string util::format_number(double value)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value < 0 ? "-Infinity" : "Infinity";
    if (value == 0)
        return "0";

    std::array<char, 64> buf{};
    auto magnitude = std::fabs(value);

    /**
     * Plain notation for everything a receipt could hold, exponent notation
     * only for the extremes, at the same cut-off points a JavaScript number
     * switches at.
     */
    if (magnitude >= 1e21 || magnitude < 1e-6)
    {
        auto [ptr, ec] { std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::scientific) };
        (void)ec;
        std::string str{buf.data(), ptr};

        // "1e-07" -> "1e-7"
        auto e = str.find('e');
        if (e != std::string::npos && e + 2 < str.size())
        {
            auto digits = e + 2;
            while (digits + 1 < str.size() && str[digits] == '0')
                str.erase(digits, 1);
        }
        return str;
    }

    // Shortest round-trip digits placed around the decimal point, so a large
    // integer is padded with zeros past its last significant digit instead of
    // showing its exact binary value.
    auto [ptr, ec] { std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::scientific) };
    (void)ec;
    std::string_view scientific{buf.data(), static_cast<size_t>(ptr - buf.data())};

    bool negative = scientific.front() == '-';
    auto e = scientific.find('e');

    std::string digits;
    for (size_t i = negative ? 1 : 0; i < e; ++i)
    {
        if (scientific[i] != '.')
            digits += scientific[i];
    }

    auto exponent_text = scientific.substr(e + 1);
    if (exponent_text.front() == '+')
        exponent_text.remove_prefix(1);
    auto [exp_ec, exponent] { parse<int>(exponent_text) };
    (void)exp_ec;

    // Digits before the decimal point
    int point = exponent + 1;
    int count = static_cast<int>(digits.size());

    std::string out = negative ? "-" : "";
    if (point >= count)
        out += digits + std::string(point - count, '0');
    else if (point > 0)
        out += digits.substr(0, point) + "." + digits.substr(point);
    else
        out += "0." + std::string(-point, '0') + digits;
    return out;
}

double util::round_half_up(double value)
{
    return std::floor(value + 0.5);
}

double util::round_to(double value, int decimals)
{
    double factor = std::pow(10.0, decimals);
    double rounded = round_half_up(value * factor) / factor;
    return rounded == 0 ? 0.0 : rounded;
}

namespace
{
    std::string format_local_time(const char* format)
    {
        char buf[16];
        auto now = std::time(nullptr);
        struct tm local{};
        localtime_r(&now, &local);
        auto len = strftime(buf, sizeof(buf), format, &local);
        return std::string{buf, len};
    }
}

std::string util::today_iso()
{
    return format_local_time("%Y-%m-%d");
}

std::string util::current_month()
{
    return format_local_time("%Y-%m");
}
