#include "csv.hpp"

namespace csv
{
    constexpr std::string_view FORMULA_INJECTION_CHARS = "=+-@\t\r";

    std::string sanitize(std::string_view value)
    {
        if (value.empty() || FORMULA_INJECTION_CHARS.find(value.front()) == std::string_view::npos)
            return std::string{value};

        std::string sanitized;
        sanitized.reserve(value.size() + 1);
        sanitized += '\'';
        sanitized += value;
        return sanitized;
    }

    std::string escape(std::string_view value)
    {
        auto sanitized = sanitize(value);
        if (sanitized.find_first_of(",\"\n") == std::string::npos)
            return sanitized;

        std::string quoted;
        quoted.reserve(sanitized.size() + 2);
        quoted += '"';
        for (char c : sanitized)
        {
            if (c == '"')
                quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }
}
