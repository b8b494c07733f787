#include "env.hpp"

#include <cstdlib>
#include <algorithm>

#include "utilities.hpp"

namespace env
{
    std::optional<std::string> get_string(const char* name)
    {
        if (const char* x = std::getenv(name))
        {
            std::string res = x;
            if (res.empty())
                return {};
            return res;
        }

        return {};
    }

    std::string get_string(const char* name, std::string def)
    {
        return get_string(name).value_or(std::move(def));
    }

    std::optional<std::string> get_string(const char* name, std::optional<std::string> def)
    {
        if (auto value = get_string(name))
            return value;
        return def;
    }

    std::optional<bool> get_bool(const char* name)
    {
        if (auto optstr = get_string(name))
        {
            auto str = *optstr;
            if (util::is_integer(str))
            {
                return !!std::stoi(str);
            }

            str = util::to_lower(str);
            return str == "true" || str == "on" || str == "yes" || str == "y";
        }

        return {};
    }

    bool get_bool(const char* name, bool def)
    {
        return get_bool(name).value_or(def);
    }

    std::optional<uint16_t> get_int(const char* name)
    {
        if (auto optstr = get_string(name))
        {
            auto [ec, value] { util::parse<uint16_t>(*optstr) };
            if (ec == std::errc{})
                return value;
        }

        return {};
    }

    uint16_t get_int(const char* name, uint16_t def)
    {
        return get_int(name).value_or(def);
    }
}
