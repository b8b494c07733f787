#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace env
{
    std::optional<std::string> get_string(const char* name);
    std::optional<bool> get_bool(const char* name);
    // NOTE: Ports, connection counts and timeouts all fit in 16 bits, so
    //       that's the only numeric getter for now.
    std::optional<uint16_t> get_int(const char* name);

    std::string get_string(const char* name, std::string def);
    std::optional<std::string> get_string(const char* name, std::optional<std::string> def);
    bool get_bool(const char* name, bool def);
    uint16_t get_int(const char* name, uint16_t def);
}
