#include <cstdlib>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "boletapp.hpp"

int main(int argc, const char** argv)
{
    try
    {
        return boletapp::run(argc, argv);
    }
    catch (std::invalid_argument& e)
    {
        spdlog::error("Invalid options: {}", e.what());
        spdlog::error("Run with --help to see the available options.");
        return EXIT_FAILURE;
    }
}
