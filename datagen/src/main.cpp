#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

#include <nlohmann/json.hpp>

#include "generation.hpp"
#include "helpers/utilities.hpp"

namespace fs = std::filesystem;

constexpr size_t DEFAULT_COUNT = 500;

int main(int argc, char** argv)
{
    if (argc != 3 && argc != 4)
    {
        std::cout << "Usage: " << argv[0] << " <year> <output.json> [count]\n";
        return 1;
    }

    auto [year_ec, year] { util::parse<int>(argv[1]) };
    if (year_ec != std::errc{} || year < 1000 || year > 9999)
    {
        std::cerr << argv[1] << " is not a four digit year!\n";
        return 1;
    }

    size_t count = DEFAULT_COUNT;
    if (argc == 4)
    {
        auto [count_ec, value] { util::parse<size_t>(argv[3]) };
        if (count_ec != std::errc{} || value == 0)
        {
            std::cerr << argv[3] << " is not a positive transaction count!\n";
            return 1;
        }
        count = value;
    }

    /**
     * If the output path exists, make sure it's a file we can replace and not a directory.
     */
    fs::path output = argv[2];
    if (fs::is_directory(output))
    {
        std::cerr << argv[2] << " is a directory!\n";
        return 1;
    }

    std::random_device rd;
    std::mt19937 gen(rd());
    auto transactions = generation::generate_year(year, count, gen);

    nlohmann::json document;
    document["transactions"] = transactions;

    std::ofstream out(output, std::ios::out | std::ios::trunc);
    if (!out)
    {
        std::cerr << "Unable to open " << argv[2] << " for writing!\n";
        return 1;
    }

    out << document.dump(2) << "\n";
    if (!out)
    {
        std::cerr << "Unable to write " << argv[2] << "!\n";
        return 1;
    }

    std::cout << "Wrote " << transactions.size() << " transactions for " << year << " to " << argv[2] << "\n";
    return 0;
}
