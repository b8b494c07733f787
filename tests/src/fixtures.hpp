#pragma once

#include <string>
#include <vector>

#include "models.hpp"
#include "csv/csv.hpp"

namespace fixtures
{
    inline models::Transaction transaction(std::string date, std::string merchant, std::string category, double total)
    {
        models::Transaction t;
        t.date = std::move(date);
        t.merchant = std::move(merchant);
        t.category = std::move(category);
        t.total = total;
        return t;
    }

    inline models::LineItem item(std::string name, double price)
    {
        models::LineItem i;
        i.name = std::move(name);
        i.price = price;
        return i;
    }

    // CSV text without its BOM, split on "\n"
    inline std::vector<std::string> lines(const std::string& csv_text)
    {
        std::string body = csv_text.substr(csv::UTF8_BOM.size());

        std::vector<std::string> out;
        size_t start = 0;
        size_t next;
        while ((next = body.find('\n', start)) != std::string::npos)
        {
            out.push_back(body.substr(start, next - start));
            start = next + 1;
        }
        out.push_back(body.substr(start));
        return out;
    }
}
