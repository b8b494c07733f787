#include "models.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace
{
    std::optional<std::string> optional_string(const nlohmann::json& j, const char* name)
    {
        auto it = j.find(name);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        return it->get<std::string>();
    }

    std::optional<double> optional_number(const nlohmann::json& j, const char* name)
    {
        auto it = j.find(name);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        return it->get<double>();
    }

    template<typename T>
    T required(const nlohmann::json& j, const char* name)
    {
        auto it = j.find(name);
        if (it == j.end() || it->is_null())
            throw models::LoadError(std::string{"missing \""} + name + "\"");
        return it->get<T>();
    }

    models::LineItem parse_item(const nlohmann::json& j)
    {
        if (!j.is_object())
            throw models::LoadError("item is not an object");

        return models::LineItem {
            required<std::string>(j, "name"),
            required<double>(j, "price"),
            optional_number(j, "qty"),
            optional_string(j, "category"),
            optional_string(j, "subcategory")
        };
    }

    models::Transaction parse_transaction(const nlohmann::json& j)
    {
        if (!j.is_object())
            throw models::LoadError("transaction is not an object");

        models::Transaction transaction;
        transaction.id = optional_string(j, "id");
        transaction.date = required<std::string>(j, "date");
        transaction.merchant = required<std::string>(j, "merchant");
        transaction.alias = optional_string(j, "alias");
        transaction.category = required<std::string>(j, "category");
        transaction.total = required<double>(j, "total");

        auto items = j.find("items");
        if (items != j.end() && !items->is_null())
        {
            if (!items->is_array())
                throw models::LoadError("\"items\" is not an array");

            transaction.items.reserve(items->size());
            for (size_t i = 0; i < items->size(); ++i)
            {
                try
                {
                    transaction.items.push_back(parse_item((*items)[i]));
                }
                catch (models::LoadError& ex)
                {
                    throw models::LoadError("items[" + std::to_string(i) + "]: " + ex.what());
                }
            }
        }

        return transaction;
    }
}

models::TransactionList models::parse_transactions(const nlohmann::json& document)
{
    const nlohmann::json* list = &document;
    if (document.is_object() && document.contains("transactions"))
        list = &document["transactions"];

    if (!list->is_array())
        throw LoadError("transaction document must be an array or an object with a \"transactions\" array");

    TransactionList transactions;
    transactions.reserve(list->size());
    for (size_t i = 0; i < list->size(); ++i)
    {
        try
        {
            transactions.push_back(parse_transaction((*list)[i]));
        }
        catch (LoadError& ex)
        {
            throw LoadError("transactions[" + std::to_string(i) + "]: " + ex.what());
        }
        catch (nlohmann::json::type_error& ex)
        {
            throw LoadError("transactions[" + std::to_string(i) + "]: wrong value type (" + ex.what() + ")");
        }
    }

    return transactions;
}

std::shared_ptr<const models::TransactionList> models::load_transactions(const std::string& path)
{
    if (!fs::is_regular_file(path))
        throw LoadError("transaction document '" + path + "' does not exist");

    std::ifstream in(path);
    nlohmann::json j;
    try
    {
        in >> j;
    }
    catch (nlohmann::json::parse_error& ex)
    {
        throw LoadError("unable to parse '" + path + "': " + ex.what());
    }

    auto transactions = std::make_shared<const TransactionList>(parse_transactions(j));
    spdlog::info("Loaded {} transaction(s) from {}", transactions->size(), path);
    return transactions;
}

void models::to_json(nlohmann::json& j, const LineItem& item)
{
    j = nlohmann::json{{"name", item.name}, {"price", item.price}};
    if (item.qty)
        j["qty"] = *item.qty;
    if (item.category)
        j["category"] = *item.category;
    if (item.subcategory)
        j["subcategory"] = *item.subcategory;
}

void models::to_json(nlohmann::json& j, const Transaction& transaction)
{
    j = nlohmann::json{
        {"date", transaction.date},
        {"merchant", transaction.merchant},
        {"category", transaction.category},
        {"total", transaction.total},
        {"items", transaction.items}
    };
    if (transaction.id)
        j["id"] = *transaction.id;
    if (transaction.alias)
        j["alias"] = *transaction.alias;
}
