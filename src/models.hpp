#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace models
{
    struct LineItem
    {
        std::string name;
        double price = 0;
        std::optional<double> qty;
        std::optional<std::string> category;
        std::optional<std::string> subcategory;
    };

    struct Transaction
    {
        std::optional<std::string> id;
        std::string date;
        std::string merchant;
        std::optional<std::string> alias;
        std::string category;
        double total = 0;
        std::vector<LineItem> items;
    };

    using TransactionList = std::vector<Transaction>;

    class LoadError : public std::runtime_error
    {
    public:
        explicit LoadError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * Builds the transaction list from a parsed document. The document is either
     * an array of transactions or an object holding one under "transactions".
     *
     * @throws LoadError If the document shape is wrong, or a transaction is missing
     *                   a required key. The message names the offending index.
     */
    TransactionList parse_transactions(const nlohmann::json& document);

    /**
     * Reads and parses a transaction document from disk.
     *
     * @throws LoadError If the file can't be read or isn't valid JSON.
     */
    std::shared_ptr<const TransactionList> load_transactions(const std::string& path);

    void to_json(nlohmann::json& j, const LineItem& item);
    void to_json(nlohmann::json& j, const Transaction& transaction);
}
