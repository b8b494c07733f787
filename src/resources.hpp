#pragma once

#include <httpserver.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "models.hpp"
#include "exports/exports.hpp"

namespace resources
{
    using httpserver::http_resource;
    using httpserver::http_response;
    using httpserver::http_request;

    template<class T>
    using Ref = std::shared_ptr<T>;

    using TransactionsRef = std::shared_ptr<const models::TransactionList>;

    Ref<http_response> to_response(const exports::ExportReply& reply);

    /**
     * JSON error body, `{"error": message}`, with the given status code.
     */
    Ref<http_response> make_json_error(const std::string& message, int code);

    /**
     * Sends `exports::reply_to` for the request as the http response.
     */
    Ref<http_response> export_response(const exports::ExportRequest& request, const models::TransactionList* transactions);

    class clean_resource : public http_resource
    {
        const std::string p_endpoint;
        const bool p_family;
        TransactionsRef p_transactions;
    public:
        clean_resource(std::string endpoint, bool family, TransactionsRef transactions) :
            p_endpoint(std::move(endpoint)), p_family(family), p_transactions(std::move(transactions))
        {
            disallow_all();
            set_allowing("GET", true);
        }

        [[nodiscard]] inline const std::string& endpoint() const noexcept { return p_endpoint; }
        [[nodiscard]] inline bool family() const noexcept { return p_family; }
        [[nodiscard]] inline const models::TransactionList* transactions() const noexcept { return p_transactions.get(); }
    };

    #define EXPORT_RESOURCE(name, endpoint) class name : public clean_resource                 \
    {                                                                                          \
    public:                                                                                    \
        explicit name(TransactionsRef transactions) :                                          \
            clean_resource(endpoint, false, std::move(transactions))                           \
        {}                                                                                     \
                                                                                               \
        const Ref<http_response> render_GET(const http_request& req) override;                 \
    }

    namespace download
    {
        EXPORT_RESOURCE(basic, "/export/basic");
        EXPORT_RESOURCE(year, "/export/year");
        EXPORT_RESOURCE(month, "/export/month");
        EXPORT_RESOURCE(statistics, "/export/statistics");
        EXPORT_RESOURCE(yearly_statistics, "/export/yearly_statistics");
        EXPORT_RESOURCE(items, "/export/items");
    }

    std::vector<Ref<clean_resource>> resources(const TransactionsRef& transactions);
}
