#include "resources.hpp"

namespace resources
{
    using httpserver::string_response;

    std::vector<Ref<clean_resource>> resources(const TransactionsRef& transactions)
    {
        return {
            std::make_shared<download::basic>(transactions),
            std::make_shared<download::year>(transactions),
            std::make_shared<download::month>(transactions),
            std::make_shared<download::statistics>(transactions),
            std::make_shared<download::yearly_statistics>(transactions),
            std::make_shared<download::items>(transactions)
        };
    }

    Ref<http_response> to_response(const exports::ExportReply& reply)
    {
        auto response = std::make_shared<string_response>(reply.body, reply.status, reply.content_type);
        for (const auto& [name, value] : reply.headers)
            response->with_header(name, value);
        return response;
    }

    Ref<http_response> make_json_error(const std::string& message, int code)
    {
        return to_response(exports::error_reply(message, code));
    }

    Ref<http_response> export_response(const exports::ExportRequest& request, const models::TransactionList* transactions)
    {
        return to_response(exports::reply_to(request, transactions));
    }
}
