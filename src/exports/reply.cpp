#include "exports.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace exports
{
    ExportReply error_reply(const std::string& message, int status)
    {
        nlohmann::json body = { { "error", message } };
        return ExportReply { status, body.dump(), "application/json", {} };
    }

    ExportReply reply_to(const ExportRequest& request, const TransactionList* transactions)
    {
        sinks::MemorySink sink;
        return reply_to(request, transactions, sink);
    }

    ExportReply reply_to(const ExportRequest& request, const TransactionList* transactions, sinks::MemorySink& sink)
    {
        try
        {
            validate(request);
        }
        catch (std::invalid_argument& e)
        {
            return error_reply(e.what(), 400);
        }

        try
        {
            if (!run_export(request, transactions, sink))
                return ExportReply { 204, "", "text/plain", {} };

            const auto& delivery = sink.last();
            ExportReply reply { 200, delivery.content, std::string{csv::MIME_TYPE}, {} };
            reply.headers["Content-Disposition"] = "attachment; filename=\"" + delivery.filename + "\"";
            return reply;
        }
        catch (std::exception& e)
        {
            spdlog::error("An error occurred while running the {} export: {}", kind_name(request.kind), e.what());
            return error_reply("An error occurred while processing your request, please notify a webadmin.", 500);
        }
    }

    ExportRequest items_request(const std::optional<std::string>& year, const std::optional<std::string>& month, const std::optional<std::string>& lang)
    {
        ExportRequest request;
        request.kind = ExportKind::Items;
        request.year = year;

        if (lang)
        {
            auto parsed = parse_language(*lang);
            if (!parsed)
                throw std::invalid_argument("\"lang\" must be either en or es!");
            request.lang = *parsed;
        }

        if (month)
        {
            if (month->size() != 7 || (*month)[4] != '-')
                throw std::invalid_argument("\"month\" must be formatted as YYYY-MM!");

            request.year = month->substr(0, 4);
            request.month = month->substr(5, 2);
        }

        return request;
    }
}
