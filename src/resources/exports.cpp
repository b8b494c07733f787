#include "resources.hpp"

#include <optional>
#include <stdexcept>

namespace resources::download
{
    using exports::ExportKind;
    using exports::ExportRequest;

    namespace
    {
        std::optional<std::string> arg_if_set(const http_request& req, const std::string& name)
        {
            auto args = req.get_args();
            if (args.find(name) == args.end())
                return std::nullopt;

            std::string value = req.get_arg(name);
            return value;
        }

        ExportRequest with_period(ExportKind kind, const http_request& req)
        {
            ExportRequest request;
            request.kind = kind;
            request.year = arg_if_set(req, "year");
            request.month = arg_if_set(req, "month");
            return request;
        }
    }

    const Ref<http_response> basic::render_GET(const http_request&)
    {
        return export_response(ExportRequest{ ExportKind::Basic }, transactions());
    }

    const Ref<http_response> year::render_GET(const http_request& req)
    {
        return export_response(with_period(ExportKind::Year, req), transactions());
    }

    const Ref<http_response> month::render_GET(const http_request& req)
    {
        return export_response(with_period(ExportKind::Month, req), transactions());
    }

    const Ref<http_response> statistics::render_GET(const http_request& req)
    {
        return export_response(with_period(ExportKind::Statistics, req), transactions());
    }

    const Ref<http_response> yearly_statistics::render_GET(const http_request& req)
    {
        return export_response(with_period(ExportKind::YearlyStatistics, req), transactions());
    }

    const Ref<http_response> items::render_GET(const http_request& req)
    {
        ExportRequest request;
        try
        {
            request = exports::items_request(arg_if_set(req, "year"), arg_if_set(req, "month"), arg_if_set(req, "lang"));
        }
        catch (std::invalid_argument& e)
        {
            return make_json_error(e.what(), 400);
        }

        return export_response(request, transactions());
    }
}
