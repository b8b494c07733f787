#include "boletapp.hpp"

#include <httpserver.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>

#include "export_opts.hpp"
#include "helpers/signals.hpp"
#include "resources.hpp"
#include "sinks/file_sink.hpp"

void boletapp::initialize_logging()
{
    spdlog::set_pattern("[%D %r] [thread %t] [%^%n - %l%$] %v");

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);

    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>("logs/export.log", 0, 0);
    file_sink->set_level(spdlog::level::trace);

    auto logger = std::make_shared<spdlog::logger>("boletapp", spdlog::sinks_init_list({file_sink, console_sink}));
    logger->set_level(spdlog::level::trace);

    spdlog::flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::seconds(2));
    spdlog::set_default_logger(logger);
}

namespace
{
    int export_once(const ExportOptions& opts, const models::TransactionList& transactions)
    {
        auto kind = exports::kind_name(opts.request.kind);

        try
        {
            sinks::DirectorySink sink{opts.output};
            if (!exports::run_export(opts.request, &transactions, sink))
                spdlog::info("Nothing to export for the {} export, no file written.", kind);
            return 0;
        }
        catch (std::exception& e)
        {
            spdlog::error("The {} export failed: {}", kind, e.what());
            return 1;
        }
    }

    int serve(const ExportOptions& opts, const resources::TransactionsRef& transactions)
    {
        using httpserver::create_webserver;
        using httpserver::http::http_utils;

        auto builder = create_webserver(opts.port)
                .max_connections(opts.max_connections)
                .connection_timeout(opts.timeout)
                .start_method(http_utils::INTERNAL_SELECT)
                .max_threads(opts.max_threads)
                .log_access([](const auto& url) {
                    spdlog::info("ACCESSING: {}", url);
                })
                .log_error([](const auto& err) {
                    spdlog::error("ERROR: {}", err);
                });

        // Catching Ctrl-C (SIGINT) so the server can shut down gracefully.
        signals::catch_interrupt();

        httpserver::webserver ws = builder;
        auto resource_list = resources::resources(transactions);
        for (auto& resource : resource_list)
        {
            ws.register_resource(resource->endpoint(), resource.get(), resource->family());
        }

        spdlog::info("Serving exports of {} transactions on port {}...", transactions->size(), opts.port);
        ws.start(false);

        signals::wait_for_interrupt();

        spdlog::info("Graceful shutdown requested, shutting down...");

        if (ws.is_running())
            ws.sweet_kill();

        spdlog::debug("Webserver gracefully killed.");
        return 0;
    }
}

int boletapp::run(int argc, const char** argv)
{
    auto opts = parse_options(argc, argv);

    initialize_logging();

    resources::TransactionsRef transactions;
    try
    {
        transactions = models::load_transactions(opts.transactions);
    }
    catch (std::exception& e)
    {
        spdlog::critical("Unable to load transactions from `{}`: {}", opts.transactions, e.what());
        return 1;
    }

    if (opts.serve)
        return serve(opts, transactions);

    return export_once(opts, *transactions);
}
