#include "export_opts.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <popl.hpp>

#include "helpers/env.hpp"

namespace fs = std::filesystem;

using exports::ExportKind;
using exports::Language;

namespace
{
    ExportKind kind_or_throw(const std::string& name)
    {
        auto kind = exports::parse_kind(name);
        if (!kind)
            throw std::invalid_argument("unknown export '" + name + "', expected one of basic, year, month, statistics, yearly-statistics, items");
        return *kind;
    }

    Language language_or_throw(const std::string& name)
    {
        auto lang = exports::parse_language(name);
        if (!lang)
            throw std::invalid_argument("unknown language '" + name + "', expected en or es");
        return *lang;
    }

    // Lets "3" stand in for "03"
    std::string pad_month(std::string month)
    {
        if (month.size() == 1 && util::is_digits(month))
            month.insert(month.begin(), '0');
        return month;
    }
}

/**
 * Given a json configuration file, it will populate an ExportOptions struct.
 * The format of the JSON file is the following:
 * @code
 * {
 *      "transactions": string,
 *      "output": string,
 *      "export": string,
 *      "year": string | int,
 *      "month": string | int,
 *      "lang": string,
 *      "serve": bool,
 *      "port": int,
 *      "connections": int,
 *      "timeout": int,
 *      "threads": int
 * }
 * @endcode
 */
ExportOptions parse_options_from_file(const std::string& file, ExportOptions opts)
{
    nlohmann::json j;
    try
    {
        std::ifstream i(file);
        i >> j;
    }
    catch (nlohmann::json::exception& e)
    {
        throw std::invalid_argument("unable to read config file " + file + ": " + e.what());
    }

    auto get_or_default = [&j](const char* name, auto default_val) -> decltype(default_val)
    {
        if (!j.contains(name) || j[name].is_null())
            return default_val;

        return j[name].get<decltype(default_val)>();
    };

    // Years and months are just as often written as numbers.
    auto get_period = [&j](const char* name, std::optional<std::string> default_val) -> std::optional<std::string>
    {
        if (!j.contains(name) || j[name].is_null())
            return default_val;

        if (j[name].is_number_integer())
            return std::to_string(j[name].get<int>());

        return j[name].get<std::string>();
    };

    try
    {
        opts.transactions = get_or_default("transactions", opts.transactions);
        opts.output = get_or_default("output", opts.output);
        opts.serve = get_or_default("serve", opts.serve);
        opts.port = get_or_default("port", opts.port);
        opts.max_connections = get_or_default("connections", opts.max_connections);
        opts.timeout = get_or_default("timeout", opts.timeout);
        opts.max_threads = get_or_default("threads", opts.max_threads);

        opts.request.year = get_period("year", opts.request.year);
        opts.request.month = get_period("month", opts.request.month);

        if (j.contains("export") && !j["export"].is_null())
            opts.request.kind = kind_or_throw(j["export"].get<std::string>());
        if (j.contains("lang") && !j["lang"].is_null())
            opts.request.lang = language_or_throw(j["lang"].get<std::string>());
    }
    catch (nlohmann::json::type_error& e)
    {
        throw std::invalid_argument("config file " + file + " has a key of the wrong type: " + e.what());
    }

    if (opts.request.month)
        opts.request.month = pad_month(*opts.request.month);

    return opts;
}

ExportOptions apply_environment(ExportOptions opts)
{
    opts.transactions = env::get_string("BOLETAPP_TRANSACTIONS", opts.transactions);
    opts.output = env::get_string("BOLETAPP_OUTPUT", opts.output);
    opts.request.year = env::get_string("BOLETAPP_YEAR", opts.request.year);
    opts.request.month = env::get_string("BOLETAPP_MONTH", opts.request.month);
    opts.serve = env::get_bool("BOLETAPP_SERVE", opts.serve);
    opts.port = env::get_int("BOLETAPP_PORT", opts.port);
    opts.max_connections = env::get_int("BOLETAPP_MAX_CONNECTIONS", opts.max_connections);
    opts.timeout = env::get_int("BOLETAPP_TIMEOUT", opts.timeout);
    opts.max_threads = env::get_int("BOLETAPP_MAX_THREADS", opts.max_threads);

    if (auto kind = env::get_string("BOLETAPP_EXPORT"))
        opts.request.kind = kind_or_throw(*kind);
    if (auto lang = env::get_string("BOLETAPP_LANG"))
        opts.request.lang = language_or_throw(*lang);

    if (opts.request.month)
        opts.request.month = pad_month(*opts.request.month);

    return opts;
}

void validate_options(const ExportOptions& options)
{
    if (options.transactions.empty())
        throw std::invalid_argument("no transaction document was given!");

    if (!options.serve && options.output.empty())
        throw std::invalid_argument("no output directory was given!");

    if (options.serve && options.max_threads == 0)
        throw std::invalid_argument("the server needs at least one thread!");

    // The server takes the period from each request.
    if (!options.serve)
        exports::validate(options.request);
}

ExportOptions parse_options(int argc, const char** argv)
{
    ExportOptions options;
    auto configFile = env::get_string("BOLETAPP_CONFIG_FILE", std::string{"config.json"});

    if (fs::exists(configFile))
        options = parse_options_from_file(configFile, options);

    options = apply_environment(options);

    popl::OptionParser op("OPTIONS");
    auto help_opt = op.add<popl::Switch>("h", "help", "show this message");
    auto conf_opt = op.add<popl::Value<std::string>>("i", "config", "config file to use");
    auto tx_opt = op.add<popl::Value<std::string>>("f", "transactions", "transaction document (json) to export from");
    auto out_opt = op.add<popl::Value<std::string>>("o", "output", "directory the csv files are written to");
    auto kind_opt = op.add<popl::Value<std::string>>("x", "export", "basic, year, month, statistics, yearly-statistics or items");
    auto year_opt = op.add<popl::Value<std::string>>("y", "year", "year to export (YYYY)");
    auto month_opt = op.add<popl::Value<std::string>>("m", "month", "month to export (01-12)");
    auto lang_opt = op.add<popl::Value<std::string>>("l", "lang", "language of the items export (en or es)");
    auto serve_opt = op.add<popl::Switch>("s", "serve", "serve exports over http instead of writing one");
    auto port_opt = op.add<popl::Value<uint16_t>>("p", "port", "port to start the server on");
    auto conn_opt = op.add<popl::Value<uint16_t>>("c", "connections", "maximum connections to allow");
    auto time_opt = op.add<popl::Value<uint16_t>>("t", "timeout", "seconds of inactivity before connection is timed out");
    auto thread_opt = op.add<popl::Value<uint16_t>>("T", "threads", "max threads for the thread pool");
    op.parse(argc, argv);

    if (help_opt->is_set())
    {
        std::cout << "usage:\n";
        std::cout << "\t" << argv[0] << " [OPTIONS]\n\n";
        std::cout << op << "\n";
        std::exit(EXIT_SUCCESS);
    }

    if (conf_opt->is_set())
    {
        if (!fs::exists(conf_opt->value()))
            throw std::invalid_argument("config file " + conf_opt->value() + " does not exist!");
        // The environment still wins over any config file
        options = apply_environment(parse_options_from_file(conf_opt->value(), options));
    }

    if (tx_opt->is_set())
        options.transactions = tx_opt->value();
    if (out_opt->is_set())
        options.output = out_opt->value();
    if (kind_opt->is_set())
        options.request.kind = kind_or_throw(kind_opt->value());
    if (year_opt->is_set())
        options.request.year = year_opt->value();
    if (month_opt->is_set())
        options.request.month = month_opt->value();
    if (lang_opt->is_set())
        options.request.lang = language_or_throw(lang_opt->value());
    if (serve_opt->is_set())
        options.serve = true;
    if (port_opt->is_set())
        options.port = port_opt->value();
    if (conn_opt->is_set())
        options.max_connections = conn_opt->value();
    if (time_opt->is_set())
        options.timeout = time_opt->value();
    if (thread_opt->is_set())
        options.max_threads = thread_opt->value();

    if (options.request.month)
        options.request.month = pad_month(*options.request.month);

    validate_options(options);
    return options;
}
