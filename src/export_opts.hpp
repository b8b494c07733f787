#pragma once

#include <cstdint>
#include <string>
#include <optional>

#include "exports/exports.hpp"

/**
 * A structure containing all of the configurable options of the exporter.
 *
 * There are multiple ways to set these options, which are:
 *   A config.json file
 *   Environment variables
 *   Command line flags
 *
 * Note that command line arguments override environment variables
 * Environment variables override config files
 * and config files override the defaults.
 *
 * So defaults -> config files -> environment variables -> command line flags.
 */
struct ExportOptions
{
    std::string transactions = "transactions.json";
    std::string output = "exports";
    exports::ExportRequest request;

    bool serve = false;
    uint16_t port = 8080;
    uint16_t max_connections = 0;
    uint16_t timeout = 180;
    uint16_t max_threads = 1;
};

/**
 * Reads a json config file over the given options. Keys that are missing or
 * null keep their current value.
 *
 * @throws std::invalid_argument If the file isn't valid json, or a key holds
 *                               an unknown export kind or language.
 */
ExportOptions parse_options_from_file(const std::string& file, ExportOptions opts = {});

/**
 * Overrides the given options with any BOLETAPP_* environment variables that
 * are set.
 *
 * @throws std::invalid_argument If BOLETAPP_EXPORT or BOLETAPP_LANG is unknown.
 */
ExportOptions apply_environment(ExportOptions opts);

/**
 * Generates an ExportOptions structure with values from config files,
 * environment variables, and command line arguments, and sanity
 * checks the options to make sure they're valid.
 *
 * @param argc Argument count passed in from `main`
 * @param argv Argument list passed in from `main`
 * @returns A populated and sanity checked ExportOptions struct
 * @throws std::invalid_argument Thrown whenever a sanity check fails
 */
ExportOptions parse_options(int argc, const char** argv);

/**
 * The sanity checks run at the end of `parse_options`.
 *
 * @throws std::invalid_argument Thrown whenever a sanity check fails
 */
void validate_options(const ExportOptions& options);
