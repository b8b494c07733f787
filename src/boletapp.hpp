#pragma once

namespace boletapp
{
    /**
     * Sets up the default logger: colored output on stdout and a daily rotated
     * file under logs/export.log.
     */
    void initialize_logging();

    /**
     * Parses the options, loads the transaction document, and then either writes
     * the requested export into the output directory or serves exports over http
     * until SIGINT.
     *
     * @returns The process exit code.
     * @throws std::invalid_argument If the options are invalid.
     */
    int run(int argc, const char** argv);
}
