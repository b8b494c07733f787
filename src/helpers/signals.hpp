#pragma once

#include <chrono>

namespace signals
{
    /**
     * Routes SIGINT to a handler that only records the request, so the
     * handler stays async-signal-safe.
     */
    void catch_interrupt();

    bool interrupted() noexcept;

    // Forgets an earlier SIGINT
    void reset() noexcept;

    /**
     * Blocks the calling thread until SIGINT has been caught, checking every
     * `poll`.
     */
    void wait_for_interrupt(std::chrono::milliseconds poll = std::chrono::milliseconds(250));
}
