#include "signals.hpp"

#include <csignal>
#include <thread>

namespace
{
    volatile std::sig_atomic_t interrupt_flag = 0;

    void interrupt_handler(int signum)
    {
        if (signum == SIGINT)
            interrupt_flag = 1;
    }
}

namespace signals
{
    void catch_interrupt()
    {
        std::signal(SIGINT, interrupt_handler);
    }

    bool interrupted() noexcept
    {
        return interrupt_flag != 0;
    }

    void reset() noexcept
    {
        interrupt_flag = 0;
    }

    void wait_for_interrupt(std::chrono::milliseconds poll)
    {
        while (!interrupted())
            std::this_thread::sleep_for(poll);
    }
}
