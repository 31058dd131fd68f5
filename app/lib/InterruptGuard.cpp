#include "InterruptGuard.hpp"
#include "AppException.hpp"

#include <atomic>
#include <cstring>

namespace {
std::atomic<bool> g_interrupted{false};

void handle_interrupt(int)
{
    g_interrupted.store(true);
}
}


InterruptGuard::InterruptGuard()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &previous_int_);
    sigaction(SIGTERM, &sa, &previous_term_);
}


InterruptGuard::~InterruptGuard()
{
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
}


bool InterruptGuard::interrupted() noexcept
{
    return g_interrupted.load();
}


void InterruptGuard::reset() noexcept
{
    g_interrupted.store(false);
}


void InterruptGuard::throw_if_interrupted(const std::string& context)
{
    if (interrupted()) {
        THROW_APP_ERROR(ErrorCodes::Code::PROCESSING_INTERRUPTED, context);
    }
}
