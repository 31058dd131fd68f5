#ifndef INTERRUPT_GUARD_HPP
#define INTERRUPT_GUARD_HPP

#include <csignal>
#include <string>

/**
 * @brief Turns SIGINT/SIGTERM into a flag the run loop and the prompt check.
 *
 * Handlers are installed without SA_RESTART so a read blocked on the terminal
 * returns. The previous handlers come back when the guard is destroyed.
 */
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    static bool interrupted() noexcept;
    static void reset() noexcept;

    /**
     * @brief Throws ErrorCodes::AppException(PROCESSING_INTERRUPTED) once a signal arrived.
     */
    static void throw_if_interrupted(const std::string& context);

private:
    struct sigaction previous_int_ {};
    struct sigaction previous_term_ {};
};

#endif
