#pragma once
#include <flora/config.h>
#include <csignal>

namespace flora {

/**
 * @brief Window, GPU, audio and simulation wired into a fixed-rate loop.
 *
 * Each tick: poll input, read audio, advance the simulation, render,
 * present, then sleep until the next tick boundary. The loop ends on
 * window close, Esc, SIGINT/SIGTERM or after config.frames ticks.
 */
class FloraApp {
public:
    explicit FloraApp(const FloraConfig& config);

    /**
     * @brief Run until stopped.
     * @return Process exit status (0 on normal exit, 1 if GPU setup failed).
     * @throws std::runtime_error if the window cannot be created.
     */
    int run();

    /// Set from signal handlers; checked once per tick.
    static volatile std::sig_atomic_t stopRequested;

private:
    static void installSignalHandlers();

    FloraConfig config_;
};

} // namespace flora
