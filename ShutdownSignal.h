#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>

/**
 * @brief Turns process signals into an ordinary callback on a waiter thread.
 *
 * The constructor blocks the signals in the calling thread, and every thread
 * started afterwards inherits that mask, so the signals are only ever taken by
 * sigwait() on the waiter. The callback therefore runs outside signal context
 * and may lock, log and stop the HTTP server.
 *
 * Construct it in main() before any other thread exists (Sentry's worker,
 * httplib's pool).
 */
class ShutdownSignal {
public:
    using Callback = std::function<void(int)>;

    explicit ShutdownSignal(std::initializer_list<int> signals = {SIGINT, SIGTERM});
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Starts the waiter; onSignal runs once per received signal.
    void start(Callback onSignal);

    // Wakes and joins the waiter without invoking the callback. Idempotent.
    void stopWaiting();

private:
    void waitLoop();

    sigset_t signals;
    sigset_t previousMask;
    int wakeSignal;
    Callback onSignal;
    std::atomic<bool> cancelled{false};
    std::thread waiter;
};
