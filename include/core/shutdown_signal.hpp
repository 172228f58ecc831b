#ifndef SHUTDOWN_SIGNAL_HPP
#define SHUTDOWN_SIGNAL_HPP

#include <atomic>
#include <chrono>

// Cancellation source shared by every blocking wait in the daemon.
// trigger() only touches an atomic and an eventfd, so it may be called from
// a signal handler.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    void trigger();
    bool requested() const { return requested_.load(); }

    // Readable once triggered; poll() it alongside other descriptors.
    int fd() const { return fd_; }

    // Sleeps up to `timeout`; true if shutdown was requested meanwhile.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    static_assert(std::atomic<bool>::is_always_lock_free,
                  "std::atomic<bool> must be lock-free for signal handler use");

    std::atomic<bool> requested_{false};
    int fd_ = -1;
};

// Routes SIGINT/SIGTERM/SIGHUP to `signal` and ignores SIGPIPE.
void installShutdownHandlers(ShutdownSignal& signal);

#endif
