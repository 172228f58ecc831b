#include "core/shutdown_signal.hpp"

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

// Constructor
ShutdownSignal::ShutdownSignal() {
    fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (fd_ < 0) throw std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno));
}

// Destructor
ShutdownSignal::~ShutdownSignal() {
    if (fd_ >= 0) ::close(fd_);
}

void ShutdownSignal::trigger() {
    requested_.store(true);
    const uint64_t one = 1;
    // A full counter still leaves the fd readable.
    const ssize_t n = ::write(fd_, &one, sizeof(one));
    (void)n;
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds timeout) const {
    if (requested()) return true;

    pollfd pfd{fd_, POLLIN, 0};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!requested()) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) break;

        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc > 0) break;
        if (rc < 0 && errno != EINTR) break;
    }
    return requested();
}

static ShutdownSignal* g_shutdown = nullptr;

static void onShutdownSignal(int /*sig*/) {
    if (g_shutdown) g_shutdown->trigger();
}

void installShutdownHandlers(ShutdownSignal& signal) {
    g_shutdown = &signal;

    struct sigaction sa{};
    sa.sa_handler = onShutdownSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;    // no SA_RESTART: blocking calls must see EINTR
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
    ::sigaction(SIGHUP, &sa, nullptr);

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGPIPE, &ignore, nullptr);
}
