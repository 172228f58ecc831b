#include "input/device_reader.hpp"
#include "core/shutdown_signal.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

std::optional<KeyEvent> decodeKeyEvent(const input_event& ev, uint16_t keyCode) {
    if (ev.type != EV_KEY || ev.code != keyCode) return std::nullopt;

    KeyEvent event{KeyAction::Press, keyCode, {}};
    if (ev.value == 1) {
        event.action = KeyAction::Press;
    } else if (ev.value == 0) {
        event.action = KeyAction::Release;
    } else {
        return std::nullopt;    // 2 = autorepeat
    }

    const auto since = std::chrono::seconds(ev.input_event_sec) + std::chrono::microseconds(ev.input_event_usec);
    event.timestamp = std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(since));
    return event;
}

// Constructor
DeviceReader::DeviceReader(uint16_t keyCode, const ShutdownSignal& shutdown)
    : keyCode_(keyCode), shutdown_(shutdown) {}

// Destructor
DeviceReader::~DeviceReader() { close(); }

Result<void> DeviceReader::open(const std::string& path) {
    close();

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0) {
        return Fault{FaultKind::DeviceUnavailable, "open " + path + ": " + std::strerror(errno)};
    }

    fd_ = fd;
    path_ = path;
    pending_.clear();
    keyDown_ = false;

    // Kernel timestamps on the same clock as std::chrono::steady_clock.
    // Non-evdev sources (replay files) carry no usable time.
    int clock = CLOCK_MONOTONIC;
    timestamped_ = ::ioctl(fd_, EVIOCSCLOCKID, &clock) == 0;

    // Seed the key state so a key already held at open is not reported as a
    // fresh press.
    unsigned char keys[KEY_MAX / 8 + 1] = {};
    if (::ioctl(fd_, EVIOCGKEY(sizeof(keys)), keys) >= 0) {
        keyDown_ = (keys[keyCode_ / 8] >> (keyCode_ % 8)) & 1;
    }
    return {};
}

void DeviceReader::close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
    pending_.clear();
}

Result<KeyEvent> DeviceReader::next() {
    while (pending_.empty()) {
        if (fd_ < 0) return Fault{FaultKind::DeviceLost, "device is not open"};
        Result<void> filled = fill();
        if (!filled) return filled.fault();
    }

    KeyEvent event = pending_.front();
    pending_.pop_front();
    return event;
}

void DeviceReader::push(KeyEvent event) {
    const bool down = event.action == KeyAction::Press;
    if (down == keyDown_) return;   // not an edge
    keyDown_ = down;
    if (!timestamped_) event.timestamp = {};
    pending_.push_back(event);
}

void DeviceReader::resync() {
    unsigned char keys[KEY_MAX / 8 + 1] = {};
    if (::ioctl(fd_, EVIOCGKEY(sizeof(keys)), keys) < 0) return;

    const bool down = (keys[keyCode_ / 8] >> (keyCode_ % 8)) & 1;
    KeyEvent event{down ? KeyAction::Press : KeyAction::Release, keyCode_, {}};
    if (timestamped_) event.timestamp = std::chrono::steady_clock::now();
    push(event);
}

Result<void> DeviceReader::fill() {
    pollfd fds[2] = {{fd_, POLLIN, 0}, {shutdown_.fd(), POLLIN, 0}};

    while (true) {
        if (shutdown_.requested()) return Fault{FaultKind::Cancelled, "shutdown requested"};

        const int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return Fault{FaultKind::DeviceLost, std::string("poll: ") + std::strerror(errno)};
        }
        if (shutdown_.requested()) return Fault{FaultKind::Cancelled, "shutdown requested"};
        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            return Fault{FaultKind::DeviceLost, path_ + " hung up"};
        }
        if (!(fds[0].revents & POLLIN)) continue;

        input_event records[64];
        const ssize_t n = ::read(fd_, records, sizeof(records));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Fault{FaultKind::DeviceLost, "read " + path_ + ": " + std::strerror(errno)};
        }
        if (n == 0) return Fault{FaultKind::DeviceLost, path_ + ": end of stream"};
        if (n % sizeof(input_event) != 0) return Fault{FaultKind::DeviceLost, path_ + ": short read"};

        const size_t count = (size_t)n / sizeof(input_event);
        for (size_t i = 0; i < count; ++i) {
            const input_event& ev = records[i];
            if (ev.type == EV_SYN && ev.code == SYN_DROPPED) {
                // The kernel buffer overflowed; ask for the real key state.
                resync();
                continue;
            }
            if (auto event = decodeKeyEvent(ev, keyCode_)) push(*event);
        }
        return {};
    }
}
