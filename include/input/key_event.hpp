#ifndef KEY_EVENT_HPP
#define KEY_EVENT_HPP

#include "core/fault.hpp"

#include <chrono>
#include <cstdint>
#include <string>

enum class KeyAction { Press, Release };

struct KeyEvent {
    KeyAction action;
    uint16_t code;
    // Kernel timestamp on CLOCK_MONOTONIC; default-constructed if unknown.
    std::chrono::steady_clock::time_point timestamp{};
};

// A blocking stream of trigger-key edges. next() blocks until an edge
// arrives, the device fails (DeviceLost) or shutdown fires (Cancelled).
// After any fault the source must be reopened before further reads.
class KeySource {
public:
    virtual ~KeySource() = default;

    virtual Result<void> open(const std::string& path) = 0;
    virtual Result<KeyEvent> next() = 0;
    virtual void close() = 0;
};

// Maps a configured, possibly stale device path to one that currently
// reports the trigger key.
class DeviceResolver {
public:
    virtual ~DeviceResolver() = default;

    virtual Result<std::string> resolve(const std::string& configuredPath, uint16_t keyCode) = 0;
};

#endif
