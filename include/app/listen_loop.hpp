#ifndef LISTEN_LOOP_HPP
#define LISTEN_LOOP_HPP

#include "app/orchestrator.hpp"
#include "core/config.hpp"
#include "input/key_event.hpp"

#include <string>

class ShutdownSignal;

// Feeds key edges from the device into the orchestrator until shutdown.
// Open and read failures trigger re-resolution of the device path with
// bounded, doubling backoff.
class ListenLoop {
public:
    ListenLoop(const AppConfig::Device& config, KeySource& source, DeviceResolver& resolver,
               Orchestrator& orchestrator, const ShutdownSignal& shutdown);

    // 0 after a requested shutdown. 1 once the retries are exhausted, or at
    // once when the device cannot be opened or re-resolved at startup.
    int run();

    const std::string& devicePath() const { return path_; }
    int attempts() const { return attempts_; }

private:
    bool listen();
    bool recover();

    const AppConfig::Device& config_;
    KeySource& source_;
    DeviceResolver& resolver_;
    Orchestrator& orchestrator_;
    const ShutdownSignal& shutdown_;

    std::string path_;
    int attempts_ = 0;
    int backoffMs_ = 0;
    bool everOpened_ = false;
};

#endif
