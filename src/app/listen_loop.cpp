#include "app/listen_loop.hpp"
#include "core/logger.hpp"
#include "core/shutdown_signal.hpp"
#include "input/key_codes.hpp"

#include <algorithm>
#include <chrono>

static const char* kTag = "Listener";

// Constructor
ListenLoop::ListenLoop(const AppConfig::Device& config, KeySource& source, DeviceResolver& resolver,
                       Orchestrator& orchestrator, const ShutdownSignal& shutdown)
    : config_(config), source_(source), resolver_(resolver), orchestrator_(orchestrator),
      shutdown_(shutdown), path_(config.path), backoffMs_(config.retryBackoffMs) {}

int ListenLoop::run() {
    int code = 0;
    while (!shutdown_.requested()) {
        if (listen()) break;
        if (!recover()) {
            code = shutdown_.requested() ? 0 : 1;
            break;
        }
    }

    source_.close();
    orchestrator_.shutdown();
    return code;
}

// Returns true when the loop should end (shutdown), false after a device fault.
bool ListenLoop::listen() {
    Logger& log = Logger::instance();

    Result<void> opened = source_.open(path_);
    if (!opened) {
        if (opened.fault().kind == FaultKind::Cancelled) return true;
        log.warn(kTag, opened.fault().describe());
        return false;
    }
    everOpened_ = true;
    attempts_ = 0;
    backoffMs_ = config_.retryBackoffMs;
    log.info(kTag, "Listening on " + path_ + " for " + keyNameFromCode(config_.keyCode));

    while (true) {
        Result<KeyEvent> event = source_.next();
        if (!event) {
            if (event.fault().kind == FaultKind::Cancelled) return true;
            log.warn(kTag, event.fault().describe());
            orchestrator_.onDeviceLost();
            source_.close();
            return false;
        }

        orchestrator_.onKeyEvent(*event);
    }
}

// Returns false once the retries are used up, when no device was ever usable,
// or when shutdown interrupted the wait.
bool ListenLoop::recover() {
    Logger& log = Logger::instance();

    if (++attempts_ > config_.maxRetries) {
        log.error(kTag, "Giving up on the input device after " + std::to_string(config_.maxRetries) + " retries");
        return false;
    }

    Result<std::string> resolved = resolver_.resolve(config_.path, config_.keyCode);
    if (resolved && *resolved != path_) {
        log.info(kTag, "Input device moved: " + path_ + " -> " + *resolved);
        path_ = *resolved;
        return true;
    }
    if (!resolved) log.warn(kTag, "Device re-resolution: " + resolved.fault().describe());
    if (!everOpened_) {
        log.error(kTag, "No usable input device at startup: " + path_);
        return false;
    }

    log.info(kTag, "Retrying in " + std::to_string(backoffMs_) + " ms (attempt " + std::to_string(attempts_) +
             "/" + std::to_string(config_.maxRetries) + ")");
    if (shutdown_.waitFor(std::chrono::milliseconds(backoffMs_))) return false;
    backoffMs_ = std::min(backoffMs_ * 2, config_.retryBackoffMaxMs);
    return true;
}
