#include "inject/ydotool_injector.hpp"
#include "process/subprocess.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include <sys/stat.h>

// Constructor
YdotoolInjector::YdotoolInjector(const AppConfig::Injector& config, std::string socketPath)
    : config_(config), socketPath_(std::move(socketPath)) {}

std::vector<std::string> YdotoolInjector::commandLine(const std::string& text) const {
    return {config_.binary, "type", "--key-delay", std::to_string(config_.keyDelayMs), "--",
            injectionPayload(text)};
}

Result<void> YdotoolInjector::checkReady() const {
    if (!findExecutable(config_.binary)) {
        return Fault{FaultKind::InjectorMissing, config_.binary + " not found in PATH"};
    }

    struct stat st {};
    if (::stat(socketPath_.c_str(), &st) != 0) {
        return Fault{FaultKind::InjectorSocketMissing,
                     socketPath_ + " does not exist; is ydotoold running for the desktop user?"};
    }
    return {};
}

Result<void> YdotoolInjector::inject(const std::string& text) {
    Result<void> ready = checkReady();
    if (!ready) return ready;

    SpawnOptions options;
    options.argv = commandLine(text);
    options.env = currentEnvironment();
    options.env["YDOTOOL_SOCKET"] = socketPath_;

    RunResult run;
    try {
        run = runProcess(options, std::chrono::milliseconds(config_.timeoutMs));
    } catch (const std::system_error& e) {
        return Fault{FaultKind::InjectionFailed, e.what()};
    }

    if (run.timedOut) {
        return Fault{FaultKind::InjectionFailed,
                     config_.binary + " did not finish within " + std::to_string(config_.timeoutMs) + " ms"};
    }
    if (!run.status.success()) return Fault{FaultKind::InjectionFailed, config_.binary + " " + run.status.describe()};
    return {};
}

std::string resolveSocketPath(const AppConfig::Injector& config, const UserIdentity& user) {
    if (!config.socketPath.empty()) return config.socketPath;
    return user.runtimeDir() + "/.ydotool_socket";
}
