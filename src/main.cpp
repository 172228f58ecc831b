// holdtalkd: hold a key, speak, release, and the recognised text is typed
// into the focused window.

#include "app/listen_loop.hpp"
#include "app/orchestrator.hpp"
#include "audio/subprocess_recorder.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/shutdown_signal.hpp"
#include "core/user_session.hpp"
#include "inject/ydotool_injector.hpp"
#include "input/device_locator.hpp"
#include "input/device_reader.hpp"
#include "input/key_codes.hpp"
#include "process/subprocess.hpp"
#include "stt/command_transcriber.hpp"
#include "stt/whisper_stt.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

static const char* kTag = "holdtalkd";

struct DaemonParams {
    std::string configPath = "/etc/holdtalk/config.json";
    bool verbose = false;
    bool listDevices = false;
};

static void printUsage(const char* argv0) {
    fprintf(stderr, "usage: %s [-c CONFIG] [--verbose] [--list-devices]\n", argv0);
    fprintf(stderr, "  -c, --config FILE   configuration file (default /etc/holdtalk/config.json)\n");
    fprintf(stderr, "  -v, --verbose       log at debug level\n");
    fprintf(stderr, "      --list-devices  print input devices and exit\n");
}

static bool parseParams(int argc, char** argv, DaemonParams& params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") { printUsage(argv[0]); exit(0); }
        else if (arg == "-v" || arg == "--verbose") { params.verbose = true; }
        else if (arg == "--list-devices") { params.listDevices = true; }
        else if (arg == "-c" || arg == "--config") {
            if (++i >= argc) {
                fprintf(stderr, "error: missing value for %s\n", arg.c_str());
                return false;
            }
            params.configPath = argv[i];
        }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

static void setupLogging(const AppConfig::Logging& config, bool verbose) {
    Logger& log = Logger::instance();
    log.setLevel(verbose ? LogLevel::Debug : parseLogLevel(config.level).value_or(LogLevel::Info));
    if (!config.file.empty() && !log.open(config.file)) {
        log.warn(kTag, "Cannot open log file " + config.file + ", logging to stderr only");
    }
}

static int listDevices(uint16_t keyCode) {
    DeviceLocator locator;
    const auto devices = locator.scan(keyCode);
    if (devices.empty()) {
        fprintf(stderr, "no input devices found\n");
        return 1;
    }

    const std::string key = keyNameFromCode(keyCode);
    for (const auto& dev : devices) {
        if (!dev.accessible) {
            printf("%-22s (%s)\n", dev.path.c_str(), dev.error.c_str());
            continue;
        }
        std::string notes;
        if (dev.hasTriggerKey) notes = "reports " + key;
        else if (dev.looksLikeKeyboard) notes = "keyboard by name";
        printf("%-22s %-40s %s\n", dev.path.c_str(), dev.name.c_str(), notes.c_str());
    }
    return 0;
}

static std::unique_ptr<Transcriber> makeTranscriber(const AppConfig& config, const ShutdownSignal& shutdown) {
    if (config.transcriber.backend == "command") {
        return std::make_unique<CommandTranscriber>(config.transcriber, currentEnvironment(), &shutdown);
    }
    return std::make_unique<WhisperSTT>(config.transcriber, &shutdown);
}

int main(int argc, char** argv) {
    DaemonParams params;
    if (!parseParams(argc, argv, params)) {
        printUsage(argv[0]);
        return 1;
    }

    Logger& log = Logger::instance();

    AppConfig config;
    try {
        config = loadConfig(params.configPath);
    } catch (const FaultError& e) {
        log.error(kTag, e.what());
        return 1;
    }
    setupLogging(config.logging, params.verbose);

    if (params.listDevices) return listDevices(config.device.keyCode);

    Result<UserIdentity> user = resolveUser(config.targetUser);
    if (!user) {
        log.error(kTag, user.fault().describe());
        return 1;
    }
    if (!canActAs(*user)) {
        log.error(kTag, "Must run as root or as " + user->name + " to record in that user's session");
        return 1;
    }

    if (!findExecutable(config.recorder.binary)) {
        log.error(kTag, Fault{FaultKind::RecorderSpawnFailed, config.recorder.binary + " not found in PATH"}.describe());
        return 1;
    }

    YdotoolInjector injector(config.injector, resolveSocketPath(config.injector, *user));
    Result<void> ready = injector.checkReady();
    if (!ready) {
        if (ready.fault().kind == FaultKind::InjectorMissing) {
            log.error(kTag, ready.fault().describe());
            return 1;
        }
        // ydotoold may come up after us; every injection checks again.
        log.warn(kTag, ready.fault().describe());
    }

    ShutdownSignal shutdown;
    installShutdownHandlers(shutdown);

    std::unique_ptr<Transcriber> transcriber;
    try {
        transcriber = makeTranscriber(config, shutdown);
    } catch (const std::exception& e) {
        log.error(kTag, std::string("Transcriber init failed: ") + e.what());
        return 1;
    }

    const Environment env = sessionEnvironment(*user, config.session);
    log.debug(kTag, "Recorder runs as " + user->name + " with WAYLAND_DISPLAY=" + env.at("WAYLAND_DISPLAY"));

    SubprocessRecorder recorder(config.recorder, *user, env);
    Orchestrator orchestrator(config, recorder, *transcriber, injector, shutdown);
    DeviceReader reader(config.device.keyCode, shutdown);
    DeviceLocator locator;

    log.info(kTag, "Ready: hold " + config.device.triggerKey + " to dictate");
    ListenLoop loop(config.device, reader, locator, orchestrator, shutdown);
    const int code = loop.run();

    const auto& stats = orchestrator.stats();
    log.info(kTag, "Exiting after " + std::to_string(stats.sessionsStarted) + " recording(s), " +
             std::to_string(stats.injections) + " injection(s), " +
             std::to_string(stats.gesturesFailed) + " failed gesture(s)");
    return code;
}
