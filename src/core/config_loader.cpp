#include "core/config_loader.hpp"
#include "core/fault.hpp"
#include "core/logger.hpp"
#include "input/key_codes.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

static void invalid(const std::string& detail) {
    throw FaultError(Fault{FaultKind::ConfigInvalid, detail});
}

template <typename T>
static void readKey(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section.at(key).is_null()) target = section.at(key).get<T>();
}

static void requirePositive(int value, const char* key) {
    if (value <= 0) invalid(std::string(key) + " must be positive");
}

static AppConfig fromJson(const json& j) {
    if (!j.is_object()) invalid("top level must be an object");

    AppConfig config;
    readKey(j, "target_user", config.targetUser);
    if (config.targetUser.empty()) invalid("target_user is required");

    if (j.contains("device")) {
        const json& d = j.at("device");
        readKey(d, "path", config.device.path);
        readKey(d, "trigger_key", config.device.triggerKey);
        readKey(d, "max_retries", config.device.maxRetries);
        readKey(d, "retry_backoff_ms", config.device.retryBackoffMs);
        readKey(d, "retry_backoff_max_ms", config.device.retryBackoffMaxMs);
    }
    const auto code = keyCodeFromName(config.device.triggerKey);
    if (!code) invalid("unknown trigger_key '" + config.device.triggerKey + "'");
    config.device.keyCode = *code;
    if (config.device.maxRetries < 0) invalid("device.max_retries must not be negative");
    requirePositive(config.device.retryBackoffMs, "device.retry_backoff_ms");
    requirePositive(config.device.retryBackoffMaxMs, "device.retry_backoff_max_ms");

    if (j.contains("recorder")) {
        const json& r = j.at("recorder");
        readKey(r, "binary", config.recorder.binary);
        readKey(r, "extra_args", config.recorder.extraArgs);
        readKey(r, "audio_file", config.recorder.audioFile);
        readKey(r, "stop_timeout_ms", config.recorder.stopTimeoutMs);
        readKey(r, "keep_audio", config.recorder.keepAudio);
    }
    if (config.recorder.binary.empty()) invalid("recorder.binary must not be empty");
    if (config.recorder.audioFile.empty()) invalid("recorder.audio_file must not be empty");
    requirePositive(config.recorder.stopTimeoutMs, "recorder.stop_timeout_ms");

    if (j.contains("session")) {
        const json& s = j.at("session");
        readKey(s, "display", config.session.display);
        readKey(s, "wayland_display", config.session.waylandDisplay);
    }

    if (j.contains("transcriber")) {
        const json& t = j.at("transcriber");
        readKey(t, "backend", config.transcriber.backend);
        readKey(t, "model_path", config.transcriber.modelPath);
        readKey(t, "model_dir", config.transcriber.modelDir);
        readKey(t, "model_size", config.transcriber.modelSize);
        readKey(t, "compute_type", config.transcriber.computeType);
        readKey(t, "language", config.transcriber.language);
        readKey(t, "threads", config.transcriber.threads);
        readKey(t, "timeout_ms", config.transcriber.timeoutMs);
        readKey(t, "command", config.transcriber.command);

        std::string device = devicePolicyName(config.transcriber.device);
        readKey(t, "device", device);
        const auto policy = parseDevicePolicy(device);
        if (!policy) invalid("transcriber.device must be auto, cpu or accelerated (got '" + device + "')");
        config.transcriber.device = *policy;
    }
    const auto& backend = config.transcriber.backend;
    if (backend != "whisper" && backend != "command") {
        invalid("transcriber.backend must be whisper or command (got '" + backend + "')");
    }
    if (backend == "command" && config.transcriber.command.empty()) {
        invalid("transcriber.command is required for the command backend");
    }
    const auto computeType = normalizeComputeType(config.transcriber.computeType);
    if (!computeType) invalid("unknown transcriber.compute_type '" + config.transcriber.computeType + "'");
    config.transcriber.computeType = *computeType;
    requirePositive(config.transcriber.threads, "transcriber.threads");
    requirePositive(config.transcriber.timeoutMs, "transcriber.timeout_ms");

    if (j.contains("injector")) {
        const json& i = j.at("injector");
        readKey(i, "binary", config.injector.binary);
        readKey(i, "socket_path", config.injector.socketPath);
        readKey(i, "key_delay_ms", config.injector.keyDelayMs);
        readKey(i, "timeout_ms", config.injector.timeoutMs);
    }
    if (config.injector.keyDelayMs < 0) invalid("injector.key_delay_ms must not be negative");
    requirePositive(config.injector.timeoutMs, "injector.timeout_ms");

    if (j.contains("logging")) {
        const json& l = j.at("logging");
        readKey(l, "file", config.logging.file);
        readKey(l, "level", config.logging.level);
    }
    if (!parseLogLevel(config.logging.level)) invalid("unknown logging.level '" + config.logging.level + "'");

    return config;
}

AppConfig parseConfig(const std::string& text) {
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& e) {
        invalid(e.what());
    }
    return AppConfig{};
}

AppConfig loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) invalid("cannot open configuration file " + path);

    std::stringstream buff;
    buff << file.rdbuf();
    try {
        return parseConfig(buff.str());
    } catch (const FaultError& e) {
        invalid(path + ": " + e.fault().detail);
    }
    return AppConfig{};
}
