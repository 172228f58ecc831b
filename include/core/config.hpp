#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Recording format handed to the capture binary. Fixed, not configurable.
static constexpr int kSampleRate = 16000;
static constexpr int kChannels = 1;
static constexpr const char* kSampleFormat = "S16_LE";

enum class DevicePolicy { Auto, Cpu, Accelerated };

std::optional<DevicePolicy> parseDevicePolicy(const std::string& name);
const char* devicePolicyName(DevicePolicy policy);

// Built once at startup and handed to every component by const reference.
struct AppConfig {
    std::string targetUser;

    struct Device {
        std::string path = "/dev/input/event0";
        std::string triggerKey = "KEY_RIGHTCTRL";
        uint16_t keyCode = 97;
        int maxRetries = 5;
        int retryBackoffMs = 500;
        int retryBackoffMaxMs = 8000;
    } device;

    struct Recorder {
        std::string binary = "arecord";
        std::vector<std::string> extraArgs;
        std::string audioFile = "/tmp/holdtalk_recording.wav";
        int stopTimeoutMs = 2000;
        bool keepAudio = false;
    } recorder;

    struct Session {
        std::string display = ":0";
        std::string waylandDisplay;     // empty: auto-detect
    } session;

    struct Transcriber {
        std::string backend = "whisper";
        std::string modelPath;          // empty: derived from dir/size/compute type
        std::string modelDir = "/usr/share/holdtalk/models";
        std::string modelSize = "small";
        std::string computeType = "f16";
        DevicePolicy device = DevicePolicy::Auto;
        std::string language = "auto";
        int threads = 4;
        int timeoutMs = 120000;
        std::vector<std::string> command;
    } transcriber;

    struct Injector {
        std::string binary = "ydotool";
        std::string socketPath;         // empty: /run/user/<uid>/.ydotool_socket
        int keyDelayMs = 12;
        int timeoutMs = 30000;
    } injector;

    struct Logging {
        std::string file;
        std::string level = "info";
    } logging;
};

// Normalises a compute type name ("int8" -> "q8_0"); nullopt if unknown.
std::optional<std::string> normalizeComputeType(const std::string& name);

// <model_dir>/ggml-<size>[-<quant>].bin unless model_path is set.
std::string resolveModelPath(const AppConfig::Transcriber& transcriber);

#endif
