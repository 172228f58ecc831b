#include "core/config.hpp"

std::optional<DevicePolicy> parseDevicePolicy(const std::string& name) {
    if (name == "auto") return DevicePolicy::Auto;
    if (name == "cpu") return DevicePolicy::Cpu;
    if (name == "accelerated" || name == "gpu") return DevicePolicy::Accelerated;
    return std::nullopt;
}

const char* devicePolicyName(DevicePolicy policy) {
    switch (policy) {
        case DevicePolicy::Auto:        return "auto";
        case DevicePolicy::Cpu:         return "cpu";
        case DevicePolicy::Accelerated: return "accelerated";
    }
    return "auto";
}

std::optional<std::string> normalizeComputeType(const std::string& name) {
    if (name == "f16" || name == "float16" || name.empty()) return std::string("f16");
    if (name == "int8") return std::string("q8_0");
    if (name == "q8_0" || name == "q5_1" || name == "q5_0" || name == "q4_0") return name;
    return std::nullopt;
}

std::string resolveModelPath(const AppConfig::Transcriber& transcriber) {
    if (!transcriber.modelPath.empty()) return transcriber.modelPath;

    std::string file = "ggml-" + transcriber.modelSize;
    const std::string quant = normalizeComputeType(transcriber.computeType).value_or("f16");
    if (quant != "f16") file += "-" + quant;
    file += ".bin";

    if (transcriber.modelDir.empty()) return file;
    if (transcriber.modelDir.back() == '/') return transcriber.modelDir + file;
    return transcriber.modelDir + "/" + file;
}
