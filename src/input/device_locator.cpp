#include "input/device_locator.hpp"
#include "input/key_codes.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <utility>

#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

static bool testBit(const unsigned char* bits, unsigned bit) {
    return (bits[bit / 8] >> (bit % 8)) & 1;
}

static bool nameLooksLikeKeyboard(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return name.find("keyboard") != std::string::npos ||
           name.find("key") != std::string::npos ||
           name.find("kbd") != std::string::npos;
}

static int eventIndex(const std::string& filename) {
    return std::atoi(filename.c_str() + std::strlen("event"));
}

static InputDeviceInfo inspectDevice(const std::string& path, uint16_t keyCode) {
    InputDeviceInfo info;
    info.path = path;

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0) {
        info.error = std::strerror(errno);
        return info;
    }
    info.accessible = true;

    char name[256] = {};
    if (::ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name) >= 0) info.name = name;

    unsigned char evBits[EV_MAX / 8 + 1] = {};
    unsigned char keyBits[KEY_MAX / 8 + 1] = {};
    if (::ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) >= 0 && testBit(evBits, EV_KEY)) {
        if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits) >= 0) {
            info.hasTriggerKey = testBit(keyBits, keyCode);
        }
        info.looksLikeKeyboard = nameLooksLikeKeyboard(info.name);
    }

    ::close(fd);
    return info;
}

// Constructor
DeviceLocator::DeviceLocator(std::string inputDir) : inputDir_(std::move(inputDir)) {}

std::vector<InputDeviceInfo> DeviceLocator::scan(uint16_t keyCode) const {
    std::vector<std::pair<int, std::string>> nodes;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(inputDir_, ec)) {
        const std::string filename = entry.path().filename().string();
        if (filename.rfind("event", 0) != 0) continue;
        nodes.emplace_back(eventIndex(filename), entry.path().string());
    }
    std::sort(nodes.begin(), nodes.end());

    std::vector<InputDeviceInfo> devices;
    for (const auto& node : nodes) devices.push_back(inspectDevice(node.second, keyCode));
    return devices;
}

Result<std::string> DeviceLocator::resolve(const std::string& configuredPath, uint16_t keyCode) {
    const auto devices = scan(keyCode);

    for (const auto& dev : devices) {
        if (dev.path == configuredPath && dev.hasTriggerKey) return dev.path;
    }
    for (const auto& dev : devices) {
        if (dev.hasTriggerKey) return dev.path;
    }
    for (const auto& dev : devices) {
        if (dev.looksLikeKeyboard) return dev.path;
    }

    return Fault{FaultKind::DeviceUnavailable,
                 "no device under " + inputDir_ + " reports " + keyNameFromCode(keyCode) +
                 " (" + std::to_string(devices.size()) + " nodes scanned)"};
}
