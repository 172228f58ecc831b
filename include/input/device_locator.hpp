#ifndef DEVICE_LOCATOR_HPP
#define DEVICE_LOCATOR_HPP

#include "input/key_event.hpp"

#include <string>
#include <vector>

struct InputDeviceInfo {
    std::string path;
    std::string name;
    bool accessible = false;
    bool hasTriggerKey = false;
    bool looksLikeKeyboard = false;
    std::string error;
};

// Scans /dev/input/event* (numeric order) for a node reporting the trigger
// key, falling back to the first node whose name looks like a keyboard.
class DeviceLocator : public DeviceResolver {
public:
    explicit DeviceLocator(std::string inputDir = "/dev/input");

    Result<std::string> resolve(const std::string& configuredPath, uint16_t keyCode) override;

    std::vector<InputDeviceInfo> scan(uint16_t keyCode) const;

private:
    std::string inputDir_;
};

#endif
