#ifndef KEY_CODES_HPP
#define KEY_CODES_HPP

#include <cstdint>
#include <optional>
#include <string>

// Accepts evdev names ("KEY_RIGHTCTRL", "rightctrl") or a numeric code.
std::optional<uint16_t> keyCodeFromName(const std::string& name);

// "KEY_<n>" for codes without a known name.
std::string keyNameFromCode(uint16_t code);

#endif
