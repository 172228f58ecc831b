#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "core/config.hpp"

#include <string>

// Both throw FaultError(ConfigInvalid) on unreadable files, malformed JSON,
// wrong value types or values outside their domain.
AppConfig loadConfig(const std::string& path);
AppConfig parseConfig(const std::string& text);

#endif
