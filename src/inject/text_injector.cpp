#include "inject/text_injector.hpp"

std::string injectionPayload(const std::string& text) {
    return text + " ";
}
