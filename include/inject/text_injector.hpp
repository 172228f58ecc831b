#ifndef TEXT_INJECTOR_HPP
#define TEXT_INJECTOR_HPP

#include "core/fault.hpp"

#include <string>

// Delivers recognised text to the focused window. inject() blocks until the
// delivery finished and never retries.
class TextInjector {
public:
    virtual ~TextInjector() = default;

    // Fails with InjectorMissing, InjectorSocketMissing or InjectionFailed.
    virtual Result<void> inject(const std::string& text) = 0;
};

// What actually gets typed for one segment: the text and one trailing space.
std::string injectionPayload(const std::string& text);

#endif
