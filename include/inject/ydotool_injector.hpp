#ifndef YDOTOOL_INJECTOR_HPP
#define YDOTOOL_INJECTOR_HPP

#include "core/config.hpp"
#include "core/user_session.hpp"
#include "inject/text_injector.hpp"

#include <string>
#include <vector>

// Client of a running ydotoold. The daemon and its socket belong to the
// desktop session; we only check the socket exists and run `ydotool type`.
class YdotoolInjector : public TextInjector {
public:
    YdotoolInjector(const AppConfig::Injector& config, std::string socketPath);

    Result<void> inject(const std::string& text) override;

    // Both preconditions, without typing anything.
    Result<void> checkReady() const;

    std::vector<std::string> commandLine(const std::string& text) const;
    const std::string& socketPath() const { return socketPath_; }

private:
    const AppConfig::Injector& config_;
    std::string socketPath_;
};

// injector.socket_path, else <runtime dir of user>/.ydotool_socket.
std::string resolveSocketPath(const AppConfig::Injector& config, const UserIdentity& user);

#endif
