#ifndef USER_SESSION_HPP
#define USER_SESSION_HPP

#include "core/config.hpp"
#include "core/fault.hpp"

#include <map>
#include <string>

#include <sys/types.h>

// The unprivileged desktop user whose audio session and virtual-input
// socket the daemon works with.
struct UserIdentity {
    std::string name;
    uid_t uid = 0;
    gid_t gid = 0;
    std::string home;

    std::string runtimeDir() const { return "/run/user/" + std::to_string(uid); }
};

using Environment = std::map<std::string, std::string>;

Result<UserIdentity> resolveUser(const std::string& name);
UserIdentity currentUser();

// True if this process can run children as `user` (root, or already `user`).
bool canActAs(const UserIdentity& user);

// Configured Wayland display, else the first wayland-* socket of the
// runtime directory, else "wayland-0".
std::string discoverWaylandDisplay(const std::string& runtimeDir, const std::string& configured);

// The daemon's own environment with the user's session variables laid over.
Environment sessionEnvironment(const UserIdentity& user, const AppConfig::Session& session);

Environment currentEnvironment();

#endif
