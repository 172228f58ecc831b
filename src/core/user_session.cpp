#include "core/user_session.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <pwd.h>
#include <unistd.h>

extern char** environ;

static UserIdentity fromPasswd(const passwd& pw) {
    UserIdentity user;
    user.name = pw.pw_name ? pw.pw_name : "";
    user.uid = pw.pw_uid;
    user.gid = pw.pw_gid;
    user.home = pw.pw_dir ? pw.pw_dir : "";
    return user;
}

Result<UserIdentity> resolveUser(const std::string& name) {
    long size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (size <= 0) size = 16384;
    std::vector<char> buff(static_cast<size_t>(size));

    passwd pw{};
    passwd* found = nullptr;
    const int rc = ::getpwnam_r(name.c_str(), &pw, buff.data(), buff.size(), &found);
    if (rc != 0) return Fault{FaultKind::UserUnknown, "getpwnam_r(" + name + "): " + std::strerror(rc)};
    if (!found) return Fault{FaultKind::UserUnknown, "user '" + name + "' does not exist"};
    return fromPasswd(pw);
}

UserIdentity currentUser() {
    const uid_t uid = ::geteuid();
    long size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (size <= 0) size = 16384;
    std::vector<char> buff(static_cast<size_t>(size));

    passwd pw{};
    passwd* found = nullptr;
    if (::getpwuid_r(uid, &pw, buff.data(), buff.size(), &found) == 0 && found) return fromPasswd(pw);

    UserIdentity user;
    user.name = std::to_string(uid);
    user.uid = uid;
    user.gid = ::getegid();
    return user;
}

bool canActAs(const UserIdentity& user) {
    const uid_t euid = ::geteuid();
    return euid == 0 || euid == user.uid;
}

std::string discoverWaylandDisplay(const std::string& runtimeDir, const std::string& configured) {
    if (!configured.empty()) return configured;

    std::vector<std::string> candidates;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(runtimeDir, ec)) {
        const std::string name = entry.path().filename().string();
        // wayland-0.lock sits beside the socket
        if (name.rfind("wayland-", 0) == 0 && entry.path().extension() != ".lock") candidates.push_back(name);
    }
    if (candidates.empty()) return "wayland-0";

    std::sort(candidates.begin(), candidates.end());
    return candidates.front();
}

Environment currentEnvironment() {
    Environment env;
    for (char** it = environ; it && *it; ++it) {
        const char* eq = std::strchr(*it, '=');
        if (!eq) continue;
        env[std::string(*it, static_cast<size_t>(eq - *it))] = std::string(eq + 1);
    }
    return env;
}

Environment sessionEnvironment(const UserIdentity& user, const AppConfig::Session& session) {
    Environment env = currentEnvironment();
    const std::string runtimeDir = user.runtimeDir();

    env["HOME"] = user.home;
    env["USER"] = user.name;
    env["LOGNAME"] = user.name;
    env["XDG_CACHE_HOME"] = user.home + "/.cache";
    env["XDG_RUNTIME_DIR"] = runtimeDir;
    env["DBUS_SESSION_BUS_ADDRESS"] = "unix:path=" + runtimeDir + "/bus";
    env["DISPLAY"] = session.display;
    env["WAYLAND_DISPLAY"] = discoverWaylandDisplay(runtimeDir, session.waylandDisplay);
    return env;
}
