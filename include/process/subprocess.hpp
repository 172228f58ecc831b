#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include "core/user_session.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

class ShutdownSignal;

struct ExitStatus {
    bool exited = false;    // false: terminated by `signal`
    int code = 0;
    int signal = 0;

    bool success() const { return exited && code == 0; }
    std::string describe() const;
};

struct SpawnOptions {
    std::vector<std::string> argv;          // argv[0] is looked up in PATH
    Environment env;                        // empty: inherit the daemon's
    const UserIdentity* runAs = nullptr;    // drop to this uid/gid before exec
    bool captureStdout = false;
};

// One child process. The destructor kills and reaps a child that is still
// running, so a Subprocess never leaves a zombie behind.
class Subprocess {
public:
    // Throws std::system_error if the binary is missing, the identity switch
    // fails or execve fails; errno from the child is carried over.
    static std::unique_ptr<Subprocess> spawn(const SpawnOptions& options);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    pid_t pid() const { return pid_; }
    int stdoutFd() const { return stdoutFd_; }

    bool running();
    bool signal(int sig);

    std::optional<ExitStatus> waitFor(std::chrono::milliseconds timeout);
    ExitStatus wait();

    // Sends `sig`, waits up to `grace`, then SIGKILLs. `forced` reports
    // whether the kill was needed.
    ExitStatus stop(int sig, std::chrono::milliseconds grace, bool* forced = nullptr);

    const std::optional<ExitStatus>& status() const { return status_; }

private:
    Subprocess(pid_t pid, int stdoutFd) : pid_(pid), stdoutFd_(stdoutFd) {}

    bool reap(bool block);

    pid_t pid_;
    int stdoutFd_;
    std::optional<ExitStatus> status_;
};

struct RunResult {
    ExitStatus status;
    std::string output;
    bool timedOut = false;
    bool cancelled = false;
};

// Runs a child to completion, collecting stdout. The child is killed when
// `timeout` passes or `cancel` fires. Spawn failures throw as in spawn().
RunResult runProcess(SpawnOptions options, std::chrono::milliseconds timeout,
                     const ShutdownSignal* cancel = nullptr);

// Absolute path of an executable, searching PATH for bare names.
std::optional<std::string> findExecutable(const std::string& name);

#endif
