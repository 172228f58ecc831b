#include "process/subprocess.hpp"
#include "core/shutdown_signal.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

std::string ExitStatus::describe() const {
    if (exited) return "exit code " + std::to_string(code);
    const char* name = ::strsignal(signal);
    return "killed by signal " + std::to_string(signal) + (name ? std::string(" (") + name + ")" : std::string());
}

static bool isExecutable(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (isExecutable(name)) return name;
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::stringstream dirs(pathEnv && *pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + name;
        if (isExecutable(candidate)) return candidate;
    }
    return std::nullopt;
}

static void closeFd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

// Child side of spawn(): only async-signal-safe calls from here on.
[[noreturn]] static void execChild(const char* path, char* const* argv, char* const* envp,
                                   int errFd, int outFd, const UserIdentity* runAs,
                                   const gid_t* groups, int groupCount) {
    auto fail = [errFd]() {
        const int err = errno;
        const ssize_t n = ::write(errFd, &err, sizeof(err));
        (void)n;
        ::_exit(127);
    };

    sigset_t all;
    sigemptyset(&all);
    ::sigprocmask(SIG_SETMASK, &all, nullptr);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE}) ::signal(sig, SIG_DFL);

    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    if (outFd >= 0 && ::dup2(outFd, STDOUT_FILENO) < 0) fail();

    if (runAs) {
        if (::setgroups(static_cast<size_t>(groupCount), groups) != 0) fail();
        if (::setgid(runAs->gid) != 0) fail();
        if (::setuid(runAs->uid) != 0) fail();
    }

    ::execve(path, argv, envp);
    fail();
    ::_exit(127);
}

std::unique_ptr<Subprocess> Subprocess::spawn(const SpawnOptions& options) {
    if (options.argv.empty()) throw std::system_error(EINVAL, std::generic_category(), "empty argv");

    const auto path = findExecutable(options.argv.front());
    if (!path) {
        throw std::system_error(ENOENT, std::generic_category(), options.argv.front() + " not found in PATH");
    }

    std::vector<char*> argv;
    for (const auto& arg : options.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> envStrings;
    std::vector<char*> envp;
    if (!options.env.empty()) {
        for (const auto& kv : options.env) envStrings.push_back(kv.first + "=" + kv.second);
        for (auto& entry : envStrings) envp.push_back(const_cast<char*>(entry.c_str()));
        envp.push_back(nullptr);
    }

    // Dropping identity only makes sense when we are not that user already.
    const UserIdentity* runAs = nullptr;
    std::vector<gid_t> groups;
    if (options.runAs && ::geteuid() != options.runAs->uid) {
        runAs = options.runAs;
        int count = 32;
        groups.resize(static_cast<size_t>(count));
        if (::getgrouplist(runAs->name.c_str(), runAs->gid, groups.data(), &count) < 0) {
            groups.resize(static_cast<size_t>(count));
            ::getgrouplist(runAs->name.c_str(), runAs->gid, groups.data(), &count);
        }
        groups.resize(static_cast<size_t>(count));
    }

    int errPipe[2] = {-1, -1};
    if (::pipe2(errPipe, O_CLOEXEC) != 0) throw std::system_error(errno, std::generic_category(), "pipe2");

    int outPipe[2] = {-1, -1};
    if (options.captureStdout && ::pipe2(outPipe, O_CLOEXEC) != 0) {
        const int err = errno;
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        throw std::system_error(err, std::generic_category(), "pipe2");
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        execChild(path->c_str(), argv.data(), envp.empty() ? environ : envp.data(),
                  errPipe[1], outPipe[1], runAs, groups.data(), static_cast<int>(groups.size()));
    }

    closeFd(errPipe[1]);
    closeFd(outPipe[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    std::unique_ptr<Subprocess> child(new Subprocess(pid, outPipe[0]));
    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        child->wait();
        throw std::system_error(childErr, std::generic_category(), "exec " + *path);
    }
    return child;
}

// Destructor
Subprocess::~Subprocess() {
    if (!status_) {
        ::kill(pid_, SIGKILL);
        reap(true);
    }
    closeFd(stdoutFd_);
}

bool Subprocess::reap(bool block) {
    if (status_) return true;

    int raw = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &raw, block ? 0 : WNOHANG);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) return false;
    if (rc < 0) {
        // Someone else reaped it; nothing more to learn.
        status_ = ExitStatus{true, -1, 0};
        return true;
    }

    ExitStatus status;
    if (WIFEXITED(raw)) {
        status.exited = true;
        status.code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        status.exited = false;
        status.signal = WTERMSIG(raw);
    }
    status_ = status;
    return true;
}

bool Subprocess::running() {
    return !reap(false);
}

bool Subprocess::signal(int sig) {
    if (status_) return false;
    return ::kill(pid_, sig) == 0;
}

std::optional<ExitStatus> Subprocess::waitFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return status_;
}

ExitStatus Subprocess::wait() {
    reap(true);
    return *status_;
}

ExitStatus Subprocess::stop(int sig, std::chrono::milliseconds grace, bool* forced) {
    if (forced) *forced = false;
    if (status_) return *status_;

    signal(sig);
    if (auto status = waitFor(grace)) return *status;

    if (forced) *forced = true;
    ::kill(pid_, SIGKILL);
    return wait();
}

RunResult runProcess(SpawnOptions options, std::chrono::milliseconds timeout, const ShutdownSignal* cancel) {
    options.captureStdout = true;
    auto child = Subprocess::spawn(options);

    RunResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int outFd = child->stdoutFd();

    while (outFd >= 0) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            result.timedOut = true;
            break;
        }

        pollfd fds[2] = {{outFd, POLLIN, 0}, {cancel ? cancel->fd() : -1, POLLIN, 0}};
        const int rc = ::poll(fds, cancel ? 2 : 1, static_cast<int>(left.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (cancel && cancel->requested()) {
            result.cancelled = true;
            break;
        }
        if (rc == 0) continue;

        char buff[4096];
        const ssize_t n = ::read(outFd, buff, sizeof(buff));
        if (n > 0) {
            result.output.append(buff, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }

    if (result.timedOut || result.cancelled) {
        result.status = child->stop(SIGTERM, std::chrono::milliseconds(200));
        return result;
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (auto status = child->waitFor(std::max(left, std::chrono::milliseconds(0)))) {
        result.status = *status;
    } else {
        result.timedOut = true;
        result.status = child->stop(SIGKILL, std::chrono::milliseconds(0));
    }
    return result;
}
