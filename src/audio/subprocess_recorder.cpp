#include "audio/subprocess_recorder.hpp"
#include "process/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

static uint64_t fileSize(const std::string& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : (uint64_t)size;
}

// Constructor
SubprocessRecorder::SubprocessRecorder(const AppConfig::Recorder& config, UserIdentity user, Environment env)
    : config_(config), user_(std::move(user)), env_(std::move(env)) {}

std::vector<std::string> SubprocessRecorder::commandLine(const std::string& outputPath) const {
    std::vector<std::string> argv = {config_.binary};
    argv.insert(argv.end(), config_.extraArgs.begin(), config_.extraArgs.end());
    argv.insert(argv.end(), {"-q", "-f", kSampleFormat, "-r", std::to_string(kSampleRate),
                             "-c", std::to_string(kChannels), "-t", "wav", outputPath});
    return argv;
}

Result<RecordingSession> SubprocessRecorder::start(const std::string& outputPath) {
    // The previous session's file must not survive into this one.
    if (std::remove(outputPath.c_str()) != 0 && errno != ENOENT) {
        return Fault{FaultKind::RecorderSpawnFailed,
                     "cannot remove stale " + outputPath + ": " + std::strerror(errno)};
    }

    SpawnOptions options;
    options.argv = commandLine(outputPath);
    options.env = env_;
    options.runAs = &user_;

    RecordingSession session;
    try {
        session.process = Subprocess::spawn(options);
    } catch (const std::system_error& e) {
        return Fault{FaultKind::RecorderSpawnFailed, e.what()};
    }

    session.id = nextId_++;
    session.path = outputPath;
    session.startedAt = std::chrono::steady_clock::now();
    session.active = true;
    return Result<RecordingSession>(std::move(session));
}

StopOutcome SubprocessRecorder::stop(RecordingSession& session) {
    StopOutcome outcome;
    if (!session.active || !session.process) return outcome;

    outcome.wasActive = true;
    session.active = false;

    bool forced = false;
    const ExitStatus status = session.process->stop(
        SIGTERM, std::chrono::milliseconds(config_.stopTimeoutMs), &forced);

    // Dying from our own SIGTERM/SIGINT is the normal way for a capture to end.
    const bool clean = !forced &&
        (status.success() || (!status.exited && (status.signal == SIGTERM || status.signal == SIGINT)));

    const uint64_t bytes = fileSize(session.path);
    if (bytes > 0) {
        AudioArtifact artifact;
        artifact.path = session.path;
        artifact.bytes = bytes;
        outcome.artifact = artifact;
    }

    if (!clean) {
        std::string detail = config_.binary + " " + status.describe();
        if (forced) detail += " after ignoring SIGTERM for " + std::to_string(config_.stopTimeoutMs) + " ms";
        outcome.fault = Fault{FaultKind::RecorderExitedAbnormally, detail};
    } else if (bytes == 0) {
        outcome.fault = Fault{FaultKind::RecorderExitedAbnormally,
                              config_.binary + " left no audio in " + session.path};
    }
    return outcome;
}

void SubprocessRecorder::abort(RecordingSession& session) {
    if (session.process && !session.process->status()) {
        session.process->stop(SIGTERM, std::chrono::milliseconds(config_.stopTimeoutMs));
    }
    session.active = false;
    if (!session.path.empty()) std::remove(session.path.c_str());
}
