#include "stt/command_transcriber.hpp"
#include "process/subprocess.hpp"

#include <sstream>
#include <system_error>
#include <utility>

static const std::string kAudioPlaceholder = "{audio}";

// Constructor
CommandTranscriber::CommandTranscriber(const AppConfig::Transcriber& config, Environment env,
                                       const ShutdownSignal* shutdown)
    : config_(config), env_(std::move(env)), shutdown_(shutdown) {}

std::vector<std::string> CommandTranscriber::commandLine(const std::string& audioPath) const {
    std::vector<std::string> argv;
    bool substituted = false;
    for (std::string arg : config_.command) {
        size_t pos = 0;
        while ((pos = arg.find(kAudioPlaceholder, pos)) != std::string::npos) {
            arg.replace(pos, kAudioPlaceholder.size(), audioPath);
            pos += audioPath.size();
            substituted = true;
        }
        argv.push_back(std::move(arg));
    }
    if (!substituted) argv.push_back(audioPath);
    return argv;
}

Result<std::vector<TranscriptSegment>> CommandTranscriber::transcribe(const AudioArtifact& artifact) {
    if (config_.command.empty()) return Fault{FaultKind::TranscriptionFailed, "no transcriber command configured"};

    SpawnOptions options;
    options.argv = commandLine(artifact.path);
    options.env = env_;

    RunResult run;
    try {
        run = runProcess(options, std::chrono::milliseconds(config_.timeoutMs), shutdown_);
    } catch (const std::system_error& e) {
        return Fault{FaultKind::TranscriptionFailed, e.what()};
    }

    if (run.cancelled) return Fault{FaultKind::Cancelled, "shutdown during transcription"};
    if (run.timedOut) {
        return Fault{FaultKind::TranscriptionTimedOut,
                     config_.command.front() + " gave no result after " + std::to_string(config_.timeoutMs) + " ms"};
    }
    if (!run.status.success()) {
        return Fault{FaultKind::TranscriptionFailed, config_.command.front() + " " + run.status.describe()};
    }

    std::vector<TranscriptSegment> segments;
    std::istringstream lines(run.output);
    std::string line;
    while (std::getline(lines, line)) appendSegment(segments, line);
    return segments;
}
