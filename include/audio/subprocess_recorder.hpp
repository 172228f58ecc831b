#ifndef SUBPROCESS_RECORDER_HPP
#define SUBPROCESS_RECORDER_HPP

#include "audio/recorder.hpp"
#include "core/config.hpp"
#include "core/user_session.hpp"

#include <vector>

// Runs the configured capture binary (arecord or holdtalk-capture) as the
// desktop user, so the user's audio session routing applies.
class SubprocessRecorder : public Recorder {
public:
    SubprocessRecorder(const AppConfig::Recorder& config, UserIdentity user, Environment env);

    Result<RecordingSession> start(const std::string& outputPath) override;
    StopOutcome stop(RecordingSession& session) override;
    void abort(RecordingSession& session) override;

    std::vector<std::string> commandLine(const std::string& outputPath) const;

private:
    const AppConfig::Recorder& config_;
    UserIdentity user_;
    Environment env_;
    uint64_t nextId_ = 1;
};

#endif
