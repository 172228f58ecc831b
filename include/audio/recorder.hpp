#ifndef RECORDER_HPP
#define RECORDER_HPP

#include "audio/wav_file.hpp"
#include "core/fault.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

class Subprocess;

// The audio file one recording session produced. Never reused: the next
// session removes it before capturing again.
struct AudioArtifact {
    std::string path;
    uint64_t bytes = 0;
    WavFormat expected;     // mono, 16 kHz, PCM16
};

// One in-flight capture. Move-only; destroying a session whose process is
// still alive kills and reaps it.
struct RecordingSession {
    RecordingSession();
    RecordingSession(RecordingSession&&) noexcept;
    RecordingSession& operator=(RecordingSession&&) noexcept;
    ~RecordingSession();

    uint64_t id = 0;
    std::string path;
    std::chrono::steady_clock::time_point startedAt{};
    bool active = false;
    std::unique_ptr<Subprocess> process;
};

struct StopOutcome {
    bool wasActive = false;                 // false: double stop, nothing happened
    std::optional<AudioArtifact> artifact;  // set whenever a non-empty file exists
    std::optional<Fault> fault;             // RecorderExitedAbnormally
};

class Recorder {
public:
    virtual ~Recorder() = default;

    // Fails with RecorderSpawnFailed.
    virtual Result<RecordingSession> start(const std::string& outputPath) = 0;

    // Graceful stop: terminate, wait for the file to be flushed, reap.
    // Stopping an inactive session is a no-op.
    virtual StopOutcome stop(RecordingSession& session) = 0;

    // Teardown for cancelled gestures: kill, reap and delete the file.
    virtual void abort(RecordingSession& session) = 0;
};

#endif
