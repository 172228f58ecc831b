#ifndef FAKES_HPP
#define FAKES_HPP

#include "audio/recorder.hpp"
#include "inject/text_injector.hpp"
#include "input/key_event.hpp"
#include "stt/transcriber.hpp"

#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Recorder that never spawns anything. Each stop() returns the configured
// outcome.
class FakeRecorder : public Recorder {
public:
    Result<RecordingSession> start(const std::string& outputPath) override {
        ++starts;
        if (failStart) return Fault{FaultKind::RecorderSpawnFailed, "no such binary"};

        RecordingSession session;
        session.id = static_cast<uint64_t>(starts);
        session.path = outputPath;
        session.active = true;
        return Result<RecordingSession>(std::move(session));
    }

    StopOutcome stop(RecordingSession& session) override {
        StopOutcome outcome;
        if (!session.active) return outcome;
        ++stops;
        session.active = false;
        outcome.wasActive = true;
        if (produceArtifact) outcome.artifact = AudioArtifact{session.path, 32000, WavFormat{}};
        if (exitAbnormally) outcome.fault = Fault{FaultKind::RecorderExitedAbnormally, "exit code 1"};
        return outcome;
    }

    void abort(RecordingSession& session) override {
        if (session.active) ++aborts;
        session.active = false;
    }

    bool failStart = false;
    bool produceArtifact = true;
    bool exitAbnormally = false;

    int starts = 0;
    int stops = 0;
    int aborts = 0;
};

class FakeTranscriber : public Transcriber {
public:
    Result<std::vector<TranscriptSegment>> transcribe(const AudioArtifact& artifact) override {
        calls.push_back(artifact.path);
        if (onTranscribe) onTranscribe();
        if (fault) return *fault;

        std::vector<TranscriptSegment> segments;
        for (const auto& text : texts) appendSegment(segments, text);
        return segments;
    }

    std::vector<std::string> texts;
    std::optional<Fault> fault;
    std::function<void()> onTranscribe;
    std::vector<std::string> calls;
};

class FakeInjector : public TextInjector {
public:
    Result<void> inject(const std::string& text) override {
        payloads.push_back(injectionPayload(text));
        if (failures.count(payloads.size())) return Fault{FaultKind::InjectionFailed, "exit code 1"};
        if (socketMissing) return Fault{FaultKind::InjectorSocketMissing, "/run/user/1000/.ydotool_socket"};
        return {};
    }

    std::vector<std::string> payloads;
    std::set<size_t> failures;      // 1-based call numbers that fail
    bool socketMissing = false;
};

// Replays a scripted sequence of edges and faults. Exhausting the script
// yields Cancelled, like a shutdown.
class FakeKeySource : public KeySource {
public:
    Result<void> open(const std::string& path) override {
        opened.push_back(path);
        if (opened.size() > openSucceedFirst && !openFailures.empty()) {
            Fault fault = openFailures.front();
            openFailures.pop_front();
            return fault;
        }
        return {};
    }

    Result<KeyEvent> next() override {
        if (script.empty()) return Fault{FaultKind::Cancelled, "script exhausted"};
        Result<KeyEvent> item = script.front();
        script.pop_front();
        return item;
    }

    void close() override { ++closes; }

    // Queued open faults apply once this many opens have succeeded.
    size_t openSucceedFirst = 0;
    std::deque<Fault> openFailures;
    std::deque<Result<KeyEvent>> script;
    std::vector<std::string> opened;
    int closes = 0;
};

class FakeResolver : public DeviceResolver {
public:
    Result<std::string> resolve(const std::string& configuredPath, uint16_t /*keyCode*/) override {
        ++calls;
        lastConfigured = configuredPath;
        if (answer.empty()) return Fault{FaultKind::DeviceUnavailable, "no device reports the key"};
        return answer;
    }

    std::string answer;
    std::string lastConfigured;
    int calls = 0;
};

#endif
