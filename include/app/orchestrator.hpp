#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include "audio/recorder.hpp"
#include "core/config.hpp"
#include "inject/text_injector.hpp"
#include "input/key_event.hpp"
#include "stt/transcriber.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

class ShutdownSignal;

// Hold-to-talk state machine. One gesture at a time: a press while IDLE
// starts the recorder, the matching release stops it, then the artifact is
// transcribed and every segment is typed. Per-gesture faults are logged and
// the machine returns to IDLE; nothing here ends the process.
class Orchestrator {
public:
    enum class State { Idle, Recording, Transcribing, Injecting };

    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Stats {
        uint64_t sessionsStarted = 0;
        uint64_t gesturesCompleted = 0;
        uint64_t gesturesFailed = 0;
        uint64_t injections = 0;
        uint64_t injectionFailures = 0;
        uint64_t ignoredEvents = 0;
    };

    Orchestrator(const AppConfig& config, Recorder& recorder, Transcriber& transcriber,
                 TextInjector& injector, const ShutdownSignal& shutdown,
                 Clock clock = std::chrono::steady_clock::now);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Runs the whole release -> transcribe -> inject sequence synchronously.
    void onKeyEvent(const KeyEvent& event);

    // The key source failed; a recording in flight cannot be finished.
    void onDeviceLost();

    // Stops and reaps an active recorder. Safe to call repeatedly.
    void shutdown();

    State state() const { return state_; }
    const Stats& stats() const { return stats_; }

private:
    void handle(const KeyEvent& event);
    void beginRecording();
    void finishRecording();
    void deliver(const std::vector<TranscriptSegment>& segments);
    bool isStale(const KeyEvent& event) const;
    void teardown();
    void discardArtifact();
    void returnToIdle();

    const AppConfig& config_;
    Recorder& recorder_;
    Transcriber& transcriber_;
    TextInjector& injector_;
    const ShutdownSignal& shutdown_;
    Clock clock_;

    State state_ = State::Idle;
    RecordingSession session_;
    std::chrono::steady_clock::time_point idleSince_{};
    Stats stats_;
};

const char* stateName(Orchestrator::State state);

#endif
