#include "app/orchestrator.hpp"
#include "core/logger.hpp"
#include "core/shutdown_signal.hpp"
#include "input/key_codes.hpp"

#include <cstdio>
#include <exception>
#include <utility>

static const char* kTag = "Orchestrator";

const char* stateName(Orchestrator::State state) {
    switch (state) {
        case Orchestrator::State::Idle: return "IDLE";
        case Orchestrator::State::Recording: return "RECORDING";
        case Orchestrator::State::Transcribing: return "TRANSCRIBING";
        case Orchestrator::State::Injecting: return "INJECTING";
    }
    return "UNKNOWN";
}

// Constructor
Orchestrator::Orchestrator(const AppConfig& config, Recorder& recorder, Transcriber& transcriber,
                           TextInjector& injector, const ShutdownSignal& shutdown, Clock clock)
    : config_(config), recorder_(recorder), transcriber_(transcriber), injector_(injector),
      shutdown_(shutdown), clock_(std::move(clock)) {}

// Destructor
Orchestrator::~Orchestrator() { shutdown(); }

void Orchestrator::onKeyEvent(const KeyEvent& event) {
    try {
        handle(event);
    } catch (const std::exception& e) {
        Logger::instance().error(kTag, std::string("Unhandled error while ") + stateName(state_) + ": " +
                                 e.what() + "; gesture dropped");
        ++stats_.gesturesFailed;
        teardown();
        returnToIdle();
    }
}

void Orchestrator::handle(const KeyEvent& event) {
    Logger& log = Logger::instance();

    if (event.code != config_.device.keyCode) {
        ++stats_.ignoredEvents;
        return;
    }

    if (event.action == KeyAction::Press) {
        if (state_ != State::Idle) {
            ++stats_.ignoredEvents;
            log.debug(kTag, std::string("Press ignored while ") + stateName(state_));
            return;
        }
        if (isStale(event)) {
            ++stats_.ignoredEvents;
            log.debug(kTag, "Press queued while busy ignored");
            return;
        }
        beginRecording();
        return;
    }

    if (state_ != State::Recording) {
        ++stats_.ignoredEvents;
        log.debug(kTag, std::string("Release ignored while ") + stateName(state_));
        return;
    }
    finishRecording();
}

void Orchestrator::beginRecording() {
    Logger& log = Logger::instance();

    Result<RecordingSession> started = recorder_.start(config_.recorder.audioFile);
    if (!started) {
        log.error(kTag, "Recording: " + started.fault().describe());
        ++stats_.gesturesFailed;
        returnToIdle();
        return;
    }

    session_ = std::move(started.value());
    ++stats_.sessionsStarted;
    state_ = State::Recording;
    log.info(kTag, keyNameFromCode(config_.device.keyCode) + " held, recording to " + session_.path);
}

void Orchestrator::finishRecording() {
    Logger& log = Logger::instance();

    state_ = State::Transcribing;
    StopOutcome stopped = recorder_.stop(session_);
    const auto held = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - session_.startedAt);
    session_ = RecordingSession();

    if (stopped.fault) {
        // Partial captures are still worth transcribing.
        if (stopped.artifact) {
            log.warn(kTag, "Recording: " + stopped.fault->describe() + "; transcribing what was captured");
        } else {
            log.error(kTag, "Recording: " + stopped.fault->describe());
        }
    }
    if (!stopped.artifact) {
        if (!stopped.fault) log.warn(kTag, "Recording: no audio was captured");
        ++stats_.gesturesFailed;
        returnToIdle();
        return;
    }
    if (shutdown_.requested()) {
        log.info(kTag, "Shutdown requested, skipping transcription");
        discardArtifact();
        returnToIdle();
        return;
    }

    log.info(kTag, "Released after " + std::to_string(held.count()) + " ms, transcribing " +
             std::to_string(stopped.artifact->bytes) + " bytes");

    Result<std::vector<TranscriptSegment>> transcript = transcriber_.transcribe(*stopped.artifact);
    discardArtifact();

    if (!transcript) {
        log.error(kTag, "Transcription: " + transcript.fault().describe());
        ++stats_.gesturesFailed;
        returnToIdle();
        return;
    }
    if (transcript->empty()) {
        log.info(kTag, "Nothing recognised");
        ++stats_.gesturesCompleted;
        returnToIdle();
        return;
    }

    state_ = State::Injecting;
    deliver(*transcript);
    ++stats_.gesturesCompleted;
    returnToIdle();
}

void Orchestrator::deliver(const std::vector<TranscriptSegment>& segments) {
    Logger& log = Logger::instance();

    for (size_t i = 0; i < segments.size(); ++i) {
        if (shutdown_.requested()) {
            log.info(kTag, "Shutdown requested, " + std::to_string(segments.size() - i) + " segment(s) not typed");
            return;
        }
        log.info(kTag, "Typing: \"" + segments[i].text + "\"");
        Result<void> injected = injector_.inject(segments[i].text);
        if (injected) {
            ++stats_.injections;
        } else {
            ++stats_.injectionFailures;
            log.error(kTag, "Injection of segment " + std::to_string(i + 1) + "/" +
                      std::to_string(segments.size()) + ": " + injected.fault().describe());
        }
    }
}

void Orchestrator::onDeviceLost() {
    if (state_ != State::Recording) return;
    Logger::instance().warn(kTag, "Input device lost while recording, discarding the capture");
    ++stats_.gesturesFailed;
    teardown();
    returnToIdle();
}

void Orchestrator::shutdown() {
    if (state_ == State::Recording || session_.active) {
        Logger::instance().info(kTag, "Stopping the active recording before exit");
        teardown();
        returnToIdle();
    }
}

bool Orchestrator::isStale(const KeyEvent& event) const {
    if (event.timestamp == std::chrono::steady_clock::time_point{}) return false;
    return event.timestamp < idleSince_;
}

void Orchestrator::teardown() {
    try {
        recorder_.abort(session_);
    } catch (const std::exception& e) {
        Logger::instance().error(kTag, std::string("Recorder teardown: ") + e.what());
    }
    session_ = RecordingSession();
    discardArtifact();
}

void Orchestrator::discardArtifact() {
    if (config_.recorder.keepAudio) return;
    std::remove(config_.recorder.audioFile.c_str());
}

void Orchestrator::returnToIdle() {
    state_ = State::Idle;
    idleSince_ = clock_();
}
