#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "core/config.hpp"
#include "stt/transcriber.hpp"

#include <string>
#include <vector>

struct whisper_context;
class ShutdownSignal;

// In-process whisper.cpp backend. The model is loaded once, here, and
// reused for every gesture.
class WhisperSTT : public Transcriber {
public:
    // Throws FaultError(AcceleratorUnavailable) when the accelerated policy
    // finds no GPU-class device, FaultError(ConfigInvalid) for an unknown
    // language and std::runtime_error when the model cannot be loaded.
    explicit WhisperSTT(const AppConfig::Transcriber& config, const ShutdownSignal* shutdown = nullptr);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    Result<std::vector<TranscriptSegment>> transcribe(const AudioArtifact& artifact) override;

    bool accelerated() const { return accelerated_; }
    const std::string& modelPath() const { return modelPath_; }

    // True if ggml reports a non-CPU compute device.
    static bool acceleratorAvailable();

private:
    Result<std::vector<TranscriptSegment>> transcribe(const std::vector<float>& pcm16kMono);

    const AppConfig::Transcriber& config_;
    const ShutdownSignal* shutdown_;
    std::string modelPath_;
    bool accelerated_ = false;
    whisper_context* context_ = nullptr;
};

#endif
