#include "stt/whisper_stt.hpp"
#include "audio/wav_file.hpp"
#include "core/logger.hpp"
#include "core/shutdown_signal.hpp"

#include <whisper.h>
#include <ggml-backend.h>

#include <chrono>
#include <stdexcept>

static const char* kTag = "Whisper STT";

static void routeWhisperLog(ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text) return;
    const std::string line = trimText(text);
    if (line.empty()) return;
    if (level == GGML_LOG_LEVEL_ERROR) {
        Logger::instance().warn(kTag, line);
    } else {
        Logger::instance().debug(kTag, line);
    }
}

struct AbortState {
    std::chrono::steady_clock::time_point deadline;
    const ShutdownSignal* shutdown = nullptr;
    bool timedOut = false;
    bool cancelled = false;
};

static bool shouldAbort(void* data) {
    auto* state = static_cast<AbortState*>(data);
    if (state->shutdown && state->shutdown->requested()) {
        state->cancelled = true;
        return true;
    }
    if (std::chrono::steady_clock::now() >= state->deadline) {
        state->timedOut = true;
        return true;
    }
    return false;
}

bool WhisperSTT::acceleratorAvailable() {
    ggml_backend_load_all();
    for (size_t i = 0; i < ggml_backend_dev_count(); ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        const auto type = ggml_backend_dev_type(dev);
        if (type != GGML_BACKEND_DEVICE_TYPE_CPU && type != GGML_BACKEND_DEVICE_TYPE_ACCEL) return true;
    }
    return false;
}

// Constructor
WhisperSTT::WhisperSTT(const AppConfig::Transcriber& config, const ShutdownSignal* shutdown)
    : config_(config), shutdown_(shutdown), modelPath_(resolveModelPath(config)) {
    whisper_log_set(routeWhisperLog, nullptr);

    if (config_.language != "auto" && whisper_lang_id(config_.language.c_str()) == -1) {
        throw FaultError(Fault{FaultKind::ConfigInvalid, "unknown language '" + config_.language + "'"});
    }

    Logger& log = Logger::instance();
    switch (config_.device) {
        case DevicePolicy::Cpu:
            accelerated_ = false;
            log.info(kTag, "CPU device selected via configuration");
            break;
        case DevicePolicy::Accelerated:
            if (!acceleratorAvailable()) {
                throw FaultError(Fault{FaultKind::AcceleratorUnavailable,
                                       "transcriber.device is 'accelerated' but no GPU-class device was found"});
            }
            accelerated_ = true;
            log.info(kTag, "Accelerated device selected via configuration");
            break;
        case DevicePolicy::Auto:
            accelerated_ = acceleratorAvailable();
            log.info(kTag, accelerated_ ? "Accelerator detected and will be used" : "No accelerator available, using CPU");
            break;
    }

    log.info(kTag, "Loading model " + modelPath_ + " (this happens once at startup)");

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = accelerated_;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath_.c_str(), cparams);
    if (!context_ && accelerated_ && config_.device == DevicePolicy::Auto) {
        log.debug(kTag, "Accelerated init failed, retrying on CPU");
        accelerated_ = false;
        cparams.use_gpu = false;
        context_ = whisper_init_from_file_with_params(modelPath_.c_str(), cparams);
    }
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + modelPath_);

    log.info(kTag, std::string("Model loaded on ") + (accelerated_ ? "accelerator" : "CPU"));
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

Result<std::vector<TranscriptSegment>> WhisperSTT::transcribe(const AudioArtifact& artifact) {
    PcmAudio audio;
    try {
        audio = readWavFile(artifact.path);
    } catch (const std::exception& e) {
        return Fault{FaultKind::TranscriptionFailed, e.what()};
    }

    if (audio.format.sampleRate != WHISPER_SAMPLE_RATE) {
        Logger::instance().warn(kTag, "Audio sample rate " + std::to_string(audio.format.sampleRate) +
                                " does not match " + std::to_string(WHISPER_SAMPLE_RATE));
    }
    if (audio.format.channels > 1) {
        Logger::instance().debug(kTag, "Averaging " + std::to_string(audio.format.channels) + " channels to mono");
    }

    return transcribe(toMonoFloat(audio));
}

// Converts pcm16kMono into trimmed, non-empty segments
Result<std::vector<TranscriptSegment>> WhisperSTT::transcribe(const std::vector<float>& pcm16kMono) {
    std::vector<TranscriptSegment> segments;
    if (pcm16kMono.empty()) return segments;

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;
    params.no_context = true;
    params.suppress_blank = true;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    params.no_speech_thold = 0.6f;

    AbortState abort;
    abort.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeoutMs);
    abort.shutdown = shutdown_;
    params.abort_callback = shouldAbort;
    params.abort_callback_user_data = &abort;

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (abort.cancelled) return Fault{FaultKind::Cancelled, "shutdown during transcription"};
    if (abort.timedOut) {
        return Fault{FaultKind::TranscriptionTimedOut,
                     "no result after " + std::to_string(config_.timeoutMs) + " ms"};
    }
    if (rc != 0) return Fault{FaultKind::TranscriptionFailed, "whisper_full failed (" + std::to_string(rc) + ")"};

    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) appendSegment(segments, whisper_full_get_segment_text(context_, i));

    if (config_.language == "auto") {
        const char* lang = whisper_lang_str(whisper_full_lang_id(context_));
        if (lang) Logger::instance().info(kTag, std::string("Detected language: ") + lang);
    }
    return segments;
}
