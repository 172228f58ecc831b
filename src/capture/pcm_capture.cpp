#include "capture/pcm_capture.hpp"

#include <portaudio.h>
#include <stdexcept>
#include <vector>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
PcmCapture::PcmCapture(Config config) : config_(config) {
    pa_check(Pa_Initialize(), "Pa_Initialize");

    PaStreamParameters inParams{};
    inParams.device = config_.device >= 0 ? (PaDeviceIndex)config_.device : Pa_GetDefaultInputDevice();
    if (inParams.device == paNoDevice || inParams.device >= Pa_GetDeviceCount()) {
        Pa_Terminate();
        throw std::runtime_error("No usable input device");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    deviceName_ = info ? info->name : "(unknown)";

    inParams.channelCount = config_.channels;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
    inParams.hostApiSpecificStreamInfo = nullptr;

    PaError e = Pa_OpenStream(&stream_, &inParams, nullptr,
                              config_.sampleRate, config_.framesPerBuffer,
                              paClipOff, nullptr, nullptr);
    if (e != paNoError) {
        Pa_Terminate();
        pa_check(e, "Pa_OpenStream");
    }
}

// Destructor
PcmCapture::~PcmCapture() {
    close();
    Pa_Terminate();
}

std::string PcmCapture::deviceName() const {
    return deviceName_;
}

void PcmCapture::close() {
    if (!stream_) return;
    if (Pa_IsStreamActive(stream_) == 1) Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
}

void PcmCapture::run(CaptureBuffer& buffer, const std::atomic<bool>& running) {
    pa_check(Pa_StartStream(stream_), "Pa_StartStream");

    std::vector<int16_t> buff((size_t)config_.framesPerBuffer * config_.channels);

    while (running.load()) {
        PaError e = Pa_ReadStream(stream_, buff.data(), config_.framesPerBuffer);
        if (e == paInputOverflowed) {
            continue;
        }
        pa_check(e, "Pa_ReadStream");

        if (buffer.feed(buff.data(), config_.framesPerBuffer)) break;
    }

    pa_check(Pa_StopStream(stream_), "Pa_StopStream");
}
