#ifndef PCM_CAPTURE_HPP
#define PCM_CAPTURE_HPP

#include "audio/capture_buffer.hpp"

#include <atomic>
#include <string>

typedef void PaStream;

// Blocking PortAudio input stream feeding a CaptureBuffer.
class PcmCapture {
public:
    struct Config {
        int device = -1;            // PortAudio device index, -1 = default input
        int sampleRate = 16000;
        int channels = 1;
        int framesPerBuffer = 320;
    };

    explicit PcmCapture(Config config);
    ~PcmCapture();

    PcmCapture(const PcmCapture&) = delete;
    PcmCapture& operator=(const PcmCapture&) = delete;

    std::string deviceName() const;

    // Reads until `running` goes false or the buffer is full.
    void run(CaptureBuffer& buffer, const std::atomic<bool>& running);

private:
    void close();

    Config config_;
    PaStream* stream_ = nullptr;
    std::string deviceName_;
};

#endif
