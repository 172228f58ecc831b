#ifndef CAPTURE_BUFFER_HPP
#define CAPTURE_BUFFER_HPP

#include <cstddef>
#include <vector>
#include <cstdint>

// Accumulates PCM16 frames for one hold-to-talk capture, up to a hard cap.
class CaptureBuffer {
public:
    struct Config {
        int sampleRate = 16000;
        int channels = 1;

        int framesPerBuffer = 320;

        int maxCaptureMs = 10 * 60 * 1000;
    };

    explicit CaptureBuffer(Config config);

    // Returns true once the cap is reached; further frames are dropped.
    bool feed(const int16_t* samples, int frames);

    bool isFull() const { return full_; }
    int capturedMs() const;
    float lastRms() const { return lastRms_; }
    float peakRms() const { return peakRms_; }

    const std::vector<int16_t>& samples() const { return samples_; }

    void reset();

private:
    Config config_;

    bool full_ = false;
    size_t maxSamples_ = 0;
    float lastRms_ = 0.0f;
    float peakRms_ = 0.0f;

    std::vector<int16_t> samples_;

    float rms(const int16_t* x, int n) const;
};

#endif
