#include "audio/capture_buffer.hpp"

#include <cmath>
#include <algorithm>

// Constructor
CaptureBuffer::CaptureBuffer(Config config) : config_(config) {
    maxSamples_ = static_cast<size_t>(config_.maxCaptureMs) * config_.sampleRate / 1000 * config_.channels;
    // One minute up front; long dictations grow the vector as usual.
    samples_.reserve(std::min(maxSamples_, static_cast<size_t>(60) * config_.sampleRate * config_.channels));
}

// Clears captured audio and levels
void CaptureBuffer::reset() {
    full_ = false;
    lastRms_ = 0.0f;
    peakRms_ = 0.0f;
    samples_.clear();
}

float CaptureBuffer::rms(const int16_t* x, int n) const {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) {
        const double s = x[i] / 32768.0;
        acc += s * s;
    }
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

int CaptureBuffer::capturedMs() const {
    const size_t frames = samples_.size() / std::max(1, config_.channels);
    return (int)(frames * 1000 / std::max(1, config_.sampleRate));
}

bool CaptureBuffer::feed(const int16_t* samples, int frames) {
    if (full_) return true;

    const int n = frames * config_.channels;
    lastRms_ = rms(samples, n);
    peakRms_ = std::max(peakRms_, lastRms_);

    const size_t room = maxSamples_ - samples_.size();
    const size_t take = std::min(room, (size_t)n);
    samples_.insert(samples_.end(), samples, samples + take);

    if (samples_.size() >= maxSamples_) full_ = true;
    return full_;
}
