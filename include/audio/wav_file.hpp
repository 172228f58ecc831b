#ifndef WAV_FILE_HPP
#define WAV_FILE_HPP

#include <cstdint>
#include <string>
#include <vector>

struct WavFormat {
    uint16_t audioFormat = 1;   // PCM
    uint16_t channels = 1;
    uint32_t sampleRate = 16000;
    uint16_t bitsPerSample = 16;
};

struct PcmAudio {
    WavFormat format;
    std::vector<int16_t> samples;   // interleaved

    size_t frames() const { return format.channels ? samples.size() / format.channels : 0; }
};

// Canonical 44-byte RIFF header followed by little-endian PCM16.
bool writeWavFile(const std::string& path, const std::vector<int16_t>& samples,
                  uint32_t sampleRate, uint16_t channels);

// Parses RIFF/WAVE PCM16, skipping unknown chunks. A data chunk whose
// declared size overruns the file is clamped to what is present.
// Throws std::runtime_error on anything else.
PcmAudio readWavFile(const std::string& path);

// Averages channels and scales to [-1, 1).
std::vector<float> toMonoFloat(const PcmAudio& audio);

#endif
