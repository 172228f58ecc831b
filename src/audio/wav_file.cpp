#include "audio/wav_file.hpp"

#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

static void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

static void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

static uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t getU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool writeWavFile(const std::string& path, const std::vector<int16_t>& samples,
                  uint32_t sampleRate, uint16_t channels) {
    const uint32_t dataSize = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint16_t blockAlign = static_cast<uint16_t>(channels * 2);

    std::vector<uint8_t> out;
    out.reserve(44 + dataSize);
    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    putU32(out, 36 + dataSize);
    out.insert(out.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    putU32(out, 16);
    putU16(out, 1);
    putU16(out, channels);
    putU32(out, sampleRate);
    putU32(out, sampleRate * blockAlign);
    putU16(out, blockAlign);
    putU16(out, 16);
    out.insert(out.end(), {'d', 'a', 't', 'a'});
    putU32(out, dataSize);
    for (int16_t s : samples) putU16(out, static_cast<uint16_t>(s));

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file.write(reinterpret_cast<const char*>(out.data()), static_cast<std::streamsize>(out.size()));
    return static_cast<bool>(file);
}

PcmAudio readWavFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("cannot open " + path);

    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 || std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw std::runtime_error(path + " is not a RIFF/WAVE file");
    }

    PcmAudio audio;
    bool haveFormat = false;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = getU32(chunk + 4);
        const size_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || body + 16 > bytes.size()) throw std::runtime_error(path + ": truncated fmt chunk");
            audio.format.audioFormat = getU16(bytes.data() + body);
            audio.format.channels = getU16(bytes.data() + body + 2);
            audio.format.sampleRate = getU32(bytes.data() + body + 4);
            audio.format.bitsPerSample = getU16(bytes.data() + body + 14);
            haveFormat = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!haveFormat) throw std::runtime_error(path + ": data chunk before fmt chunk");
            if (audio.format.audioFormat != 1 || audio.format.bitsPerSample != 16) {
                throw std::runtime_error(path + ": only 16-bit PCM is supported");
            }
            if (audio.format.channels == 0) throw std::runtime_error(path + ": zero channels");

            // Recorders stopped by a signal may leave a placeholder size.
            if (size > bytes.size() - body) size = static_cast<uint32_t>(bytes.size() - body);
            const size_t count = size / 2;
            audio.samples.resize(count);
            for (size_t i = 0; i < count; ++i) {
                audio.samples[i] = static_cast<int16_t>(getU16(bytes.data() + body + 2 * i));
            }
            return audio;
        }

        pos = body + size + (size & 1);
    }

    throw std::runtime_error(path + ": no data chunk");
}

std::vector<float> toMonoFloat(const PcmAudio& audio) {
    const size_t channels = audio.format.channels ? audio.format.channels : 1;
    const size_t frames = audio.samples.size() / channels;

    std::vector<float> out(frames);
    for (size_t f = 0; f < frames; ++f) {
        float acc = 0.0f;
        for (size_t c = 0; c < channels; ++c) acc += static_cast<float>(audio.samples[f * channels + c]) / 32768.0f;
        out[f] = acc / static_cast<float>(channels);
    }
    return out;
}
