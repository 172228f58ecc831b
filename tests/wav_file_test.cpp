#include "audio/wav_file.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(WavFile, ReadsWhatWasWritten) {
    TempDir dir;
    const std::string path = dir.file("tone.wav");
    ASSERT_TRUE(writeWavFile(path, {0, 1000, -1000, 32767}, 16000, 1));

    PcmAudio audio = readWavFile(path);
    EXPECT_EQ(audio.format.sampleRate, 16000u);
    EXPECT_EQ(audio.format.channels, 1);
    EXPECT_EQ(audio.frames(), 4u);
    EXPECT_EQ(audio.samples[3], 32767);
    EXPECT_EQ(readFile(path).size(), 44u + 8u);
}

TEST(WavFile, ClampsAnOverrunningDataChunk) {
    TempDir dir;
    const std::string path = dir.file("killed.wav");
    ASSERT_TRUE(writeWavFile(path, {1, 2, 3, 4}, 16000, 1));

    // arecord killed mid-write leaves 0x7fffffff-style sizes behind.
    std::string bytes = readFile(path);
    bytes[40] = '\xff';
    bytes[41] = '\xff';
    bytes[42] = '\xff';
    bytes[43] = '\x7f';
    writeFile(path, bytes);

    PcmAudio audio = readWavFile(path);
    EXPECT_EQ(audio.samples.size(), 4u);
}

TEST(WavFile, RejectsNonWavInput) {
    TempDir dir;
    const std::string path = dir.file("text.wav");
    writeFile(path, "definitely not audio");

    EXPECT_THROW(readWavFile(path), std::runtime_error);
    EXPECT_THROW(readWavFile(dir.file("missing.wav")), std::runtime_error);
}

TEST(WavFile, AveragesChannelsToMono) {
    PcmAudio audio;
    audio.format.channels = 2;
    audio.samples = {16384, 0, -16384, -16384};

    const std::vector<float> mono = toMonoFloat(audio);
    ASSERT_EQ(mono.size(), 2u);
    EXPECT_FLOAT_EQ(mono[0], 0.25f);
    EXPECT_FLOAT_EQ(mono[1], -0.5f);
}
