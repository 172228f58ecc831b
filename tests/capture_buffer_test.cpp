#include "audio/capture_buffer.hpp"

#include <gtest/gtest.h>

#include <vector>

TEST(CaptureBuffer, StopsAtTheCap) {
    CaptureBuffer::Config config;
    config.sampleRate = 1000;
    config.maxCaptureMs = 50;
    CaptureBuffer buffer(config);

    std::vector<int16_t> chunk(20, 100);
    EXPECT_FALSE(buffer.feed(chunk.data(), 20));
    EXPECT_FALSE(buffer.feed(chunk.data(), 20));
    EXPECT_TRUE(buffer.feed(chunk.data(), 20));
    EXPECT_TRUE(buffer.isFull());
    EXPECT_EQ(buffer.samples().size(), 50u);
    EXPECT_EQ(buffer.capturedMs(), 50);

    buffer.reset();
    EXPECT_FALSE(buffer.isFull());
    EXPECT_TRUE(buffer.samples().empty());
}

TEST(CaptureBuffer, TracksLevels) {
    CaptureBuffer buffer(CaptureBuffer::Config{});

    std::vector<int16_t> loud(320, 16384);
    std::vector<int16_t> quiet(320, 0);
    buffer.feed(loud.data(), 320);
    buffer.feed(quiet.data(), 320);

    EXPECT_FLOAT_EQ(buffer.lastRms(), 0.0f);
    EXPECT_NEAR(buffer.peakRms(), 0.5f, 1e-4);
}
