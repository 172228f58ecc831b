#include "audio/subprocess_recorder.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace {

class SubprocessRecorderTest : public ::testing::Test {
protected:
    SubprocessRecorderTest() {
        config.stopTimeoutMs = 2000;
        output = dir.file("recording.wav");
    }

    SubprocessRecorder make() { return SubprocessRecorder(config, currentUser(), Environment{}); }

    TempDir dir;
    AppConfig::Recorder config;
    std::string output;
};

// A stand-in for arecord: the last argument is the output file.
const char* kWritesUntilTerm =
    "for last; do :; done\n"
    "printf 'RIFF....WAVEfmt ' > \"$last\"\n"
    "trap 'exit 0' TERM\n"
    "while :; do sleep 0.05; done";

} // namespace

TEST_F(SubprocessRecorderTest, PassesTheFixedFormat) {
    config.binary = "arecord";
    config.extraArgs = {"-D", "pulse"};
    auto recorder = make();

    const std::vector<std::string> expected = {"arecord", "-D", "pulse", "-q", "-f", "S16_LE", "-r", "16000",
                                               "-c", "1", "-t", "wav", output};
    EXPECT_EQ(recorder.commandLine(output), expected);
}

TEST_F(SubprocessRecorderTest, StopYieldsTheArtifact) {
    config.binary = writeScript(dir, "rec", kWritesUntilTerm);
    auto recorder = make();

    Result<RecordingSession> session = recorder.start(output);
    ASSERT_TRUE(session.ok()) << session.fault().describe();
    EXPECT_TRUE(session->active);

    // Give the script time to create the file and install its trap.
    for (int i = 0; i < 100 && !fileExists(output); ++i) usleep(10000);
    usleep(100000);

    StopOutcome outcome = recorder.stop(*session);
    EXPECT_TRUE(outcome.wasActive);
    EXPECT_FALSE(outcome.fault.has_value()) << outcome.fault->describe();
    ASSERT_TRUE(outcome.artifact.has_value());
    EXPECT_EQ(outcome.artifact->path, output);
    EXPECT_GT(outcome.artifact->bytes, 0u);
}

TEST_F(SubprocessRecorderTest, AbnormalExitKeepsANonEmptyFile) {
    config.binary = writeScript(dir, "rec", "for last; do :; done\nprintf 'RIFF' > \"$last\"\nexit 1");
    auto recorder = make();

    Result<RecordingSession> session = recorder.start(output);
    ASSERT_TRUE(session.ok());
    usleep(200000);

    StopOutcome outcome = recorder.stop(*session);
    ASSERT_TRUE(outcome.fault.has_value());
    EXPECT_EQ(outcome.fault->kind, FaultKind::RecorderExitedAbnormally);
    ASSERT_TRUE(outcome.artifact.has_value());
    EXPECT_EQ(outcome.artifact->bytes, 4u);
}

TEST_F(SubprocessRecorderTest, EmptyOutputIsAFault) {
    config.binary = writeScript(dir, "rec", "exit 0");
    auto recorder = make();

    Result<RecordingSession> session = recorder.start(output);
    ASSERT_TRUE(session.ok());
    usleep(100000);

    StopOutcome outcome = recorder.stop(*session);
    EXPECT_FALSE(outcome.artifact.has_value());
    ASSERT_TRUE(outcome.fault.has_value());
    EXPECT_EQ(outcome.fault->kind, FaultKind::RecorderExitedAbnormally);
}

TEST_F(SubprocessRecorderTest, DoubleStopIsANoop) {
    config.binary = writeScript(dir, "rec", kWritesUntilTerm);
    auto recorder = make();

    Result<RecordingSession> session = recorder.start(output);
    ASSERT_TRUE(session.ok());
    recorder.stop(*session);

    StopOutcome again = recorder.stop(*session);
    EXPECT_FALSE(again.wasActive);
    EXPECT_FALSE(again.fault.has_value());
    EXPECT_FALSE(again.artifact.has_value());

    RecordingSession never;
    EXPECT_FALSE(recorder.stop(never).wasActive);
}

TEST_F(SubprocessRecorderTest, MissingBinaryFailsToSpawn) {
    config.binary = dir.file("no-such-recorder");
    auto recorder = make();

    Result<RecordingSession> session = recorder.start(output);
    ASSERT_FALSE(session.ok());
    EXPECT_EQ(session.fault().kind, FaultKind::RecorderSpawnFailed);
}

TEST_F(SubprocessRecorderTest, StartRemovesThePreviousFile) {
    writeFile(output, "stale audio");
    config.binary = writeScript(dir, "rec", "exec sleep 10");
    auto recorder = make();

    Result<RecordingSession> session = recorder.start(output);
    ASSERT_TRUE(session.ok());
    EXPECT_FALSE(fileExists(output));
    recorder.abort(*session);
}

TEST_F(SubprocessRecorderTest, AbortKillsAndDeletes) {
    config.binary = writeScript(dir, "rec", kWritesUntilTerm);
    auto recorder = make();

    Result<RecordingSession> session = recorder.start(output);
    ASSERT_TRUE(session.ok());
    for (int i = 0; i < 100 && !fileExists(output); ++i) usleep(10000);

    recorder.abort(*session);
    EXPECT_FALSE(session->active);
    EXPECT_FALSE(fileExists(output));
}
