#include "core/shutdown_signal.hpp"
#include "stt/command_transcriber.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace {

class CommandTranscriberTest : public ::testing::Test {
protected:
    CommandTranscriberTest() {
        config.backend = "command";
        config.timeoutMs = 5000;
        artifact.path = dir.file("recording.wav");
        writeFile(artifact.path, "RIFF");
    }

    Result<std::vector<TranscriptSegment>> run(const std::string& body) {
        config.command = {writeScript(dir, "recognize", body), "--file", "{audio}"};
        CommandTranscriber transcriber(config, Environment{}, &shutdown);
        return transcriber.transcribe(artifact);
    }

    TempDir dir;
    AppConfig::Transcriber config;
    AudioArtifact artifact;
    ShutdownSignal shutdown;
};

} // namespace

TEST_F(CommandTranscriberTest, SubstitutesTheAudioPath) {
    config.command = {"whisper-cli", "-f", "{audio}", "--out={audio}.txt"};
    CommandTranscriber transcriber(config, Environment{});

    const std::vector<std::string> expected = {"whisper-cli", "-f", artifact.path, "--out=" + artifact.path + ".txt"};
    EXPECT_EQ(transcriber.commandLine(artifact.path), expected);
}

TEST_F(CommandTranscriberTest, AppendsThePathWithoutPlaceholder) {
    config.command = {"recognize"};
    CommandTranscriber transcriber(config, Environment{});

    const std::vector<std::string> expected = {"recognize", artifact.path};
    EXPECT_EQ(transcriber.commandLine(artifact.path), expected);
}

TEST_F(CommandTranscriberTest, EachLineIsASegment) {
    auto segments = run("test \"$2\" = \"" + artifact.path + "\" || exit 9\n"
                        "printf '  turn on the lights  \\n\\n   \\nplease\\n'");

    ASSERT_TRUE(segments.ok()) << segments.fault().describe();
    ASSERT_EQ(segments->size(), 2u);
    EXPECT_EQ((*segments)[0].text, "turn on the lights");
    EXPECT_EQ((*segments)[1].text, "please");
}

TEST_F(CommandTranscriberTest, BlankOutputIsZeroSegments) {
    auto segments = run("printf '   '");

    ASSERT_TRUE(segments.ok());
    EXPECT_TRUE(segments->empty());
}

TEST_F(CommandTranscriberTest, NonZeroExitFails) {
    auto segments = run("echo 'corrupt input' >&2; exit 2");

    ASSERT_FALSE(segments.ok());
    EXPECT_EQ(segments.fault().kind, FaultKind::TranscriptionFailed);
}

TEST_F(CommandTranscriberTest, HangingBackendTimesOut) {
    config.timeoutMs = 200;
    auto segments = run("exec sleep 10");

    ASSERT_FALSE(segments.ok());
    EXPECT_EQ(segments.fault().kind, FaultKind::TranscriptionTimedOut);
}

TEST_F(CommandTranscriberTest, ShutdownCancels) {
    shutdown.trigger();
    auto segments = run("exec sleep 10");

    ASSERT_FALSE(segments.ok());
    EXPECT_EQ(segments.fault().kind, FaultKind::Cancelled);
}
