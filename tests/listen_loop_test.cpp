#include "app/listen_loop.hpp"
#include "core/shutdown_signal.hpp"
#include "fakes.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace {

constexpr uint16_t kKey = 97;

KeyEvent press() { return KeyEvent{KeyAction::Press, kKey, {}}; }
KeyEvent release() { return KeyEvent{KeyAction::Release, kKey, {}}; }
Fault lost() { return Fault{FaultKind::DeviceLost, "read: No such device"}; }

class ListenLoopTest : public ::testing::Test {
protected:
    ListenLoopTest() {
        config.device.path = "/dev/input/event3";
        config.device.keyCode = kKey;
        config.device.maxRetries = 3;
        config.device.retryBackoffMs = 1;
        config.device.retryBackoffMaxMs = 4;
        config.recorder.audioFile = dir.file("recording.wav");
        transcriber.texts = {"ok"};
    }

    int run() {
        Orchestrator orchestrator(config, recorder, transcriber, injector, shutdown);
        ListenLoop loop(config.device, source, resolver, orchestrator, shutdown);
        const int code = loop.run();
        finalPath = loop.devicePath();
        return code;
    }

    TempDir dir;
    AppConfig config;
    FakeRecorder recorder;
    FakeTranscriber transcriber;
    FakeInjector injector;
    FakeKeySource source;
    FakeResolver resolver;
    ShutdownSignal shutdown;
    std::string finalPath;
};

} // namespace

TEST_F(ListenLoopTest, FeedsEventsUntilCancelled) {
    source.script = {press(), release()};

    EXPECT_EQ(run(), 0);
    EXPECT_EQ(recorder.starts, 1);
    ASSERT_EQ(injector.payloads.size(), 1u);
    EXPECT_EQ(resolver.calls, 0);
    ASSERT_EQ(source.opened.size(), 1u);
    EXPECT_EQ(source.opened[0], "/dev/input/event3");
}

TEST_F(ListenLoopTest, LostDeviceIsResolvedAndReopened) {
    resolver.answer = "/dev/input/event7";
    source.script = {press(), lost(), press(), release()};

    EXPECT_EQ(run(), 0);
    EXPECT_EQ(resolver.calls, 1);
    EXPECT_EQ(resolver.lastConfigured, "/dev/input/event3");
    ASSERT_EQ(source.opened.size(), 2u);
    EXPECT_EQ(source.opened[1], "/dev/input/event7");
    EXPECT_EQ(finalPath, "/dev/input/event7");

    // The first recording died with the device; the second completed.
    EXPECT_EQ(recorder.aborts, 1);
    EXPECT_EQ(recorder.starts, 2);
    EXPECT_EQ(injector.payloads.size(), 1u);
}

TEST_F(ListenLoopTest, GivesUpAfterMaxRetries) {
    config.device.maxRetries = 2;
    source.openSucceedFirst = 1;
    for (int i = 0; i < 5; ++i) source.openFailures.push_back(Fault{FaultKind::DeviceUnavailable, "ENOENT"});
    source.script = {lost()};

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(source.opened.size(), 3u);
    EXPECT_EQ(resolver.calls, 2);
}

TEST_F(ListenLoopTest, ReconnectsDoNotUseUpTheBudget) {
    config.device.maxRetries = 2;
    source.script = {lost(), lost(), lost()};

    EXPECT_EQ(run(), 0);
    EXPECT_EQ(source.opened.size(), 4u);
    EXPECT_EQ(resolver.calls, 3);
}

TEST_F(ListenLoopTest, MissingDeviceAtStartupFailsFast) {
    config.device.retryBackoffMs = 60000;
    config.device.retryBackoffMaxMs = 60000;
    source.openFailures.push_back(Fault{FaultKind::DeviceUnavailable, "ENOENT"});

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(source.opened.size(), 1u);
    EXPECT_EQ(resolver.calls, 1);
}

TEST_F(ListenLoopTest, StartupFallsBackToAResolvedDevice) {
    resolver.answer = "/dev/input/event7";
    source.openFailures.push_back(Fault{FaultKind::DeviceUnavailable, "ENOENT"});
    source.script = {press(), release()};

    EXPECT_EQ(run(), 0);
    ASSERT_EQ(source.opened.size(), 2u);
    EXPECT_EQ(source.opened[1], "/dev/input/event7");
    EXPECT_EQ(injector.payloads.size(), 1u);
}

TEST_F(ListenLoopTest, AReopenResetsTheRetryBudget) {
    config.device.maxRetries = 1;
    source.script = {lost(), press(), lost(), release()};

    EXPECT_EQ(run(), 0);
    EXPECT_EQ(source.opened.size(), 3u);
}

TEST_F(ListenLoopTest, ShutdownBeforeStartDoesNotOpen) {
    shutdown.trigger();

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(source.opened.empty());
}
