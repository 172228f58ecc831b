#include "input/device_locator.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

TEST(DeviceLocator, ScansEventNodesInNumericOrder) {
    TempDir dir;
    for (const char* name : {"event10", "event2", "mouse0", "event0"}) writeFile(dir.file(name), "");

    DeviceLocator locator(dir.path());
    const auto devices = locator.scan(97);

    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].path, dir.file("event0"));
    EXPECT_EQ(devices[1].path, dir.file("event2"));
    EXPECT_EQ(devices[2].path, dir.file("event10"));
    // Plain files open fine but answer no evdev ioctls.
    EXPECT_TRUE(devices[0].accessible);
    EXPECT_FALSE(devices[0].hasTriggerKey);
}

TEST(DeviceLocator, NothingUsableIsUnavailable) {
    TempDir dir;
    writeFile(dir.file("event0"), "");

    DeviceLocator locator(dir.path());
    Result<std::string> resolved = locator.resolve(dir.file("event0"), 97);
    ASSERT_FALSE(resolved.ok());
    EXPECT_EQ(resolved.fault().kind, FaultKind::DeviceUnavailable);
}

TEST(DeviceLocator, MissingDirectoryScansNothing) {
    DeviceLocator locator("/nonexistent/input");
    EXPECT_TRUE(locator.scan(97).empty());
}
