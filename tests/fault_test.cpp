#include "core/fault.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(Fault, DescribesKindAndDetail) {
    EXPECT_EQ((Fault{FaultKind::InjectorSocketMissing, "/run/user/1000/.ydotool_socket"}).describe(),
              "InjectorSocketMissing: /run/user/1000/.ydotool_socket");
    EXPECT_EQ((Fault{FaultKind::Cancelled, ""}).describe(), "Cancelled");
}

TEST(Fault, ClassifiesKinds) {
    EXPECT_EQ(faultClass(FaultKind::DeviceLost), FaultClass::Device);
    EXPECT_EQ(faultClass(FaultKind::DeviceUnavailable), FaultClass::Device);
    EXPECT_EQ(faultClass(FaultKind::InjectionFailed), FaultClass::Session);
    EXPECT_EQ(faultClass(FaultKind::RecorderSpawnFailed), FaultClass::Session);
    EXPECT_EQ(faultClass(FaultKind::AcceleratorUnavailable), FaultClass::Configuration);
    EXPECT_EQ(faultClass(FaultKind::UserUnknown), FaultClass::Startup);
}

TEST(Result, HoldsValueOrFault) {
    Result<std::string> good(std::string("text"));
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(*good, "text");
    EXPECT_EQ(good->size(), 4u);

    Result<std::string> bad(Fault{FaultKind::TranscriptionFailed, "corrupt"});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.fault().kind, FaultKind::TranscriptionFailed);

    Result<void> done;
    EXPECT_TRUE(done.ok());
    Result<void> failed(Fault{FaultKind::InjectionFailed, "exit code 1"});
    EXPECT_FALSE(failed.ok());
}

TEST(FaultError, CarriesTheFault) {
    try {
        throw FaultError(Fault{FaultKind::ConfigInvalid, "target_user is required"});
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "ConfigInvalid: target_user is required");
        EXPECT_EQ(dynamic_cast<const FaultError&>(e).fault().kind, FaultKind::ConfigInvalid);
    }
}
