#include <gtest/gtest.h>

#include "vaudio/provider.hpp"

namespace vaudio {
namespace {

TEST(ProviderTest, WireNamesRoundTrip) {
    EXPECT_STREQ(ToString(Provider::VbCable), "vb-cable");
    EXPECT_STREQ(ToString(Provider::BlackHole), "blackhole");
    EXPECT_EQ(ParseProvider("vb-cable"), Provider::VbCable);
    EXPECT_EQ(ParseProvider("blackhole"), Provider::BlackHole);
    EXPECT_FALSE(ParseProvider("VB-CABLE").has_value());
    EXPECT_FALSE(ParseProvider("").has_value());
}

TEST(ProviderTest, PreferredProviderPerPlatform) {
    EXPECT_EQ(GetPreferredProviderForPlatform(ParsePlatform("win32")), Provider::VbCable);
    EXPECT_EQ(GetPreferredProviderForPlatform(ParsePlatform("darwin")), Provider::BlackHole);
    EXPECT_FALSE(GetPreferredProviderForPlatform(ParsePlatform("linux")).has_value());
    EXPECT_FALSE(GetPreferredProviderForPlatform(ParsePlatform("freebsd")).has_value());
}

TEST(ProviderTest, SupportOnlyOnOwnPlatform) {
    EXPECT_TRUE(IsProviderSupported(Provider::VbCable, HostPlatform::Windows));
    EXPECT_FALSE(IsProviderSupported(Provider::VbCable, HostPlatform::MacOS));
    EXPECT_TRUE(IsProviderSupported(Provider::BlackHole, HostPlatform::MacOS));
    EXPECT_FALSE(IsProviderSupported(Provider::BlackHole, HostPlatform::Windows));
    EXPECT_FALSE(IsProviderSupported(Provider::BlackHole, HostPlatform::Linux));
    EXPECT_FALSE(IsProviderSupported(Provider::VbCable, HostPlatform::Other));
}

} // namespace
} // namespace vaudio
