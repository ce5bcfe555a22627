#include <gtest/gtest.h>
#include <distclean/osarch.h>

using namespace distclean;


TEST(osarch, parse) {
    auto v = OSArch::parse("linux-amd64");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->os, "linux");
    EXPECT_EQ(v->arch, "amd64");
    EXPECT_EQ(v->str(), "linux-amd64");

    // split at the first dash only
    auto arm = OSArch::parse("linux-arm-v7");
    ASSERT_TRUE(arm.has_value());
    EXPECT_EQ(arm->os, "linux");
    EXPECT_EQ(arm->arch, "arm-v7");
}

TEST(osarch, parse_invalid) {
    for (const char *s : {"", "linux", "-amd64", "linux-"}) {
        auto v = OSArch::parse(s);
        ASSERT_FALSE(v.has_value()) << s;
        EXPECT_EQ(v.error().code(), errc::config);
    }
}

TEST(osarch, current) {
    auto v = OSArch::current();
    EXPECT_FALSE(v.os.empty());
    EXPECT_FALSE(v.arch.empty());
    EXPECT_EQ(OSArch::parse(v.str()).value(), v);
}

TEST(osarch, format) {
    EXPECT_EQ(fmt::format("{}", OSArch{.os = "darwin", .arch = "arm64"}), "darwin-arm64");
    EXPECT_EQ(fmt::format("{:>12}", OSArch{.os = "linux", .arch = "386"}), "   linux-386");
}
