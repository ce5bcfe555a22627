#include <gtest/gtest.h>
#include <distclean/dist_match.h>
#include "tempdir.h"

using namespace distclean;


TEST(dist_match, product_prefix) {
    auto p = ArtifactPattern::product_prefix("app");

    EXPECT_TRUE(p.matches("app-1.0.0.tgz"));
    EXPECT_TRUE(p.matches("app-x"));
    EXPECT_TRUE(p.matches("app-snapshot"));
    EXPECT_FALSE(p.matches("app-"));
    EXPECT_FALSE(p.matches("app"));
    EXPECT_FALSE(p.matches("libapp-1.0.0.tgz"));
    EXPECT_FALSE(p.matches("application-1.0"));
}

TEST(dist_match, exact) {
    auto p = ArtifactPattern::exact("app.tgz");

    EXPECT_TRUE(p.matches("app.tgz"));
    EXPECT_FALSE(p.matches("app.tgz.sha256"));
    EXPECT_FALSE(p.matches("xapp.tgz"));
}

TEST(dist_match, patterns_in_order) {
    auto patterns = dist_patterns("app", {"out/dist/app-1.0.tgz", "release.zip"});

    ASSERT_EQ(patterns.size(), 3u);
    EXPECT_EQ(patterns[0].kind(), ArtifactPattern::Kind::product_prefix);
    EXPECT_EQ(patterns[0].text(), "app-");
    EXPECT_EQ(patterns[1].kind(), ArtifactPattern::Kind::exact);
    EXPECT_EQ(patterns[1].text(), "app-1.0.tgz");
    EXPECT_EQ(patterns[2].text(), "release.zip");
}

TEST(dist_match, matches_entries) {
    TempDir t;
    t.touch("dist/app-1.0.0.tgz");
    t.touch("dist/app-0.9.0/bin/app");
    t.touch("dist/release.zip");
    t.touch("dist/tool-1.0.0.tgz");
    t.touch("dist/app");

    auto res = match_dist_output(t.path("dist"), "app", {"release.zip", "app-1.0.0.tgz"});

    EXPECT_EQ(res, (std::vector<DistEntry>{
                       {.path = t.str("dist/app-0.9.0"), .is_dir = true},
                       {.path = t.str("dist/app-1.0.0.tgz"), .is_dir = false},
                       {.path = t.str("dist/release.zip"), .is_dir = false},
                   }));
}

TEST(dist_match, first_match_wins) {
    TempDir t;
    t.touch("dist/app-1.0.0.tgz");

    // matched by both the prefix and the exact pattern, recorded once
    auto res = match_dist_output(t.path("dist"), "app", {"app-1.0.0.tgz"});
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].path, t.str("dist/app-1.0.0.tgz"));
}

TEST(dist_match, missing_dir_is_skipped) {
    TempDir t;
    EXPECT_TRUE(match_dist_output(t.path("dist"), "app", {"app.tgz"}).empty());
}
