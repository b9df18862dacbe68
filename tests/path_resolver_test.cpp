#include "rtufetch/path_resolver.hpp"

#include <gtest/gtest.h>

using namespace rtufetch;

TEST(PathResolverTest, ProducesBothLayoutsInOrder) {
    const auto candidates = candidatePaths("/data", Date{2024, 12, 15});
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], "/data/2024/12/15/");
    EXPECT_EQ(candidates[1], "/data/2024/12/15122024/");
}

TEST(PathResolverTest, TrailingSlashOnBaseIsIgnored) {
    EXPECT_EQ(candidatePaths("/data/", Date{2024, 1, 5}),
              candidatePaths("/data", Date{2024, 1, 5}));
    EXPECT_EQ(candidatePaths("/data///", Date{2024, 1, 5})[0], "/data/2024/01/05/");
}

TEST(PathResolverTest, RootBase) {
    const auto candidates = candidatePaths("/", Date{2023, 3, 9});
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], "/2023/03/09/");
    EXPECT_EQ(candidates[1], "/2023/03/09032023/");
}

TEST(PathResolverTest, BareFormsAppendedAfterSlashForms) {
    const auto candidates = candidatePaths("/data", Date{2024, 12, 15}, true);
    ASSERT_EQ(candidates.size(), 4u);
    EXPECT_EQ(candidates[2], "/data/2024/12/15");
    EXPECT_EQ(candidates[3], "/data/2024/12/15122024");
}

TEST(PathResolverTest, Deterministic) {
    EXPECT_EQ(candidatePaths("/x", Date{2020, 2, 29}), candidatePaths("/x", Date{2020, 2, 29}));
}

TEST(PathResolverTest, LocalLayout) {
    const auto path = localFilePath("downloads", " Kerala ", "STAT01", Date{2024, 12, 5}, "STAT01_1.txt");
    EXPECT_EQ(path, std::filesystem::path("downloads/Kerala/STAT01/2024/12/05/STAT01_1.txt"));
}

TEST(PathResolverTest, EmptyStateLabelIsSkipped) {
    const auto path = localFilePath("out", "  ", "A1", Date{2024, 1, 2}, "A1.txt");
    EXPECT_EQ(path, std::filesystem::path("out/A1/2024/01/02/A1.txt"));
}

TEST(PathResolverTest, JoinRemotePath) {
    EXPECT_EQ(joinRemotePath("/data/2024/12/15/", "a.txt"), "/data/2024/12/15/a.txt");
    EXPECT_EQ(joinRemotePath("/data/2024/12/15", "a.txt"), "/data/2024/12/15/a.txt");
    EXPECT_EQ(joinRemotePath("", "a.txt"), "a.txt");
}
