#include "hsdsync/path_resolver.hpp"

#include <gtest/gtest.h>

namespace hsdsync {
namespace {

const std::string kRemote = "/jma/hsd/202507/17/09/HS_H09_20250717_0920_B03_FLDK_R05_S0110.DAT.bz2";
const std::string kFile = "HS_H09_20250717_0920_B03_FLDK_R05_S0110.DAT.bz2";

StoragePolicy basePolicy() {
    StoragePolicy policy;
    policy.base_path = "/data/himawari";
    return policy;
}

TEST(PathResolverTest, OrganizesByTime) {
    const PathResolver resolver(basePolicy());
    EXPECT_EQ(resolver.finalPath(kRemote),
              std::filesystem::path("/data/himawari/2025/07/17/09") / kFile);
}

TEST(PathResolverTest, BandIsOuterSegmentWhenOrganizingByBand) {
    auto policy = basePolicy();
    policy.organize_by_band = true;
    const PathResolver resolver(policy);
    EXPECT_EQ(resolver.finalPath(kRemote),
              std::filesystem::path("/data/himawari/B03/2025/07/17/09") / kFile);
}

TEST(PathResolverTest, BandOnlyWithoutTimeOrganization) {
    auto policy = basePolicy();
    policy.organize_by_time = false;
    policy.organize_by_band = true;
    const PathResolver resolver(policy);
    EXPECT_EQ(resolver.finalPath(kRemote), std::filesystem::path("/data/himawari/B03") / kFile);
}

TEST(PathResolverTest, FlatWithoutOrganization) {
    auto policy = basePolicy();
    policy.organize_by_time = false;
    const PathResolver resolver(policy);
    EXPECT_EQ(resolver.finalPath(kRemote), std::filesystem::path("/data/himawari") / kFile);
}

TEST(PathResolverTest, KeepsOriginalStructure) {
    auto policy = basePolicy();
    policy.keep_original_structure = true;
    const PathResolver resolver(policy);
    EXPECT_EQ(resolver.finalPath(kRemote),
              std::filesystem::path("/data/himawari/jma/hsd/202507/17/09") / kFile);
}

TEST(PathResolverTest, UnparsableNamesFallBackToBaseDirectory) {
    const PathResolver resolver(basePolicy());
    EXPECT_EQ(resolver.finalPath("/remote/readme.txt"), std::filesystem::path("/data/himawari/readme.txt"));
    EXPECT_EQ(resolver.finalPath("/remote/HS_H09_2025071_0920_B03.DAT.bz2"),
              std::filesystem::path("/data/himawari/HS_H09_2025071_0920_B03.DAT.bz2"));
    EXPECT_EQ(resolver.finalPath("/remote/HS_H09_20250717_09x0_B03.DAT.bz2"),
              std::filesystem::path("/data/himawari/HS_H09_20250717_09x0_B03.DAT.bz2"));
}

TEST(PathResolverTest, PartialGrammarStillGetsDatedDirectory) {
    const PathResolver resolver(basePolicy());
    EXPECT_EQ(resolver.finalPath("HS_H09_20250717_0920"),
              std::filesystem::path("/data/himawari/2025/07/17/09/HS_H09_20250717_0920"));
}

TEST(PathResolverTest, TempPathAppendsSuffix) {
    auto policy = basePolicy();
    policy.temp_suffix = ".part";
    const PathResolver resolver(policy);

    const auto paths = resolver.resolve(kRemote);
    EXPECT_EQ(paths.temp_path.parent_path(), paths.final_path.parent_path());
    EXPECT_EQ(paths.temp_path.filename().string(), kFile + ".part");
    EXPECT_TRUE(resolver.isTempFile(paths.temp_path));
    EXPECT_FALSE(resolver.isTempFile(paths.final_path));
}

TEST(PathResolverTest, IsDeterministic) {
    const PathResolver first(basePolicy());
    const PathResolver second(basePolicy());
    EXPECT_EQ(first.resolve(kRemote).final_path, second.resolve(kRemote).final_path);
    EXPECT_EQ(first.resolve(kRemote).temp_path, first.resolve(kRemote).temp_path);
}

} // namespace
} // namespace hsdsync
