#include "hsdsync/download_stats.hpp"
#include "hsdsync/progress.hpp"

#include <gtest/gtest.h>

namespace hsdsync {
namespace {

TEST(FormatSizeTest, PicksLargestUnit) {
    EXPECT_EQ(formatSize(0), "0 B");
    EXPECT_EQ(formatSize(1023), "1023 B");
    EXPECT_EQ(formatSize(1536), "1.5 KB");
    EXPECT_EQ(formatSize(5ULL * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(formatSize(3ULL * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(ProgressLineTest, ShowsPercentageWhenSizeIsKnown) {
    Progress progress;
    progress.filename = "HS_H09_20250717_0900_B03_FLDK_R05_S0110.DAT.bz2";
    progress.downloaded_bytes = 512;
    progress.total_bytes = 2048;
    progress.bytes_per_second = 100.0;

    EXPECT_EQ(formatProgressLine(progress),
              "HS_H09_20250717_0900_B03_FLDK_R05_S0110.DAT.bz2  25.0% (512 B/2.0 KB, 100 B/s)");
}

TEST(ProgressLineTest, OmitsPercentageWhenSizeIsUnknown) {
    Progress progress;
    progress.downloaded_bytes = 2048;

    EXPECT_EQ(formatProgressLine(progress), "(unnamed) 2.0 KB (0 B/s)");
}

TEST(DownloadSummaryTest, ListsEveryCounter) {
    DownloadStats stats;
    stats.total_files = 4;
    stats.downloaded_files = 2;
    stats.skipped_files = 1;
    stats.failed_files = 1;
    stats.total_bytes = 2048;

    const auto text = stats.summary();
    EXPECT_NE(text.find("Total files:      4"), std::string::npos);
    EXPECT_NE(text.find("Failed:           1"), std::string::npos);
    EXPECT_NE(text.find("Transferred:      2.0 KB"), std::string::npos);
    EXPECT_EQ(text.find("Average speed"), std::string::npos);
}

} // namespace
} // namespace hsdsync
