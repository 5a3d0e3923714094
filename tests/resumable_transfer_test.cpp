#include "hsdsync/resumable_transfer.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace hsdsync {
namespace {

using testing::FakeFilesystem;
using testing::FakeServer;
using testing::TempDir;
using testing::makeContent;
using testing::readFile;
using testing::writeFile;

const std::string kRemote = "/jma/hsd/202507/17/09/HS_H09_20250717_0900_B03_FLDK_R05_S0110.DAT.bz2";

class ResumableTransferTest : public ::testing::Test {
protected:
    ResumableTransferTest()
        : resolver_(makePolicy(dir_.path())),
          transfer_(resolver_, TransferOptions{128, 256, std::chrono::seconds(5)}),
          filesystem_(server_) {}

    static StoragePolicy makePolicy(const std::filesystem::path& base) {
        StoragePolicy policy;
        policy.base_path = base;
        return policy;
    }

    TempDir dir_;
    PathResolver resolver_;
    ResumableTransfer transfer_;
    FakeServer server_;
    FakeFilesystem filesystem_;
};

TEST_F(ResumableTransferTest, DownloadsIntoDatedDirectoryAndRemovesTemp) {
    const std::string content = makeContent(1000);
    server_.addFile(kRemote, content);

    auto record = transfer_.prepare(DownloadTask{kRemote});
    const auto result = transfer_.transfer(filesystem_, record);

    EXPECT_FALSE(result.already_complete);
    EXPECT_EQ(result.bytes, 1000u);
    EXPECT_EQ(record.status, TransferStatus::Completed);
    EXPECT_EQ(record.final_path, dir_.path() / "2025" / "07" / "17" / "09" /
                                     "HS_H09_20250717_0900_B03_FLDK_R05_S0110.DAT.bz2");
    EXPECT_EQ(readFile(record.final_path), content);
    EXPECT_FALSE(std::filesystem::exists(record.temp_path));
}

TEST_F(ResumableTransferTest, ExistingFinalFileIsAlreadyComplete) {
    server_.addFile(kRemote, makeContent(1000));
    auto record = transfer_.prepare(DownloadTask{kRemote});
    writeFile(record.final_path, "previous run");

    const auto result = transfer_.transfer(filesystem_, record);

    EXPECT_TRUE(result.already_complete);
    EXPECT_EQ(result.bytes, 0u);
    EXPECT_EQ(server_.stat_calls.load(), 0);
    EXPECT_TRUE(server_.openCalls().empty());
    EXPECT_EQ(readFile(record.final_path), "previous run");
}

TEST_F(ResumableTransferTest, EmptyFinalFileIsDownloadedAgain) {
    const std::string content = makeContent(300);
    server_.addFile(kRemote, content);
    auto record = transfer_.prepare(DownloadTask{kRemote});
    writeFile(record.final_path, "");

    const auto result = transfer_.transfer(filesystem_, record);

    EXPECT_FALSE(result.already_complete);
    EXPECT_EQ(readFile(record.final_path), content);
}

TEST_F(ResumableTransferTest, ResumesFromTempFileSize) {
    const std::string content = makeContent(1000);
    server_.addFile(kRemote, content);
    auto record = transfer_.prepare(DownloadTask{kRemote});
    writeFile(record.temp_path, content.substr(0, 400));

    const auto result = transfer_.transfer(filesystem_, record);

    const auto opens = server_.openCalls();
    ASSERT_EQ(opens.size(), 1u);
    EXPECT_EQ(opens[0].offset, 400u);
    EXPECT_EQ(result.bytes, 1000u);
    EXPECT_EQ(std::filesystem::file_size(record.final_path), 1000u);
    EXPECT_EQ(readFile(record.final_path), content);
    EXPECT_FALSE(std::filesystem::exists(record.temp_path));
}

TEST_F(ResumableTransferTest, DiscardsTempFileLargerThanRemote) {
    const std::string content = makeContent(1000);
    server_.addFile(kRemote, content);
    auto record = transfer_.prepare(DownloadTask{kRemote});
    writeFile(record.temp_path, makeContent(1200, 'K'));

    transfer_.transfer(filesystem_, record);

    const auto opens = server_.openCalls();
    ASSERT_EQ(opens.size(), 1u);
    EXPECT_EQ(opens[0].offset, 0u);
    EXPECT_EQ(readFile(record.final_path), content);
}

TEST_F(ResumableTransferTest, DiscardsTempFileEqualToRemote) {
    const std::string content = makeContent(1000);
    server_.addFile(kRemote, content);
    auto record = transfer_.prepare(DownloadTask{kRemote});
    writeFile(record.temp_path, makeContent(1000, 'K'));

    transfer_.transfer(filesystem_, record);

    ASSERT_EQ(server_.openCalls().size(), 1u);
    EXPECT_EQ(server_.openCalls()[0].offset, 0u);
    EXPECT_EQ(readFile(record.final_path), content);
}

TEST_F(ResumableTransferTest, ReadErrorKeepsTempFileForNextAttempt) {
    const std::string content = makeContent(1000);
    server_.addFile(kRemote, content);
    server_.read_failures[kRemote] = 1;
    server_.fail_after_bytes = 300;

    auto record = transfer_.prepare(DownloadTask{kRemote});
    try {
        transfer_.transfer(filesystem_, record);
        FAIL() << "expected a read error";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::Read);
    }
    EXPECT_FALSE(std::filesystem::exists(record.final_path));
    ASSERT_TRUE(std::filesystem::exists(record.temp_path));
    EXPECT_EQ(std::filesystem::file_size(record.temp_path), 300u);

    const auto result = transfer_.transfer(filesystem_, record);

    const auto opens = server_.openCalls();
    ASSERT_EQ(opens.size(), 2u);
    EXPECT_EQ(opens[1].offset, 300u);
    EXPECT_EQ(result.bytes, 1000u);
    EXPECT_EQ(readFile(record.final_path), content);
}

TEST_F(ResumableTransferTest, ShortStreamIsSizeMismatchAndNotPromoted) {
    server_.addFile(kRemote, makeContent(1000));
    server_.reported_sizes[kRemote] = 2000;

    auto record = transfer_.prepare(DownloadTask{kRemote});
    try {
        transfer_.transfer(filesystem_, record);
        FAIL() << "expected a size mismatch";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::SizeMismatch);
    }
    EXPECT_FALSE(std::filesystem::exists(record.final_path));
    ASSERT_TRUE(std::filesystem::exists(record.temp_path));
    EXPECT_EQ(std::filesystem::file_size(record.temp_path), 1000u);
    EXPECT_EQ(record.expected_size, std::optional<std::uint64_t>(2000));
}

TEST_F(ResumableTransferTest, OverlongStreamIsSizeMismatch) {
    server_.addFile(kRemote, makeContent(1000));
    server_.reported_sizes[kRemote] = 500;

    auto record = transfer_.prepare(DownloadTask{kRemote});
    try {
        transfer_.transfer(filesystem_, record);
        FAIL() << "expected a size mismatch";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::SizeMismatch);
    }
    EXPECT_FALSE(std::filesystem::exists(record.final_path));
}

TEST_F(ResumableTransferTest, UnknownRemoteSizeDownloadsFromStart) {
    const std::string content = makeContent(700);
    server_.addFile(kRemote, content);
    server_.unknown_size.insert(kRemote);
    auto record = transfer_.prepare(DownloadTask{kRemote});
    writeFile(record.temp_path, content.substr(0, 100));

    const auto result = transfer_.transfer(filesystem_, record);

    EXPECT_EQ(server_.openCalls()[0].offset, 0u);
    EXPECT_EQ(result.bytes, 700u);
    EXPECT_FALSE(record.expected_size.has_value());
    EXPECT_EQ(readFile(record.final_path), content);
}

TEST_F(ResumableTransferTest, StatFailurePropagates) {
    auto record = transfer_.prepare(DownloadTask{kRemote});
    try {
        transfer_.transfer(filesystem_, record);
        FAIL() << "expected a stat error";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::Stat);
    }
    EXPECT_TRUE(server_.openCalls().empty());
}

TEST(ResumableTransferLocalIOTest, UncreatableDirectoryIsLocalIOError) {
    TempDir dir;
    writeFile(dir.path() / "blocker", "not a directory");

    StoragePolicy policy;
    policy.base_path = dir.path() / "blocker";
    const PathResolver resolver(policy);
    const ResumableTransfer transfer(resolver);

    FakeServer server;
    server.addFile(kRemote, makeContent(10));
    FakeFilesystem filesystem(server);

    auto record = transfer.prepare(DownloadTask{kRemote});
    try {
        transfer.transfer(filesystem, record);
        FAIL() << "expected a local I/O error";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::LocalIO);
    }
}

} // namespace
} // namespace hsdsync
