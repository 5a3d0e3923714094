#include "hsdsync/worker_session.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace hsdsync {
namespace {

using testing::FakeServer;
using testing::FakeTransport;
using testing::TempDir;
using testing::makeContent;
using testing::readFile;
using testing::writeFile;

std::string remoteFor(const std::string& band, const std::string& segment) {
    return "/jma/hsd/202507/17/09/HS_H09_20250717_0900_" + band + "_FLDK_R10_" + segment + ".DAT.bz2";
}

class WorkerSessionTest : public ::testing::Test {
protected:
    WorkerSessionTest()
        : resolver_(makePolicy(dir_.path())),
          transfer_(resolver_),
          retry_(RetryOptions{3, std::chrono::milliseconds(0)}),
          transport_(server_) {
        endpoint_.host = "sftp.example.org";
        credentials_ = Credentials{"operator", "secret"};
    }

    static StoragePolicy makePolicy(const std::filesystem::path& base) {
        StoragePolicy policy;
        policy.base_path = base;
        return policy;
    }

    WorkerSession makeSession(std::vector<DownloadTask> tasks) {
        return WorkerSession(0, transport_, endpoint_, credentials_, transfer_, retry_, std::move(tasks));
    }

    TempDir dir_;
    PathResolver resolver_;
    ResumableTransfer transfer_;
    RetryPolicy retry_;
    FakeServer server_;
    FakeTransport transport_;
    ServerEndpoint endpoint_;
    Credentials credentials_;
};

TEST_F(WorkerSessionTest, ConnectionFailureFailsWholePartitionWithoutAttempts) {
    server_.fail_connect = true;
    server_.addFile(remoteFor("B01", "S0110"), "data");

    auto session = makeSession({DownloadTask{remoteFor("B01", "S0110")},
                                DownloadTask{remoteFor("B01", "S0210")},
                                DownloadTask{remoteFor("B01", "S0310")}});
    StatsAggregator aggregator;
    session.run(aggregator);

    const auto stats = aggregator.snapshot();
    EXPECT_EQ(stats.total_files, 3u);
    EXPECT_EQ(stats.failed_files, 3u);
    EXPECT_EQ(stats.downloaded_files, 0u);
    EXPECT_EQ(stats.skipped_files, 0u);
    EXPECT_EQ(server_.connections.load(), 1);
    EXPECT_EQ(server_.stat_calls.load(), 0);
    EXPECT_TRUE(server_.openCalls().empty());
}

TEST_F(WorkerSessionTest, AuthenticationFailureFailsWholePartition) {
    credentials_.password = "wrong";
    server_.addFile(remoteFor("B01", "S0110"), "data");

    auto session = makeSession({DownloadTask{remoteFor("B01", "S0110")}, DownloadTask{remoteFor("B02", "S0110")}});
    StatsAggregator aggregator;
    session.run(aggregator);

    EXPECT_EQ(aggregator.snapshot().failed_files, 2u);
    EXPECT_EQ(server_.stat_calls.load(), 0);
}

TEST_F(WorkerSessionTest, CountsEachOutcomeOnce) {
    const std::string fresh = remoteFor("B01", "S0110");
    const std::string present = remoteFor("B01", "S0210");
    const std::string missing = remoteFor("B01", "S0310");
    const std::string content = makeContent(5000);
    server_.addFile(fresh, content);
    server_.addFile(present, makeContent(10));
    writeFile(resolver_.finalPath(present), "already here");

    auto session = makeSession({DownloadTask{fresh}, DownloadTask{missing}, DownloadTask{present}});
    StatsAggregator aggregator;
    session.run(aggregator);

    const auto stats = aggregator.snapshot();
    EXPECT_EQ(stats.total_files, 3u);
    EXPECT_EQ(stats.downloaded_files, 1u);
    EXPECT_EQ(stats.skipped_files, 1u);
    EXPECT_EQ(stats.failed_files, 1u);
    EXPECT_EQ(stats.total_bytes, 5000u);
    EXPECT_EQ(readFile(resolver_.finalPath(fresh)), content);
    EXPECT_EQ(session.stats().failed_files, 1u);
}

TEST_F(WorkerSessionTest, PersistentFailureDoesNotAffectSiblings) {
    const std::string first = remoteFor("B01", "S0110");
    const std::string broken = remoteFor("B01", "S0210");
    const std::string last = remoteFor("B01", "S0310");
    server_.addFile(first, makeContent(300));
    server_.addFile(broken, makeContent(300));
    server_.addFile(last, makeContent(300));
    server_.read_failures[broken] = -1;
    server_.fail_after_bytes = 50;

    auto session = makeSession({DownloadTask{first}, DownloadTask{broken}, DownloadTask{last}});
    StatsAggregator aggregator;
    session.run(aggregator);

    const auto stats = aggregator.snapshot();
    EXPECT_EQ(stats.downloaded_files, 2u);
    EXPECT_EQ(stats.failed_files, 1u);
    EXPECT_EQ(stats.total_bytes, 600u);
    EXPECT_EQ(server_.openCount(first), 1);
    EXPECT_EQ(server_.openCount(broken), 3);
    EXPECT_EQ(server_.openCount(last), 1);

    const auto opens = server_.openCalls();
    EXPECT_EQ(opens.front().path, first);
    EXPECT_EQ(opens.back().path, last);
}

} // namespace
} // namespace hsdsync
