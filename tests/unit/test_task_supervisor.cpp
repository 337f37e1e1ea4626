#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>

#include "core/TaskSupervisor.hpp"
#include "util/LocalHttpServer.hpp"
#include "util/TempDir.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
    TransferSettings testSettings()
    {
        TransferSettings settings;
        settings.connectTimeoutSec = 5;
        settings.readTimeoutSec = 10;
        settings.progressInterval = 50ms;
        return settings;
    }

    LocalHttpServer::Route stalledRoute(size_t size, size_t stallAfter)
    {
        LocalHttpServer::Route route;
        route.body = std::string(size, 'x');
        route.stallAfter = stallAfter;
        return route;
    }

    // Waits until the transfer has received its response headers
    bool waitForDownloading(TransferHandle &handle)
    {
        ProgressSnapshot snapshot;
        while (handle.next(snapshot, 5s))
        {
            if (snapshot.status == TransferStatus::DOWNLOADING)
                return true;
        }
        return false;
    }
}

class TaskSupervisorTest : public ::testing::Test
{
protected:
    TempDir tmp;
    LocalHttpServer server;

    TransferOptions optionsFor(const std::string &file)
    {
        TransferOptions options;
        options.destinationPath = tmp / file;
        return options;
    }
};

TEST_F(TaskSupervisorTest, CompletesAndReleasesSlot)
{
    LocalHttpServer::Route route;
    route.body = std::string(4096, 'a');
    server.setRoute("/a.zip", route);

    TaskSupervisor supervisor(2, testSettings());
    auto handle = supervisor.start(server.url("/a.zip"), optionsFor("a.zip"));
    ASSERT_TRUE(handle.ok()) << handle.error().message;
    EXPECT_FALSE(handle->isJoinedExisting());

    ProgressSnapshot last = handle->waitForCompletion();
    EXPECT_EQ(last.status, TransferStatus::COMPLETED);
    EXPECT_EQ(last.bytesReceived, 4096u);

    EXPECT_FALSE(supervisor.isActive(server.url("/a.zip")));
    EXPECT_EQ(supervisor.activeCount(), 0u);
    EXPECT_FALSE(supervisor.latestSnapshot(server.url("/a.zip")).has_value());
    EXPECT_EQ(fs::file_size(tmp / "a.zip"), 4096u);
}

TEST_F(TaskSupervisorTest, SameUrlJoinsRunningTransfer)
{
    server.setRoute("/shared.zip", stalledRoute(2048, 1024));

    TaskSupervisor supervisor(3, testSettings());
    std::string url = server.url("/shared.zip");

    auto first = supervisor.start(url, optionsFor("shared.zip"));
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(waitForDownloading(first.value()));

    auto second = supervisor.start(url, optionsFor("elsewhere.zip"));
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second->isJoinedExisting());
    EXPECT_EQ(second->getTaskId(), first->getTaskId());
    EXPECT_EQ(second->getDestination(), tmp / "shared.zip");
    EXPECT_EQ(supervisor.activeCount(), 1u);

    auto snapshot = supervisor.latestSnapshot(url);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->status, TransferStatus::DOWNLOADING);

    server.releaseStalls();

    EXPECT_EQ(first->waitForCompletion().status, TransferStatus::COMPLETED);
    EXPECT_EQ(second->waitForCompletion().status, TransferStatus::COMPLETED);
    EXPECT_EQ(server.requestCount("/shared.zip"), 1u);
}

TEST_F(TaskSupervisorTest, SimultaneousStartsShareOneTransfer)
{
    server.setRoute("/race.zip", stalledRoute(2048, 512));

    TaskSupervisor supervisor(3, testSettings());
    std::string url = server.url("/race.zip");

    std::atomic<bool> go{false};
    std::optional<Result<TransferHandle>> results[2];
    auto starter = [&](int index, const std::string &file)
    {
        while (!go.load())
            std::this_thread::yield();
        results[index].emplace(supervisor.start(url, optionsFor(file)));
    };
    std::thread left(starter, 0, "left.zip");
    std::thread right(starter, 1, "right.zip");
    go.store(true);
    left.join();
    right.join();

    ASSERT_TRUE(results[0].has_value() && results[0]->ok());
    ASSERT_TRUE(results[1].has_value() && results[1]->ok());
    TransferHandle &a = results[0]->value();
    TransferHandle &b = results[1]->value();

    EXPECT_EQ(supervisor.activeCount(), 1u);
    EXPECT_EQ(a.getTaskId(), b.getTaskId());
    EXPECT_NE(a.isJoinedExisting(), b.isJoinedExisting());
    EXPECT_EQ(a.getDestination(), b.getDestination());

    server.releaseStalls();
    ProgressSnapshot lastA = a.waitForCompletion();
    ProgressSnapshot lastB = b.waitForCompletion();
    EXPECT_EQ(lastA.status, TransferStatus::COMPLETED);
    EXPECT_EQ(lastB.status, TransferStatus::COMPLETED);
    EXPECT_EQ(lastA.bytesReceived, 2048u);
    EXPECT_EQ(lastB.bytesReceived, lastA.bytesReceived);
    EXPECT_EQ(server.requestCount("/race.zip"), 1u);
}

TEST_F(TaskSupervisorTest, FourthDistinctUrlHitsDefaultCeiling)
{
    for (const char *path : {"/c1.zip", "/c2.zip", "/c3.zip", "/c4.zip"})
        server.setRoute(path, stalledRoute(2048, 100));

    TaskSupervisor supervisor(3, testSettings());
    auto c1 = supervisor.start(server.url("/c1.zip"), optionsFor("c1.zip"));
    auto c2 = supervisor.start(server.url("/c2.zip"), optionsFor("c2.zip"));
    auto c3 = supervisor.start(server.url("/c3.zip"), optionsFor("c3.zip"));
    ASSERT_TRUE(c1.ok());
    ASSERT_TRUE(c2.ok());
    ASSERT_TRUE(c3.ok());
    EXPECT_EQ(supervisor.activeCount(), 3u);

    auto c4 = supervisor.start(server.url("/c4.zip"), optionsFor("c4.zip"));
    ASSERT_FALSE(c4.ok());
    EXPECT_EQ(c4.error().kind, ErrorKind::CONCURRENCY_LIMIT);
    EXPECT_EQ(c4.error().message, "Maximum concurrent downloads (3) reached");
    EXPECT_EQ(server.requestCount("/c4.zip"), 0u);

    supervisor.cancelAll();
    EXPECT_EQ(c1->waitForCompletion().status, TransferStatus::CANCELLED);
    EXPECT_EQ(c2->waitForCompletion().status, TransferStatus::CANCELLED);
    EXPECT_EQ(c3->waitForCompletion().status, TransferStatus::CANCELLED);
}

TEST_F(TaskSupervisorTest, RejectsBeyondCeilingAndReadmitsAfterCancel)
{
    server.setRoute("/one.zip", stalledRoute(2048, 100));
    server.setRoute("/two.zip", stalledRoute(2048, 100));
    LocalHttpServer::Route quick;
    quick.body = "done";
    server.setRoute("/three.zip", quick);

    TaskSupervisor supervisor(2, testSettings());
    auto one = supervisor.start(server.url("/one.zip"), optionsFor("one.zip"));
    auto two = supervisor.start(server.url("/two.zip"), optionsFor("two.zip"));
    ASSERT_TRUE(one.ok());
    ASSERT_TRUE(two.ok());

    auto rejected = supervisor.start(server.url("/three.zip"), optionsFor("three.zip"));
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.error().kind, ErrorKind::CONCURRENCY_LIMIT);
    EXPECT_EQ(rejected.error().message, "Maximum concurrent downloads (2) reached");
    EXPECT_EQ(server.requestCount("/three.zip"), 0u);

    EXPECT_TRUE(supervisor.cancel(server.url("/one.zip")));
    EXPECT_EQ(one->waitForCompletion().status, TransferStatus::CANCELLED);

    auto admitted = supervisor.start(server.url("/three.zip"), optionsFor("three.zip"));
    ASSERT_TRUE(admitted.ok()) << admitted.error().message;
    EXPECT_EQ(admitted->waitForCompletion().status, TransferStatus::COMPLETED);

    server.releaseStalls();
    EXPECT_EQ(two->waitForCompletion().status, TransferStatus::COMPLETED);
}

TEST_F(TaskSupervisorTest, CancelOfUnknownUrlIsFalse)
{
    TaskSupervisor supervisor(2, testSettings());
    EXPECT_FALSE(supervisor.cancel("http://127.0.0.1:1/nothing.zip"));
    EXPECT_FALSE(supervisor.isActive("http://127.0.0.1:1/nothing.zip"));
    EXPECT_TRUE(supervisor.activeUrls().empty());
}

TEST_F(TaskSupervisorTest, DestinationInUseIsRejected)
{
    server.setRoute("/first.zip", stalledRoute(2048, 100));
    server.setRoute("/second.zip", stalledRoute(2048, 100));

    TaskSupervisor supervisor(3, testSettings());
    auto first = supervisor.start(server.url("/first.zip"), optionsFor("same.zip"));
    ASSERT_TRUE(first.ok());

    auto second = supervisor.start(server.url("/second.zip"), optionsFor("same.zip"));
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error().kind, ErrorKind::IO);

    auto urls = supervisor.activeUrls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls[0], server.url("/first.zip"));

    first->cancel();
    EXPECT_EQ(first->waitForCompletion().status, TransferStatus::CANCELLED);
}

TEST_F(TaskSupervisorTest, InvalidRequestsAreRejected)
{
    TaskSupervisor supervisor(2, testSettings());

    auto emptyUrl = supervisor.start("", optionsFor("x.zip"));
    ASSERT_FALSE(emptyUrl.ok());
    EXPECT_EQ(emptyUrl.error().kind, ErrorKind::PROTOCOL);

    auto noDestination = supervisor.start(server.url("/x.zip"), TransferOptions());
    ASSERT_FALSE(noDestination.ok());
    EXPECT_EQ(noDestination.error().kind, ErrorKind::IO);
}

TEST_F(TaskSupervisorTest, FailedTransferFreesSlot)
{
    TaskSupervisor supervisor(1, testSettings());
    auto missing = supervisor.start(server.url("/missing.zip"), optionsFor("missing.zip"));
    ASSERT_TRUE(missing.ok());

    ProgressSnapshot last = missing->waitForCompletion();
    EXPECT_EQ(last.status, TransferStatus::FAILED);
    EXPECT_EQ(last.errorKind, ErrorKind::PROTOCOL);
    EXPECT_EQ(supervisor.activeCount(), 0u);
}

TEST_F(TaskSupervisorTest, ResumesExistingPartialFile)
{
    std::string body(1000, 'r');
    LocalHttpServer::Route route;
    route.body = body;
    server.setRoute("/partial.zip", route);
    writeTextFile(tmp / "partial.zip", body.substr(0, 400));

    TaskSupervisor supervisor(2, testSettings());
    auto handle = supervisor.start(server.url("/partial.zip"), optionsFor("partial.zip"));
    ASSERT_TRUE(handle.ok());
    EXPECT_EQ(handle->waitForCompletion().status, TransferStatus::COMPLETED);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].headers["range"], "bytes=400-");
    EXPECT_EQ(readTextFile(tmp / "partial.zip"), body);
}

TEST_F(TaskSupervisorTest, ShutdownCancelsAndStopsAdmission)
{
    server.setRoute("/long.zip", stalledRoute(4096, 100));

    TaskSupervisor supervisor(2, testSettings());
    auto handle = supervisor.start(server.url("/long.zip"), optionsFor("long.zip"));
    ASSERT_TRUE(handle.ok());

    supervisor.shutdown();
    EXPECT_EQ(handle->waitForCompletion().status, TransferStatus::CANCELLED);

    auto late = supervisor.start(server.url("/long.zip"), optionsFor("long.zip"));
    ASSERT_FALSE(late.ok());
    EXPECT_EQ(late.error().kind, ErrorKind::CONCURRENCY_LIMIT);
}

TEST_F(TaskSupervisorTest, ZeroCeilingFallsBackToDefault)
{
    TaskSupervisor supervisor(0, testSettings());
    EXPECT_EQ(supervisor.getMaxConcurrent(), SSM_DEFAULT_MAX_CONCURRENT);
}
