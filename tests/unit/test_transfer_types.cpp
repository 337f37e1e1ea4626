#include <gtest/gtest.h>
#include <vector>

#include "core/TransferTypes.hpp"
#include "core/TransferTask.hpp"

TEST(TransferStatusTest, TerminalStates)
{
    EXPECT_FALSE(isTerminalStatus(TransferStatus::PENDING));
    EXPECT_FALSE(isTerminalStatus(TransferStatus::DOWNLOADING));
    EXPECT_FALSE(isTerminalStatus(TransferStatus::EXTRACTING));
    EXPECT_TRUE(isTerminalStatus(TransferStatus::COMPLETED));
    EXPECT_TRUE(isTerminalStatus(TransferStatus::FAILED));
    EXPECT_TRUE(isTerminalStatus(TransferStatus::CANCELLED));
}

TEST(TransferStatusTest, ForwardTransitionsOnly)
{
    EXPECT_TRUE(isLegalTransition(TransferStatus::PENDING, TransferStatus::DOWNLOADING));
    EXPECT_TRUE(isLegalTransition(TransferStatus::DOWNLOADING, TransferStatus::DOWNLOADING));
    EXPECT_TRUE(isLegalTransition(TransferStatus::DOWNLOADING, TransferStatus::EXTRACTING));
    EXPECT_TRUE(isLegalTransition(TransferStatus::EXTRACTING, TransferStatus::COMPLETED));
    EXPECT_TRUE(isLegalTransition(TransferStatus::DOWNLOADING, TransferStatus::COMPLETED));
    EXPECT_TRUE(isLegalTransition(TransferStatus::PENDING, TransferStatus::CANCELLED));
    EXPECT_TRUE(isLegalTransition(TransferStatus::EXTRACTING, TransferStatus::FAILED));

    EXPECT_FALSE(isLegalTransition(TransferStatus::DOWNLOADING, TransferStatus::PENDING));
    EXPECT_FALSE(isLegalTransition(TransferStatus::EXTRACTING, TransferStatus::DOWNLOADING));
    EXPECT_FALSE(isLegalTransition(TransferStatus::EXTRACTING, TransferStatus::CANCELLED));
    EXPECT_FALSE(isLegalTransition(TransferStatus::PENDING, TransferStatus::EXTRACTING));
    EXPECT_FALSE(isLegalTransition(TransferStatus::COMPLETED, TransferStatus::FAILED));
    EXPECT_FALSE(isLegalTransition(TransferStatus::CANCELLED, TransferStatus::DOWNLOADING));
}

TEST(ProgressSnapshotTest, FractionFromKnownTotal)
{
    ProgressSnapshot snapshot = makeSnapshot(TransferStatus::DOWNLOADING, 250, 1000);
    EXPECT_DOUBLE_EQ(snapshot.fractionComplete, 0.25);
    EXPECT_FALSE(snapshot.estimatedSecondsRemaining.has_value());
    EXPECT_FALSE(snapshot.errorMessage.has_value());
}

TEST(ProgressSnapshotTest, UnknownTotalGivesZeroFraction)
{
    ProgressSnapshot snapshot = makeSnapshot(TransferStatus::DOWNLOADING, 4096, 0);
    EXPECT_DOUBLE_EQ(snapshot.fractionComplete, 0.0);
}

TEST(ProgressSnapshotTest, FractionIsClamped)
{
    ProgressSnapshot snapshot = makeSnapshot(TransferStatus::DOWNLOADING, 1200, 1000);
    EXPECT_DOUBLE_EQ(snapshot.fractionComplete, 1.0);
}

TEST(ProgressSnapshotTest, FailedSnapshotCarriesError)
{
    ProgressSnapshot snapshot = makeFailedSnapshot(Error{ErrorKind::PROTOCOL, "HTTP 404 Not Found"}, 10, 20);
    EXPECT_EQ(snapshot.status, TransferStatus::FAILED);
    EXPECT_EQ(snapshot.errorKind, ErrorKind::PROTOCOL);
    ASSERT_TRUE(snapshot.errorMessage.has_value());
    EXPECT_EQ(*snapshot.errorMessage, "HTTP 404 Not Found");
    EXPECT_EQ(snapshot.bytesReceived, 10u);
}

TEST(TransferTaskTest, IdIsDeterministicPerUrl)
{
    EXPECT_EQ(makeTaskId("http://example.com/a.zip"), makeTaskId("http://example.com/a.zip"));
    EXPECT_NE(makeTaskId("http://example.com/a.zip"), makeTaskId("http://example.com/b.zip"));
    EXPECT_EQ(makeTaskId("x").size(), 16u);

    TransferTask task("http://example.com/a.zip", "/tmp/a.zip");
    EXPECT_EQ(task.getId(), makeTaskId("http://example.com/a.zip"));
}

TEST(TransferTaskTest, DropsBackwardTransitions)
{
    TransferTask task("http://example.com/a.zip", "/tmp/a.zip");
    EXPECT_TRUE(task.publish(makeSnapshot(TransferStatus::PENDING, 0, 0)));
    EXPECT_TRUE(task.publish(makeSnapshot(TransferStatus::DOWNLOADING, 10, 100)));
    EXPECT_FALSE(task.publish(makeSnapshot(TransferStatus::PENDING, 0, 0)));
    EXPECT_EQ(task.getLatestSnapshot().status, TransferStatus::DOWNLOADING);

    EXPECT_TRUE(task.publish(makeSnapshot(TransferStatus::CANCELLED, 10, 100)));
    EXPECT_TRUE(task.isFinished());
    EXPECT_FALSE(task.publish(makeSnapshot(TransferStatus::COMPLETED, 100, 100)));
    EXPECT_EQ(task.getLatestSnapshot().status, TransferStatus::CANCELLED);
}

TEST(TransferTaskTest, TerminalCallbackRunsOnceBeforeDelivery)
{
    TransferTask task("http://example.com/a.zip", "/tmp/a.zip");
    ProgressStream stream = task.subscribe();

    int calls = 0;
    bool terminalSeenByCallback = true;
    task.setTerminalCallback([&](const TransferTask &)
                             {
                                 calls++;
                                 // The consumer must not have the terminal snapshot yet
                                 ProgressSnapshot s;
                                 std::vector<TransferStatus> seen;
                                 while (stream.next(s, std::chrono::milliseconds(0)))
                                     seen.push_back(s.status);
                                 terminalSeenByCallback = !seen.empty() && isTerminalStatus(seen.back()); });

    task.publish(makeSnapshot(TransferStatus::PENDING, 0, 0));
    task.publish(makeFailedSnapshot(Error{ErrorKind::NETWORK, "refused"}));
    task.publish(makeFailedSnapshot(Error{ErrorKind::NETWORK, "again"}));

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(terminalSeenByCallback);

    ProgressSnapshot last;
    ASSERT_TRUE(stream.next(last));
    EXPECT_EQ(last.status, TransferStatus::FAILED);
    EXPECT_FALSE(stream.next(last));
}
