#include <gtest/gtest.h>
#include <QQueue>
#include "transferpoller.h"
#include "sessionstate.h"
#include "backends/simulatedbackend.h"
#include "testutil.h"

namespace {

// Answers listing requests from a queue, inline.
class ScriptedBackend : public TransferBackend {
public:
    QString name() const override { return "scripted"; }
    bool isSimulated() const override { return true; }

    void startDownload(const QString&, const QString&, Callback) override {}
    void transferAction(TransferAction, const QString&, Callback) override {}
    void listTransfers(int limit, int pathDisplaySize, Callback done) override {
        lastLimit = limit;
        lastPathDisplaySize = pathDisplaySize;
        ++requests;
        if (!pending.isEmpty()) done(pending.dequeue());
    }

    void queueListing(const QString& out) {
        CommandResult result;
        result.started = true;
        result.exitCode = 0;
        result.stdOut = out;
        pending.enqueue(result);
    }

    void queueFailure(const QString& error) {
        CommandResult result;
        result.errorString = error;
        pending.enqueue(result);
    }

    QQueue<CommandResult> pending;
    int requests = 0;
    int lastLimit = 0;
    int lastPathDisplaySize = 0;
};

// Holds the callback until the test releases it.
class DeferredBackend : public ScriptedBackend {
public:
    void listTransfers(int, int, Callback done) override {
        ++requests;
        held = done;
    }
    Callback held;
};

int countOf(const QStringList& messages, const QString& line) {
    return static_cast<int>(messages.count(line));
}

const char *RetryingListing = "⇓ 3456 /Downloads/large_archive.zip 12.8% of 8.91 GB RETRYING\n";
const char *ActiveListing = "⇓ 3456 /Downloads/large_archive.zip 20.0% of 8.91 GB ACTIVE\n";

} // namespace

TEST(TransferPoller, RetryingHintShownOnce) {
    ScriptedBackend backend;
    SessionState state;
    TransferPoller poller(&backend, &state);

    backend.queueListing(QString::fromUtf8(RetryingListing));
    backend.queueListing(QString::fromUtf8(RetryingListing));
    backend.queueListing(QString::fromUtf8(ActiveListing));
    backend.queueListing(QString::fromUtf8(RetryingListing));
    for (int i = 0; i < 4; ++i) poller.pollOnce();

    EXPECT_EQ(poller.pollCount(), 4);
    EXPECT_TRUE(poller.retryingHintShown());
    EXPECT_EQ(countOf(state.messages(), TransferPoller::retryingHint()), 1);
    EXPECT_EQ(state.transfers().size(), 1);
}

TEST(TransferPoller, NoHintWithoutRetrying) {
    ScriptedBackend backend;
    SessionState state;
    TransferPoller poller(&backend, &state);

    backend.queueListing(QString::fromUtf8(ActiveListing));
    poller.pollOnce();

    EXPECT_FALSE(poller.retryingHintShown());
    EXPECT_TRUE(state.messages().isEmpty());
}

TEST(TransferPoller, ListingReplacedEachPoll) {
    ScriptedBackend backend;
    SessionState state;
    TransferPoller poller(&backend, &state);
    poller.setListingOptions(7, 33);

    backend.queueListing(SimulatedBackend::cannedListing());
    poller.pollOnce();
    EXPECT_EQ(state.transfers().size(), 2);
    EXPECT_EQ(backend.lastLimit, 7);
    EXPECT_EQ(backend.lastPathDisplaySize, 33);

    backend.queueListing(QString());
    poller.pollOnce();
    EXPECT_TRUE(state.transfers().isEmpty());
    EXPECT_FALSE(state.parseFailed());

    backend.queueListing("Not logged in.");
    poller.pollOnce();
    EXPECT_TRUE(state.transfers().isEmpty());
    EXPECT_TRUE(state.parseFailed());
}

TEST(TransferPoller, FailuresBecomeLogLines) {
    ScriptedBackend backend;
    SessionState state;
    TransferPoller poller(&backend, &state);

    backend.queueListing(SimulatedBackend::cannedListing());
    backend.queueFailure("mega-transfers: command not found");
    poller.pollOnce();
    poller.pollOnce();

    EXPECT_EQ(state.messages(), QStringList({"Poll error: mega-transfers: command not found"}));
    // The last good listing stays on screen.
    EXPECT_EQ(state.transfers().size(), 2);
}

TEST(TransferPoller, PollsNeverOverlap) {
    DeferredBackend backend;
    SessionState state;
    TransferPoller poller(&backend, &state);

    poller.pollOnce();
    poller.pollOnce();
    EXPECT_EQ(backend.requests, 1);

    CommandResult result;
    result.started = true;
    result.exitCode = 0;
    backend.held(result);

    poller.pollOnce();
    EXPECT_EQ(backend.requests, 2);
}

TEST(TransferPoller, IntervalFloor) {
    ScriptedBackend backend;
    SessionState state;
    TransferPoller poller(&backend, &state);

    poller.setInterval(16);
    EXPECT_EQ(poller.interval(), TransferPoller::MinimumIntervalMs);
    poller.setInterval(2000);
    EXPECT_EQ(poller.interval(), 2000);
}

TEST(TransferPoller, TimerKeepsPollingUntilStopped) {
    SimulatedBackend backend;
    SessionState state;
    TransferPoller poller(&backend, &state);

    int refreshes = 0;
    QObject::connect(&poller, &TransferPoller::refreshed, [&] { ++refreshes; });

    poller.start();
    EXPECT_TRUE(poller.isRunning());
    ASSERT_TRUE(testutil::waitUntil([&] { return refreshes >= 2; }, 5000));
    EXPECT_EQ(state.transfers().size(), 2);

    poller.stop();
    const int stoppedAt = poller.pollCount();
    testutil::pumpEvents(1200);
    EXPECT_LE(poller.pollCount(), stoppedAt + 1);
    EXPECT_FALSE(poller.isRunning());
}
