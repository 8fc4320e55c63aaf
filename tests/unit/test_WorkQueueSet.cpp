#include <gtest/gtest.h>
#include "upload/WorkQueueSet.hpp"
#include "upload/errors.hpp"

#include <chrono>
#include <thread>

using namespace hl::upload;
using namespace hl::types;
using namespace std::chrono_literals;

namespace {

FileTask sized(const std::string& path, const uint64_t size) {
    FileTask t;
    t.path_in_repo = path;
    t.local_path = "/tmp/" + path;
    t.size = size;
    return t;
}

FileTask needsHash(const std::string& path) { return sized(path, 10); }

FileTask needsClassify(const std::string& path) {
    auto t = needsHash(path);
    t.sha256 = "sha-" + path;
    return t;
}

FileTask needsPreupload(const std::string& path) {
    auto t = needsClassify(path);
    t.upload_mode = UploadMode::Lfs;
    return t;
}

FileTask needsCommit(const std::string& path) {
    auto t = needsClassify(path);
    t.upload_mode = UploadMode::Regular;
    return t;
}

FileTask committed(const std::string& path) {
    auto t = needsCommit(path);
    t.is_committed = true;
    return t;
}

std::vector<FileTask> many(FileTask (*make)(const std::string&), const std::string& prefix, const size_t n) {
    std::vector<FileTask> out;
    for (size_t i = 0; i < n; ++i) out.push_back(make(prefix + std::to_string(i)));
    return out;
}

std::vector<FileTask> concat(std::initializer_list<std::vector<FileTask>> parts) {
    std::vector<FileTask> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

}

class WorkQueueSetTest : public ::testing::Test {
protected:
    WorkQueueSet::Clock::time_point now = WorkQueueSet::Clock::now();
    WorkQueueSet::ClockFn clock = [this] { return now; };

    static void expectMembership(const WorkQueueSet& q) {
        const auto s = q.snapshot();
        size_t queued = 0, inFlight = 0, terminal = 0;
        for (size_t i = 0; i < q.size(); ++i) {
            switch (q.location(i)) {
                case Location::InFlight: ++inFlight; break;
                case Location::Terminal: ++terminal; break;
                default: ++queued; break;
            }
        }
        EXPECT_EQ(queued, s.queued[0] + s.queued[1] + s.queued[2] + s.queued[3]);
        EXPECT_EQ(queued + inFlight + terminal, q.size());
    }
};

TEST_F(WorkQueueSetTest, SeedsEachTaskIntoTheQueueMatchingItsState) {
    WorkQueueSet q({needsHash("a"), needsClassify("b"), needsPreupload("c"), needsCommit("d"), committed("e")}, {}, clock);

    EXPECT_EQ(q.location(0), Location::HashQueue);
    EXPECT_EQ(q.location(1), Location::ClassifyQueue);
    EXPECT_EQ(q.location(2), Location::PreuploadQueue);
    EXPECT_EQ(q.location(3), Location::CommitQueue);
    EXPECT_EQ(q.location(4), Location::Terminal);
    EXPECT_FALSE(q.isDone());
    expectMembership(q);
}

TEST_F(WorkQueueSetTest, IgnoredTasksAreTerminal) {
    auto t = needsClassify("x");
    t.should_ignore = true;
    WorkQueueSet q({t}, {}, clock);

    EXPECT_EQ(q.location(0), Location::Terminal);
    EXPECT_TRUE(q.isDone());
    EXPECT_EQ(q.claimNext().kind, StageKind::Exit);
}

TEST_F(WorkQueueSetTest, EmptySetExitsImmediately) {
    WorkQueueSet q({}, {}, clock);
    EXPECT_TRUE(q.isDone());
    EXPECT_EQ(q.claimNext().kind, StageKind::Exit);
}

TEST_F(WorkQueueSetTest, FirstCommitIsClaimedEagerly) {
    WorkQueueSet q({needsHash("h"), needsCommit("c")}, {}, clock);

    const auto job = q.claimNext();
    EXPECT_EQ(job.kind, StageKind::Commit);
    ASSERT_EQ(job.items.size(), 1u);
    EXPECT_EQ(job.items[0].path_in_repo, "c");
}

TEST_F(WorkQueueSetTest, RecentCommitDefersPartialBatch) {
    WorkQueueSet q(concat({many(needsCommit, "c", 26), {needsHash("h1"), needsHash("h2")}}), {}, clock);

    auto first = q.claimNext();
    ASSERT_EQ(first.kind, StageKind::Commit);
    EXPECT_EQ(first.items.size(), 25u);
    for (auto& t : first.items) t.is_committed = true;
    q.release(std::move(first));

    // One leftover commit item, last attempt just now: hashing comes first
    EXPECT_EQ(q.claimNext().kind, StageKind::Hash);
    EXPECT_EQ(q.claimNext().kind, StageKind::Hash);

    // Nothing else left to do, so the fallback rule commits the leftover
    const auto leftover = q.claimNext();
    EXPECT_EQ(leftover.kind, StageKind::Commit);
    EXPECT_EQ(leftover.items.size(), 1u);
}

TEST_F(WorkQueueSetTest, StaleCommitTakesPriority) {
    WorkQueueSet q(concat({many(needsCommit, "c", 26), {needsHash("h")}}), {}, clock);

    auto first = q.claimNext();
    for (auto& t : first.items) t.is_committed = true;
    q.release(std::move(first));

    now += 5min + 1s;
    const auto job = q.claimNext();
    EXPECT_EQ(job.kind, StageKind::Commit);
    EXPECT_EQ(job.items.size(), 1u);
}

TEST_F(WorkQueueSetTest, FullCommitBatchIsClaimedEvenIfRecent) {
    WorkQueueSet q(concat({many(needsCommit, "c", 60), {needsHash("h")}}), {}, clock);

    auto first = q.claimNext();
    ASSERT_EQ(first.kind, StageKind::Commit);
    for (auto& t : first.items) t.is_committed = true;
    q.release(std::move(first));

    const auto second = q.claimNext();
    EXPECT_EQ(second.kind, StageKind::Commit);
    EXPECT_EQ(second.items.size(), 25u);
}

TEST_F(WorkQueueSetTest, NeverTwoCommitsInFlight) {
    WorkQueueSet q(many(needsCommit, "c", 60), {}, clock);

    const auto first = q.claimNext();
    ASSERT_EQ(first.kind, StageKind::Commit);
    EXPECT_EQ(q.claimNext().kind, StageKind::Wait);
    EXPECT_EQ(q.snapshot().active_commit, 1u);
}

TEST_F(WorkQueueSetTest, ClassifyIsEagerFromThreshold) {
    WorkQueueSet q(concat({many(needsClassify, "m", 10), {needsHash("h"), needsPreupload("p")}}), {}, clock);

    const auto job = q.claimNext();
    EXPECT_EQ(job.kind, StageKind::Classify);
    EXPECT_EQ(job.items.size(), 10u);
}

TEST_F(WorkQueueSetTest, ClassifyBelowThresholdYieldsToSingleFlightStages) {
    WorkQueueSet q(concat({many(needsClassify, "m", 9), {needsHash("h"), needsPreupload("p")}}), {}, clock);

    EXPECT_EQ(q.claimNext().kind, StageKind::Preupload);
    EXPECT_EQ(q.claimNext().kind, StageKind::Hash);

    const auto classify = q.claimNext();
    EXPECT_EQ(classify.kind, StageKind::Classify);
    EXPECT_EQ(classify.items.size(), 9u);
}

TEST_F(WorkQueueSetTest, ClassifyBatchIsCapped) {
    WorkQueueSet q(many(needsClassify, "m", 120), {}, clock);

    EXPECT_EQ(q.claimNext().items.size(), 50u);
    EXPECT_EQ(q.claimNext().items.size(), 50u);
    EXPECT_EQ(q.claimNext().items.size(), 20u);
    EXPECT_EQ(q.claimNext().kind, StageKind::Wait);
}

TEST_F(WorkQueueSetTest, SingleFlightRulesBeforeFallbacks) {
    WorkQueueSet q(concat({many(needsPreupload, "p", 2), many(needsHash, "h", 2), many(needsClassify, "m", 2)}), {}, clock);

    EXPECT_EQ(q.claimNext().kind, StageKind::Preupload);   // no pre-upload worker yet
    EXPECT_EQ(q.claimNext().kind, StageKind::Hash);        // no hash worker yet

    const auto classify = q.claimNext();                   // no classify worker yet
    EXPECT_EQ(classify.kind, StageKind::Classify);
    EXPECT_EQ(classify.items.size(), 2u);

    EXPECT_EQ(q.claimNext().kind, StageKind::Preupload);   // fallback
    EXPECT_EQ(q.claimNext().kind, StageKind::Hash);        // fallback
    EXPECT_EQ(q.claimNext().kind, StageKind::Wait);

    const auto s = q.snapshot();
    EXPECT_EQ(s.active_preupload, 2u);
    EXPECT_EQ(s.active_hash, 2u);
    EXPECT_EQ(s.active_classify, 1u);
}

TEST_F(WorkQueueSetTest, TransferAccelerationKeepsPreuploadSerialized) {
    SchedulerLimits limits;
    limits.transfer_acceleration = true;
    WorkQueueSet q(many(needsPreupload, "p", 2), limits, clock);

    auto first = q.claimNext();
    EXPECT_EQ(first.kind, StageKind::Preupload);
    EXPECT_EQ(q.claimNext().kind, StageKind::Wait);

    first.items[0].is_uploaded = true;
    q.release(std::move(first));
    EXPECT_EQ(q.claimNext().kind, StageKind::Commit);
    EXPECT_EQ(q.claimNext().kind, StageKind::Preupload);
}

TEST_F(WorkQueueSetTest, WithoutAccelerationPreuploadsRunInParallel) {
    WorkQueueSet q(many(needsPreupload, "p", 2), {}, clock);

    EXPECT_EQ(q.claimNext().kind, StageKind::Preupload);
    EXPECT_EQ(q.claimNext().kind, StageKind::Preupload);
}

TEST_F(WorkQueueSetTest, ClaimedTasksAreInFlightUntilReleased) {
    WorkQueueSet q(concat({many(needsClassify, "m", 3), {needsHash("h")}}), {}, clock);

    auto job = q.claimNext();
    ASSERT_EQ(job.kind, StageKind::Hash);
    EXPECT_EQ(q.location(job.ids[0]), Location::InFlight);
    expectMembership(q);

    job.items[0].sha256 = "abc";
    q.release(std::move(job));
    EXPECT_EQ(q.location(3), Location::ClassifyQueue);
    EXPECT_EQ(q.task(3).sha256, "abc");
    expectMembership(q);
}

TEST_F(WorkQueueSetTest, UnchangedReleaseRequeuesToSameQueue) {
    WorkQueueSet q(many(needsClassify, "m", 12), {}, clock);

    auto job = q.claimNext();
    ASSERT_EQ(job.kind, StageKind::Classify);
    const auto ids = job.ids;
    q.release(std::move(job));

    for (const auto id : ids) EXPECT_EQ(q.location(id), Location::ClassifyQueue);
    EXPECT_EQ(q.snapshot().queued[1], 12u);
    EXPECT_EQ(q.snapshot().active_classify, 0u);
}

TEST_F(WorkQueueSetTest, ReleaseRoutesByOutcome) {
    WorkQueueSet q(many(needsClassify, "m", 3), {}, clock);

    auto job = q.claimNext();
    ASSERT_EQ(job.items.size(), 3u);
    job.items[0].upload_mode = UploadMode::Lfs;
    job.items[1].upload_mode = UploadMode::Regular;
    job.items[2].should_ignore = true;
    q.release(std::move(job));

    EXPECT_EQ(q.location(0), Location::PreuploadQueue);
    EXPECT_EQ(q.location(1), Location::CommitQueue);
    EXPECT_EQ(q.location(2), Location::Terminal);
    EXPECT_EQ(q.snapshot().ignored, 1u);
}

TEST_F(WorkQueueSetTest, WaitsWhileWorkIsInFlightThenExits) {
    WorkQueueSet q({needsCommit("c")}, {}, clock);

    auto job = q.claimNext();
    EXPECT_EQ(q.claimNext().kind, StageKind::Wait);
    EXPECT_FALSE(q.isDone());

    job.items[0].is_committed = true;
    q.release(std::move(job));
    EXPECT_TRUE(q.isDone());
    EXPECT_EQ(q.claimNext().kind, StageKind::Exit);
}

TEST_F(WorkQueueSetTest, ReleasingAWaitJobIsAnInvariantViolation) {
    WorkQueueSet q({needsHash("h")}, {}, clock);
    EXPECT_THROW(q.release(Job{StageKind::Wait, {}, {}}), InvariantViolation);
}

TEST_F(WorkQueueSetTest, ReleasingATaskTwiceIsAnInvariantViolation) {
    WorkQueueSet q({needsHash("h")}, {}, clock);
    auto job = q.claimNext();
    Job copy = job;
    q.release(std::move(job));
    EXPECT_THROW(q.release(std::move(copy)), InvariantViolation);
}

TEST_F(WorkQueueSetTest, AbandonFreesTheStageSlot) {
    WorkQueueSet q(many(needsHash, "h", 2), {}, clock);

    const auto job = q.claimNext();
    EXPECT_EQ(q.snapshot().active_hash, 1u);
    q.abandon(job);
    EXPECT_EQ(q.snapshot().active_hash, 0u);
    EXPECT_EQ(q.location(job.ids[0]), Location::InFlight);
}

TEST_F(WorkQueueSetTest, WaitForWorkWakesOnRelease) {
    WorkQueueSet q({needsHash("h")}, {}, clock);
    auto job = q.claimNext();

    std::thread releaser([&q, &job] {
        std::this_thread::sleep_for(50ms);
        job.items[0].sha256 = "abc";
        q.release(std::move(job));
    });

    const auto start = std::chrono::steady_clock::now();
    q.waitForWork(30s, nullptr);
    const auto waited = std::chrono::steady_clock::now() - start;
    releaser.join();

    EXPECT_LT(waited, 10s);
    EXPECT_EQ(q.snapshot().waiting, 0u);
}

TEST_F(WorkQueueSetTest, WaitForWorkWakesOnInterrupt) {
    WorkQueueSet q({needsHash("h")}, {}, clock);
    const auto flag = hl::concurrency::makeInterruptFlag();

    std::thread interrupter([&flag] {
        std::this_thread::sleep_for(50ms);
        flag->store(true);
    });

    const auto start = std::chrono::steady_clock::now();
    q.waitForWork(30s, flag);
    interrupter.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST_F(WorkQueueSetTest, SnapshotCountsProgress) {
    auto uploaded = needsPreupload("u");
    uploaded.is_uploaded = true;
    uploaded.size = 100;
    auto ignored = needsClassify("i");
    ignored.should_ignore = true;

    WorkQueueSet q({sized("a", 5), needsClassify("b"), uploaded, committed("c"), ignored}, {}, clock);
    const auto s = q.snapshot();

    EXPECT_EQ(s.total, 4u);
    EXPECT_EQ(s.total_bytes, 5u + 10u + 100u + 10u);
    EXPECT_EQ(s.hashed, 3u);
    EXPECT_EQ(s.unsure, 2u);
    EXPECT_EQ(s.lfs, 1u);
    EXPECT_EQ(s.lfs_uploaded, 1u);
    EXPECT_EQ(s.lfs_uploaded_bytes, 100u);
    EXPECT_EQ(s.committed, 1u);
    EXPECT_EQ(s.ignored, 1u);
    EXPECT_FALSE(s.done);
}
