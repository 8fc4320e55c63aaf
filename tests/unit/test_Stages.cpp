#include <gtest/gtest.h>
#include "FakeHubClient.hpp"
#include "TempFolder.hpp"
#include "upload/Stages.hpp"
#include "upload/errors.hpp"

using namespace hl::upload;
using namespace hl::types;
using namespace hl::test;

class StagesTest : public ::testing::Test {
protected:
    TempFolder folder;
    FakeHubClient hub;
    hl::metadata::Store store{folder.path()};
    hl::concurrency::InterruptFlag interrupt = hl::concurrency::makeInterruptFlag();
    Stages stages{hub, store, {"user/repo", "model", "main"}, {64, "Test commit"}, interrupt};

    FileTask task(const std::string& rel, const std::string& content) const {
        folder.write(rel, content);
        return store.load(rel);
    }

    FileTask hashed(const std::string& rel, const std::string& content) const {
        auto t = task(rel, content);
        t.sha256 = std::string(64, 'f');
        return t;
    }
};

TEST_F(StagesTest, HashSetsShaAndPersists) {
    auto t = task("abc.txt", "abc");

    const auto res = stages.hash(t);

    ASSERT_TRUE(res.ok);
    EXPECT_EQ(t.sha256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(store.load("abc.txt").sha256, t.sha256);
}

TEST_F(StagesTest, HashFailureLeavesShaUnset) {
    auto t = task("gone.txt", "x");
    std::filesystem::remove(t.local_path);

    const auto res = stages.hash(t);

    EXPECT_FALSE(res.ok);
    EXPECT_FALSE(res.error.empty());
    EXPECT_FALSE(t.sha256.has_value());
}

TEST_F(StagesTest, HashPropagatesInterrupt) {
    auto t = task("big.txt", std::string(1024, 'x'));
    interrupt->store(true);
    EXPECT_THROW((void)stages.hash(t), hl::concurrency::Interrupted);
}

TEST_F(StagesTest, ClassifyAppliesEachVerdict) {
    std::vector<FileTask> batch = {
        hashed("model.bin", "weights"),
        hashed("readme.txt", "hello"),
        hashed("junk.txt", "junk"),
        hashed("unknown.txt", "?"),
    };
    hub.ignore_paths = {"junk.txt"};
    hub.unknown_paths = {"unknown.txt"};

    ASSERT_TRUE(stages.classify(batch).ok);

    EXPECT_EQ(batch[0].upload_mode, UploadMode::Lfs);
    EXPECT_EQ(batch[1].upload_mode, UploadMode::Regular);
    EXPECT_TRUE(batch[2].should_ignore);
    EXPECT_FALSE(batch[3].upload_mode.has_value());
    EXPECT_FALSE(batch[3].should_ignore);

    EXPECT_EQ(store.load("model.bin").upload_mode, UploadMode::Lfs);
    EXPECT_TRUE(store.load("junk.txt").should_ignore);
}

TEST_F(StagesTest, ClassifySendsAtMost512ByteSamples) {
    std::vector<FileTask> batch = {hashed("long.txt", std::string(2000, 'l')), hashed("short.txt", "abc")};

    ASSERT_TRUE(stages.classify(batch).ok);

    const auto infos = hub.lastClassifyInfos();
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_EQ(infos[0].sample, std::string(512, 'l'));
    EXPECT_EQ(infos[0].size, 2000u);
    EXPECT_EQ(infos[1].sample, "abc");
}

TEST_F(StagesTest, ClassifyFailureLeavesBatchUnchanged) {
    std::vector<FileTask> batch = {hashed("a.txt", "a"), hashed("b.bin", "b")};
    hub.classify_failures = 1;

    const auto res = stages.classify(batch);

    EXPECT_FALSE(res.ok);
    for (const auto& t : batch) {
        EXPECT_FALSE(t.upload_mode.has_value());
        EXPECT_FALSE(t.should_ignore);
    }
}

TEST_F(StagesTest, ClassifyWithoutShaIsAnInvariantViolation) {
    std::vector<FileTask> batch = {task("a.txt", "a")};
    EXPECT_THROW((void)stages.classify(batch), InvariantViolation);
}

TEST_F(StagesTest, PreuploadMarksUploaded) {
    auto t = hashed("w.bin", "weights");
    t.upload_mode = UploadMode::Lfs;

    ASSERT_TRUE(stages.preupload(t).ok);
    EXPECT_TRUE(t.is_uploaded);
    EXPECT_TRUE(store.load("w.bin").is_uploaded);
    ASSERT_EQ(hub.preuploads().size(), 1u);
    EXPECT_EQ(hub.preuploads()[0].sha256, *t.sha256);
}

TEST_F(StagesTest, PreuploadFailureKeepsTaskPending) {
    auto t = hashed("w.bin", "weights");
    t.upload_mode = UploadMode::Lfs;
    hub.preupload_failures = 1;

    EXPECT_FALSE(stages.preupload(t).ok);
    EXPECT_FALSE(t.is_uploaded);
}

TEST_F(StagesTest, PreuploadOfRegularFileIsAnInvariantViolation) {
    auto t = hashed("r.txt", "r");
    t.upload_mode = UploadMode::Regular;
    EXPECT_THROW((void)stages.preupload(t), InvariantViolation);
}

TEST_F(StagesTest, CommitMarksEveryItemCommitted) {
    auto lfs = hashed("w.bin", "weights");
    lfs.upload_mode = UploadMode::Lfs;
    lfs.is_uploaded = true;
    auto regular = hashed("r.txt", "r");
    regular.upload_mode = UploadMode::Regular;
    std::vector<FileTask> batch = {lfs, regular};

    ASSERT_TRUE(stages.commit(batch).ok);

    EXPECT_TRUE(batch[0].is_committed);
    EXPECT_TRUE(batch[1].is_committed);
    EXPECT_TRUE(store.load("r.txt").is_committed);

    const auto commits = hub.commits();
    ASSERT_EQ(commits.size(), 1u);
    EXPECT_EQ(commits[0].size(), 2u);
    EXPECT_EQ(commits[0][0].mode, UploadMode::Lfs);
    EXPECT_EQ(hub.messages()[0], "Test commit");
}

TEST_F(StagesTest, CommitFailureLeavesBatchUntouched) {
    auto t = hashed("r.txt", "r");
    t.upload_mode = UploadMode::Regular;
    std::vector<FileTask> batch = {t};
    hub.commit_failures = 1;

    EXPECT_FALSE(stages.commit(batch).ok);
    EXPECT_FALSE(batch[0].is_committed);
    EXPECT_FALSE(store.load("r.txt").is_committed);
}

TEST_F(StagesTest, CommitOfPendingLfsFileIsAnInvariantViolation) {
    auto t = hashed("w.bin", "weights");
    t.upload_mode = UploadMode::Lfs;
    std::vector<FileTask> batch = {t};
    EXPECT_THROW((void)stages.commit(batch), InvariantViolation);
    EXPECT_TRUE(hub.commits().empty());
}

TEST_F(StagesTest, RunRejectsMultiItemHashJob) {
    Job job;
    job.kind = StageKind::Hash;
    job.items = {task("a.txt", "a"), task("b.txt", "b")};
    EXPECT_THROW((void)stages.run(job), InvariantViolation);
}
