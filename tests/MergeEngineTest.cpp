#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <sstream>
#include <thread>
#include <vector>
#include "TestUtils.hpp"
#include "merge/MergeEngine.hpp"
#include "storage/ChunkStore.hpp"
#include "storage/UploadError.hpp"

using namespace chunkd;
using chunkd::test::ScratchDir;

class MergeEngineTest : public ::testing::Test {
protected:
    ScratchDir dir{"merge"};
    UploadLocks locks;
    ChunkStore store{dir.tempDir(), dir.finalDir(), locks};

    void SetUp() override {
        store.ensureStorageDirectories();
    }

    void upload(const std::string& name, long long index, const std::string& payload) {
        std::istringstream data(payload);
        store.storeChunk(name, index, data);
    }

    std::string output(const std::string& name) {
        return test::readFile(dir.finalDir() / name);
    }
};

TEST_F(MergeEngineTest, MergesTwoChunksInOrder) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 2);
    upload("doc.txt", 0, "AAA");
    upload("doc.txt", 1, "BBB");

    MergeReport report = engine.mergeChunks("doc.txt", 2);

    EXPECT_EQ(output("doc.txt"), "AAABBB");
    EXPECT_EQ(report.mergedChunks, (std::vector<long long>{0, 1}));
    EXPECT_TRUE(report.missingChunks.empty());
    EXPECT_TRUE(report.failedChunks.empty());
    EXPECT_EQ(report.bytesWritten, 6u);
    EXPECT_TRUE(test::listChunkArtifacts(dir.tempDir()).empty());
}

TEST_F(MergeEngineTest, OutputFollowsIndexOrderNotArrivalOrder) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 8, 3);

    // Sizes vary wildly so reads finish out of order
    const int total = 64;
    std::vector<std::string> payloads(total);
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> size(0, 64 * 1024);
    for (int i = 0; i < total; ++i) {
        payloads[i] = std::string(static_cast<size_t>(size(rng)), static_cast<char>('A' + i % 26));
        payloads[i] += "#" + std::to_string(i) + "#";
    }

    std::vector<int> order(total);
    for (int i = 0; i < total; ++i) order[i] = i;
    std::shuffle(order.begin(), order.end(), rng);
    for (int i : order) upload("big.bin", i, payloads[i]);

    MergeReport report = engine.mergeChunks("big.bin", total);

    std::string expected;
    for (const auto& p : payloads) expected += p;
    std::string actual = output("big.bin");
    EXPECT_EQ(actual.size(), expected.size());
    EXPECT_TRUE(actual == expected);
    EXPECT_EQ(report.mergedChunks.size(), static_cast<size_t>(total));
    EXPECT_EQ(report.bytesWritten, expected.size());
}

TEST_F(MergeEngineTest, ConcurrentUploadsThenMergeKeepOrder) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 4);
    const int total = 16;

    std::vector<std::thread> uploaders;
    for (int i = total - 1; i >= 0; --i) {
        uploaders.emplace_back([this, i]() { upload("par.bin", i, "<" + std::to_string(i) + ">"); });
    }
    for (auto& t : uploaders) t.join();

    engine.mergeChunks("par.bin", total);

    std::string expected;
    for (int i = 0; i < total; ++i) expected += "<" + std::to_string(i) + ">";
    EXPECT_EQ(output("par.bin"), expected);
}

TEST_F(MergeEngineTest, MissingChunkIsSkipped) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 3);
    upload("doc.txt", 0, "zero-");
    upload("doc.txt", 1, "one-");
    upload("doc.txt", 3, "three-");
    upload("doc.txt", 4, "four");

    MergeReport report = engine.mergeChunks("doc.txt", 5);

    EXPECT_EQ(output("doc.txt"), "zero-one-three-four");
    EXPECT_EQ(report.missingChunks, (std::vector<ChunkRange>{{2, 2}}));
    EXPECT_EQ(report.mergedChunks, (std::vector<long long>{0, 1, 3, 4}));
}

TEST_F(MergeEngineTest, MissingChunksAreCoalescedIntoRanges) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 2);
    upload("gaps.bin", 0, "a");
    upload("gaps.bin", 3, "d");
    upload("gaps.bin", 5, "f");

    MergeReport report = engine.mergeChunks("gaps.bin", 1000);

    EXPECT_EQ(output("gaps.bin"), "adf");
    EXPECT_EQ(report.missingChunks, (std::vector<ChunkRange>{{1, 2}, {4, 4}, {6, 999}}));
    EXPECT_EQ(report.missingCount(), 997);
}

TEST_F(MergeEngineTest, NoChunksProducesEmptyOutput) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 2);

    MergeReport report = engine.mergeChunks("nothing.bin", 3);

    ASSERT_TRUE(std::filesystem::exists(dir.finalDir() / "nothing.bin"));
    EXPECT_EQ(std::filesystem::file_size(dir.finalDir() / "nothing.bin"), 0u);
    EXPECT_EQ(report.missingChunks, (std::vector<ChunkRange>{{0, 2}}));
    EXPECT_EQ(report.missingCount(), 3);
    EXPECT_TRUE(report.mergedChunks.empty());
}

TEST_F(MergeEngineTest, ExistingOutputIsTruncated) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 1);
    test::writeFile(dir.finalDir() / "doc.txt", "stale content that is much longer");
    upload("doc.txt", 0, "new");

    engine.mergeChunks("doc.txt", 1);

    EXPECT_EQ(output("doc.txt"), "new");
}

TEST_F(MergeEngineTest, SweepRemovesOrphansOfOtherFiles) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 2);
    upload("doc.txt", 0, "AAA");
    upload("other.bin", 0, "orphan");
    upload("other.bin", 7, "orphan too");
    // Beyond the declared total, never consumed
    upload("doc.txt", 5, "late");
    test::writeFile(dir.tempDir() / "keep.me", "not a chunk");

    MergeReport report = engine.mergeChunks("doc.txt", 1);

    EXPECT_EQ(output("doc.txt"), "AAA");
    EXPECT_EQ(report.sweptArtifacts, 3u);
    EXPECT_TRUE(test::listChunkArtifacts(dir.tempDir()).empty());
    EXPECT_TRUE(std::filesystem::exists(dir.tempDir() / "keep.me"));
}

TEST_F(MergeEngineTest, WindowOfOneStillMergesEverything) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 1, 1);
    for (int i = 0; i < 10; ++i) upload("w.bin", i, std::to_string(i));

    engine.mergeChunks("w.bin", 10);

    EXPECT_EQ(output("w.bin"), "0123456789");
}

TEST_F(MergeEngineTest, UnreadableChunkIsReportedAndSkipped) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 2);
    upload("doc.txt", 0, "AAA");
    // A directory where chunk 1 should be cannot be read as a file
    std::filesystem::create_directories(dir.tempDir() / "doc.txt.part1");
    upload("doc.txt", 2, "CCC");

    MergeReport report = engine.mergeChunks("doc.txt", 3);

    EXPECT_EQ(output("doc.txt"), "AAACCC");
    EXPECT_EQ(report.failedChunks, (std::vector<long long>{1}));
    EXPECT_FALSE(std::filesystem::exists(dir.tempDir() / "doc.txt.part1"));
}

TEST_F(MergeEngineTest, WriteFailureSkipsChunkAndMergeStillSucceeds) {
    // Every write to /dev/full fails with ENOSPC
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    MergeEngine engine(dir.tempDir(), "/dev", locks, 2);
    upload("full", 0, "AAA");
    upload("full", 1, "BBB");

    MergeReport report = engine.mergeChunks("full", 2);

    EXPECT_TRUE(report.mergedChunks.empty());
    EXPECT_EQ(report.failedChunks, (std::vector<long long>{0, 1}));
    EXPECT_TRUE(report.missingChunks.empty());
    EXPECT_EQ(report.bytesWritten, 0u);
    // Unwritten chunks are still swept afterwards
    EXPECT_TRUE(test::listChunkArtifacts(dir.tempDir()).empty());
}

TEST_F(MergeEngineTest, RejectsInvalidArguments) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 1);
    try {
        engine.mergeChunks("doc.txt", 0);
        FAIL() << "expected UploadError";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRequest);
    }
    try {
        engine.mergeChunks("", 2);
        FAIL() << "expected UploadError";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRequest);
    }
    EXPECT_FALSE(std::filesystem::exists(dir.finalDir() / "doc.txt"));
}

TEST_F(MergeEngineTest, OutputCreationFailureIsFatal) {
    test::writeFile(dir.path() / "notadir", "x");
    MergeEngine engine(dir.tempDir(), dir.path() / "notadir", locks, 1);
    upload("doc.txt", 0, "AAA");

    try {
        engine.mergeChunks("doc.txt", 1);
        FAIL() << "expected UploadError";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoFailure);
        EXPECT_STREQ(e.what(), "Failed to create output file");
    }
    // Nothing consumed when the merge never started
    EXPECT_TRUE(std::filesystem::exists(dir.tempDir() / "doc.txt.part0"));
}

TEST_F(MergeEngineTest, SweepFailureIsFatalAfterMerge) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 1);
    upload("doc.txt", 0, "AAA");
    // Non-empty directory matching the glob cannot be removed
    test::writeFile(dir.tempDir() / "stuck.part9" / "inner", "x");

    try {
        engine.mergeChunks("doc.txt", 1);
        FAIL() << "expected UploadError";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoFailure);
        EXPECT_STREQ(e.what(), "Failed to clean up temporary files");
    }
    EXPECT_EQ(output("doc.txt"), "AAA");
}

TEST_F(MergeEngineTest, SweepWithoutTempDirIsNoop) {
    MergeEngine engine(dir.path() / "never-created", dir.finalDir(), locks, 1);
    EXPECT_EQ(engine.sweepTempArtifacts(), 0u);
}

TEST_F(MergeEngineTest, DefaultWindowIsTwiceTheWorkers) {
    MergeEngine engine(dir.tempDir(), dir.finalDir(), locks, 3);
    EXPECT_EQ(engine.workers(), 3u);
    EXPECT_EQ(engine.window(), 6u);

    MergeEngine clamped(dir.tempDir(), dir.finalDir(), locks, 0, 5);
    EXPECT_EQ(clamped.workers(), 1u);
    EXPECT_EQ(clamped.window(), 5u);
}
