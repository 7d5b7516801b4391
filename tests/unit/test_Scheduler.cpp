#include <gtest/gtest.h>
#include "sort/Scheduler.hpp"
#include "sort/Copier.hpp"
#include "fs_test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace fsort::sort;
using namespace fsort::sort::model;

namespace {

// Counts copies in flight and records the highest count seen.
class InstrumentedCopier : public Copier {
public:
    mutable std::atomic<int> inFlight{0};
    mutable std::atomic<int> peak{0};
    mutable std::atomic<int> calls{0};

    CopyOutcome copy(const fs::path& source, const fs::path& outputRoot) const override {
        const int now = ++inFlight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ++calls;
        --inFlight;
        return {source, Succeeded{outputRoot / source.filename(), 0}};
    }
};

// Fails every file whose name starts with "bad", throws for "boom".
class FlakyCopier : public Copier {
public:
    CopyOutcome copy(const fs::path& source, const fs::path& outputRoot) const override {
        const auto name = source.filename().string();
        if (name.rfind("boom", 0) == 0) throw std::runtime_error("copier blew up");
        if (name.rfind("bad", 0) == 0) return {source, Failed{"refused"}};
        return {source, Succeeded{outputRoot / name, 1}};
    }
};

std::vector<FileEntry> names(const std::string& prefix, const int n) {
    std::vector<FileEntry> files;
    for (int i = 0; i < n; ++i) files.emplace_back("/src/" + prefix + std::to_string(i) + ".txt");
    return files;
}

}

TEST(SchedulerTest, OneOutcomePerFile) {
    const auto copier = std::make_shared<InstrumentedCopier>();
    const Scheduler scheduler(copier);

    const auto files = names("f", 37);
    const auto outcomes = scheduler.run(files, "/out", 4);

    ASSERT_EQ(outcomes.size(), files.size());
    EXPECT_EQ(copier->calls.load(), 37);

    std::set<fs::path> sources;
    for (const auto& o : outcomes) sources.insert(o.source);
    EXPECT_EQ(sources, std::set<fs::path>(files.begin(), files.end()));
}

TEST(SchedulerTest, NeverExceedsLimit) {
    for (const unsigned int limit : {1u, 3u, 8u}) {
        const auto copier = std::make_shared<InstrumentedCopier>();
        const Scheduler scheduler(copier);

        const auto outcomes = scheduler.run(names("f", 40), "/out", limit);

        EXPECT_EQ(outcomes.size(), 40u);
        EXPECT_LE(copier->peak.load(), static_cast<int>(limit)) << "limit " << limit;
        EXPECT_GE(copier->peak.load(), 1);
    }
}

TEST(SchedulerTest, LimitAboveFileCount) {
    const auto copier = std::make_shared<InstrumentedCopier>();
    const Scheduler scheduler(copier);

    const auto outcomes = scheduler.run(names("f", 3), "/out", 100);
    EXPECT_EQ(outcomes.size(), 3u);
    EXPECT_LE(copier->peak.load(), 3);
}

TEST(SchedulerTest, EmptyInputYieldsNoOutcomes) {
    const Scheduler scheduler(std::make_shared<InstrumentedCopier>());
    EXPECT_TRUE(scheduler.run({}, "/out", 2).empty());
}

TEST(SchedulerTest, ZeroLimitIsRejected) {
    const Scheduler scheduler(std::make_shared<InstrumentedCopier>());
    EXPECT_THROW((void)scheduler.run(names("f", 1), "/out", 0), std::invalid_argument);
}

TEST(SchedulerTest, NullCopierIsRejected) {
    EXPECT_THROW(Scheduler(std::shared_ptr<const Copier>{}), std::invalid_argument);
}

TEST(SchedulerTest, FailuresDoNotStopOthers) {
    const Scheduler scheduler(std::make_shared<FlakyCopier>());

    std::vector<FileEntry> files{"/src/ok1.txt", "/src/bad1.txt", "/src/boom.txt", "/src/ok2.txt", "/src/bad2.txt"};
    const auto outcomes = scheduler.run(files, "/out", 2);

    ASSERT_EQ(outcomes.size(), files.size());
    const auto ok = std::count_if(outcomes.begin(), outcomes.end(), [](const CopyOutcome& o) { return o.ok(); });
    EXPECT_EQ(ok, 2);

    const auto boom = std::find_if(outcomes.begin(), outcomes.end(),
                                   [](const CopyOutcome& o) { return o.source == "/src/boom.txt"; });
    ASSERT_NE(boom, outcomes.end());
    ASSERT_FALSE(boom->ok());
    EXPECT_EQ(boom->failed().reason, "copier blew up");
}

TEST(SchedulerTest, InterruptedRunQueuesNothing) {
    const auto copier = std::make_shared<InstrumentedCopier>();
    const auto flag = std::make_shared<std::atomic<bool>>(true);
    const Scheduler scheduler(copier, flag);

    const auto files = names("f", 6);
    const auto outcomes = scheduler.run(files, "/out", 3);

    ASSERT_EQ(outcomes.size(), files.size());
    EXPECT_EQ(copier->calls.load(), 0);
    for (const auto& o : outcomes) {
        ASSERT_FALSE(o.ok());
        EXPECT_EQ(o.failed().reason, INTERRUPTED_REASON);
    }
}

class SchedulerFilesystemTest : public ::testing::Test {
protected:
    fs::path base;

    void SetUp() override {
        base = fsort::test::scratch_dir("scheduler");
        fs::remove_all(base);
        fs::create_directories(base / "src");
    }

    void TearDown() override { fs::remove_all(base); }
};

TEST_F(SchedulerFilesystemTest, SameNamedFilesGetDistinctTargets) {
    std::vector<FileEntry> files;
    for (int i = 0; i < 20; ++i) {
        const auto dir = base / "src" / ("d" + std::to_string(i));
        fs::create_directories(dir);
        std::ofstream(dir / "same.txt") << i;
        files.push_back(dir / "same.txt");
    }

    const Scheduler scheduler(std::make_shared<Copier>());
    const auto outcomes = scheduler.run(files, base / "out", 8);

    std::set<fs::path> targets;
    for (const auto& o : outcomes) {
        ASSERT_TRUE(o.ok()) << o.failed().reason;
        targets.insert(o.succeeded().target);
    }

    EXPECT_EQ(targets.size(), 20u);
    EXPECT_TRUE(targets.contains(base / "out" / "txt" / "same.txt"));
    EXPECT_EQ(static_cast<size_t>(std::distance(fs::directory_iterator(base / "out" / "txt"),
                                                fs::directory_iterator{})), 20u);
}

TEST_F(SchedulerFilesystemTest, InterruptedRunFailsRemainingFiles) {
    std::vector<FileEntry> files;
    for (int i = 0; i < 5; ++i) {
        std::ofstream(base / "src" / ("f" + std::to_string(i) + ".txt")) << i;
        files.push_back(base / "src" / ("f" + std::to_string(i) + ".txt"));
    }

    const auto flag = std::make_shared<std::atomic<bool>>(true);
    const Scheduler scheduler(std::make_shared<Copier>(Classifier{}, CopyOptions{}, flag), flag);
    const auto outcomes = scheduler.run(files, base / "out", 2);

    ASSERT_EQ(outcomes.size(), files.size());
    for (const auto& o : outcomes) {
        ASSERT_FALSE(o.ok());
        EXPECT_EQ(o.failed().reason, INTERRUPTED_REASON);
    }
}
