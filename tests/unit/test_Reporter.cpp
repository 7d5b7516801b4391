#include <gtest/gtest.h>
#include "sort/Reporter.hpp"

#include <nlohmann/json.hpp>

using namespace fsort::sort;
using namespace fsort::sort::model;

TEST(ReporterTest, CountsSuccessesAndFailures) {
    const Reporter reporter;
    const std::vector<FileEntry> files{"/s/a.txt", "/s/b.TXT", "/s/c", "/s/d.pdf"};
    const std::vector<CopyOutcome> outcomes{
        {"/s/a.txt", Succeeded{"/o/txt/a.txt", 3}},
        {"/s/b.TXT", Succeeded{"/o/txt/b.TXT", 4}},
        {"/s/c", Succeeded{"/o/no_extension/c", 1}},
        {"/s/d.pdf", Failed{"disk full"}},
    };

    const auto summary = reporter.summarize(files, outcomes);

    EXPECT_EQ(summary.total, 4u);
    EXPECT_EQ(summary.succeeded, 3u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_FALSE(summary.allSucceeded());
    EXPECT_EQ(summary.extensions, (std::set<std::string>{"no_extension", "pdf", "txt"}));
    ASSERT_EQ(summary.failures.size(), 1u);
    EXPECT_EQ(summary.failures[0].source, "/s/d.pdf");
    EXPECT_EQ(summary.failures[0].reason, "disk full");
}

TEST(ReporterTest, MissingOutcomeCountsAsFailure) {
    const Reporter reporter;
    const std::vector<FileEntry> files{"/s/a.txt", "/s/b.txt"};
    const std::vector<CopyOutcome> outcomes{{"/s/a.txt", Succeeded{"/o/txt/a.txt", 1}}};

    const auto summary = reporter.summarize(files, outcomes);

    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.succeeded + summary.failed, summary.total);
    ASSERT_EQ(summary.failures.size(), 1u);
    EXPECT_EQ(summary.failures[0].source, "/s/b.txt");
}

TEST(ReporterTest, FailuresSortedBySource) {
    const Reporter reporter;
    const std::vector<FileEntry> files{"/s/z.txt", "/s/a.txt", "/s/m.txt"};
    const std::vector<CopyOutcome> outcomes{
        {"/s/z.txt", Failed{"z"}}, {"/s/a.txt", Failed{"a"}}, {"/s/m.txt", Failed{"m"}}};

    const auto summary = reporter.summarize(files, outcomes);

    ASSERT_EQ(summary.failures.size(), 3u);
    EXPECT_EQ(summary.failures[0].source, "/s/a.txt");
    EXPECT_EQ(summary.failures[2].source, "/s/z.txt");
    EXPECT_EQ(summary.failed, 3u);
}

TEST(ReporterTest, SummarySerializesToJson) {
    const Reporter reporter;
    const std::vector<FileEntry> files{"/s/a.txt", "/s/b.md"};
    const std::vector<CopyOutcome> outcomes{{"/s/a.txt", Succeeded{"/o/txt/a.txt", 2}}, {"/s/b.md", Failed{"nope"}}};

    const nlohmann::json j = reporter.summarize(files, outcomes);

    EXPECT_EQ(j["total"], 2);
    EXPECT_EQ(j["succeeded"], 1);
    EXPECT_EQ(j["failed"], 1);
    EXPECT_EQ(j["extensions"], nlohmann::json::array({"md", "txt"}));
    ASSERT_EQ(j["failures"].size(), 1u);
    EXPECT_EQ(j["failures"][0]["source"], "/s/b.md");
    EXPECT_EQ(j["failures"][0]["reason"], "nope");

    reporter.emit(reporter.summarize(files, outcomes));
}

TEST(ReporterTest, OutcomeSerializesToJson) {
    const nlohmann::json ok = CopyOutcome{"/s/a.txt", Succeeded{"/o/txt/a.txt", 9}};
    EXPECT_EQ(ok["ok"], true);
    EXPECT_EQ(ok["target"], "/o/txt/a.txt");
    EXPECT_EQ(ok["bytes"], 9);

    const nlohmann::json bad = CopyOutcome{"/s/b.txt", Failed{"broken"}};
    EXPECT_EQ(bad["ok"], false);
    EXPECT_EQ(bad["reason"], "broken");
}
