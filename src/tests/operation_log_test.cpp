#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <string>
#include "oplog/operation_log.hpp"
#include "test_utils.hpp"

using namespace k7::oplog;
using std::chrono::system_clock;

class OperationLogTest : public ::testing::Test {
protected:
    std::unique_ptr<TempDir> dir;
    std::filesystem::path persist_path;
    // 2024-03-05 06:07:08 UTC
    system_clock::time_point now{std::chrono::seconds(1709618828)};

    void SetUp() override {
        init_logging();
        dir = std::make_unique<TempDir>("operation_log_test");
        persist_path = dir->path() / "state" / "last_log.json";
    }

    OperationLog make_log(std::chrono::seconds retention = OperationLog::DEFAULT_RETENTION) {
        return OperationLog(persist_path, retention, [this] { return now; });
    }
};

TEST_F(OperationLogTest, AppendKeepsOrderAndSeverity) {
    OperationLog log = make_log();
    log.append("first");
    log.append("second", Severity::Warning);
    log.append("third", Severity::InfoDetail);

    ASSERT_EQ(log.entries().size(), 3u);
    EXPECT_EQ(log.entries()[0].message, "first");
    EXPECT_EQ(log.entries()[0].severity, Severity::Info);
    EXPECT_EQ(log.entries()[1].severity, Severity::Warning);
    EXPECT_EQ(log.entries()[2].timestamp, now);

    log.clear();
    EXPECT_TRUE(log.entries().empty());
}

TEST_F(OperationLogTest, EntryFormatting) {
    LogEntry entry{now, Severity::InfoImportant, "DRY RUN MODE ACTIVATED"};
    EXPECT_EQ(entry.to_string(), "[INFO_IMPORTANT] 2024-03-05 06:07:08 - DRY RUN MODE ACTIVATED");
}

TEST_F(OperationLogTest, SeverityNames) {
    for (Severity s : {Severity::Info, Severity::Warning, Severity::Error,
                       Severity::Success, Severity::InfoImportant, Severity::InfoDetail}) {
        auto parsed = parse_severity(to_string(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(parse_severity("DEBUG").has_value());
}

TEST_F(OperationLogTest, PersistAndReadBack) {
    OperationLog log = make_log();
    log.append("Starting", Severity::Info);
    log.append("Done", Severity::Success);
    ASSERT_TRUE(log.persist_last());

    OperationLog reader = make_log();
    auto entries = reader.last_entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "Starting");
    EXPECT_EQ(entries[1].severity, Severity::Success);
    EXPECT_EQ(entries[1].timestamp, now);
}

TEST_F(OperationLogTest, PersistReplacesPreviousRun) {
    OperationLog log = make_log();
    log.append("old run");
    ASSERT_TRUE(log.persist_last());

    log.clear();
    log.append("new run");
    ASSERT_TRUE(log.persist_last());

    auto entries = log.last_entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "new run");
    EXPECT_FALSE(std::filesystem::exists(persist_path.string() + ".tmp"));
}

TEST_F(OperationLogTest, PersistedLogExpires) {
    OperationLog log = make_log(std::chrono::seconds(60));
    log.append("short lived");
    ASSERT_TRUE(log.persist_last());

    now += std::chrono::seconds(59);
    EXPECT_EQ(log.last_entries().size(), 1u);

    now += std::chrono::seconds(1);
    EXPECT_TRUE(log.last_entries().empty());
    EXPECT_EQ(log.formatted_last(), "");
}

TEST_F(OperationLogTest, FormattedLastEscapesHtml) {
    OperationLog log = make_log();
    log.append("Record <b>\"bob\"</b> & 'friends'", Severity::Warning);
    ASSERT_TRUE(log.persist_last());

    EXPECT_EQ(log.formatted_last(),
              "<ul style=\"list-style: none; padding-left: 0;\">"
              "<li>[WARNING] 2024-03-05 06:07:08 - Record &lt;b&gt;&quot;bob&quot;&lt;/b&gt; &amp; &#039;friends&#039;</li>"
              "</ul>");
}

TEST_F(OperationLogTest, NothingPersistedOrCorrupt) {
    OperationLog log = make_log();
    EXPECT_TRUE(log.last_entries().empty());
    EXPECT_EQ(log.formatted_last(), "");

    std::filesystem::create_directories(persist_path.parent_path());
    std::ofstream(persist_path) << "{ this is not json";
    EXPECT_TRUE(log.last_entries().empty());
    EXPECT_EQ(log.formatted_last(), "");

    std::ofstream(persist_path, std::ios::trunc)
        << R"({"expires_at": 4102444800000, "entries": [{"timestamp": 0, "severity": "LOUD", "message": "x"}]})";
    EXPECT_TRUE(log.last_entries().empty());
}

TEST_F(OperationLogTest, DeeplyNestedFileIsUnreadable) {
    OperationLog log = make_log();
    std::filesystem::create_directories(persist_path.parent_path());
    std::ofstream(persist_path) << R"({"expires_at": 4102444800000, "entries": )"
                                << std::string(5000, '[') << std::string(5000, ']') << "}";

    EXPECT_TRUE(log.last_entries().empty());
    EXPECT_EQ(log.formatted_last(), "");
}

TEST_F(OperationLogTest, PersistFailureIsReported) {
    // The parent of the persist path is a regular file
    std::filesystem::path blocker = dir->path() / "blocker";
    std::ofstream(blocker) << "x";
    OperationLog log(blocker / "last_log.json", OperationLog::DEFAULT_RETENTION, [this] { return now; });

    log.append("cannot be saved");
    EXPECT_FALSE(log.persist_last());
    EXPECT_TRUE(log.last_entries().empty());
}
