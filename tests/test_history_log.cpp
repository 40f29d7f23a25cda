#include "test_helpers.hpp"
#include <history/history_log.hpp>
#include <history/project_registry.hpp>

class HistoryLogTest : public ScratchTest {
protected:
    HistoryRecord record(const std::string& id, const std::string& project = "p1") {
        HistoryRecord r;
        r.id = id;
        r.kind = "backup";
        r.project_id = project;
        r.project_name = "Project " + project;
        r.destination_path = "/mnt/backup";
        r.destination_name = "backup";
        r.files_copied = 3;
        r.total_bytes = 30;
        r.started_at = "2025-01-15T10:00:00";
        r.completed_at = "2025-01-15T10:00:05";
        r.status = "completed";
        return r;
    }
};

TEST_F(HistoryLogTest, MissingFileIsEmpty) {
    HistoryLog log(test_dir / "history.yaml", 100);
    EXPECT_TRUE(log.list().empty());
}

TEST_F(HistoryLogTest, MostRecentFirst) {
    HistoryLog log(test_dir / "history.yaml", 100);
    ASSERT_TRUE(log.append(record("a")).is_ok());
    ASSERT_TRUE(log.append(record("b")).is_ok());
    ASSERT_TRUE(log.append(record("c")).is_ok());

    auto all = log.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "c");
    EXPECT_EQ(all[1].id, "b");
    EXPECT_EQ(all[2].id, "a");
}

TEST_F(HistoryLogTest, PrunesOldestBeyondCap) {
    HistoryLog log(test_dir / "history.yaml", 100);
    for (int i = 0; i < 105; ++i) {
        ASSERT_TRUE(log.append(record("r" + std::to_string(i))).is_ok());
    }
    auto all = log.list();
    ASSERT_EQ(all.size(), 100u);
    EXPECT_EQ(all.front().id, "r104");
    EXPECT_EQ(all.back().id, "r5");
}

TEST_F(HistoryLogTest, FieldsSurviveReload) {
    auto path = test_dir / "nested/history.yaml";
    {
        HistoryLog log(path, 10);
        auto r = record("x");
        r.kind = "import";
        r.files_skipped = 2;
        r.photos_copied = 1;
        r.videos_copied = 2;
        r.status = "partial";
        r.error_message = "card: read error";
        ASSERT_TRUE(log.append(r).is_ok());
    }

    HistoryLog reopened(path, 10);
    auto all = reopened.list();
    ASSERT_EQ(all.size(), 1u);
    const auto& r = all[0];
    EXPECT_EQ(r.kind, "import");
    EXPECT_EQ(r.project_name, "Project p1");
    EXPECT_EQ(r.files_copied, 3u);
    EXPECT_EQ(r.files_skipped, 2u);
    EXPECT_EQ(r.total_bytes, 30u);
    EXPECT_EQ(r.photos_copied, 1u);
    EXPECT_EQ(r.videos_copied, 2u);
    EXPECT_EQ(r.status, "partial");
    ASSERT_TRUE(r.error_message.has_value());
    EXPECT_EQ(*r.error_message, "card: read error");
}

TEST_F(HistoryLogTest, CorruptFileReadsAsEmptyAndIsReplaced) {
    auto path = write_file("history.yaml", "entries: [ {id: broken\n  - {");
    HistoryLog log(path, 100);
    EXPECT_TRUE(log.list().empty());

    ASSERT_TRUE(log.append(record("fresh")).is_ok());
    auto all = log.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, "fresh");
}

TEST_F(HistoryLogTest, FilterByProject) {
    HistoryLog log(test_dir / "history.yaml", 100);
    ASSERT_TRUE(log.append(record("a", "p1")).is_ok());
    ASSERT_TRUE(log.append(record("b", "p2")).is_ok());
    ASSERT_TRUE(log.append(record("c", "p1")).is_ok());

    auto p1 = log.list_for_project("p1");
    ASSERT_EQ(p1.size(), 2u);
    EXPECT_EQ(p1[0].id, "c");
    EXPECT_EQ(p1[1].id, "a");
    EXPECT_TRUE(log.list_for_project("p3").empty());
}

class ProjectRegistryTest : public ScratchTest {};

TEST_F(ProjectRegistryTest, SetAndReadStatus) {
    FileProjectRegistry registry(test_dir / "projects.yaml");
    EXPECT_FALSE(registry.status("p1").has_value());

    ASSERT_TRUE(registry.set_status("p1", "Editing").is_ok());
    ASSERT_TRUE(registry.set_status("p2", "Shooting").is_ok());
    ASSERT_TRUE(registry.set_status("p1", "Archived").is_ok());

    FileProjectRegistry reopened(test_dir / "projects.yaml");
    EXPECT_EQ(reopened.status("p1").value_or(""), "Archived");
    EXPECT_EQ(reopened.status("p2").value_or(""), "Shooting");
}

TEST_F(ProjectRegistryTest, EmptyIdRejected) {
    FileProjectRegistry registry(test_dir / "projects.yaml");
    auto r = registry.set_status("", "Archived");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
}
