#include <gtest/gtest.h>
#include <nanoclaw/core/snapshot_writer.hpp>
#include <nanoclaw/core/utils.hpp>
#include "test_helpers.hpp"

using namespace nanoclaw;
using namespace nanoclaw::test_support;

static ScheduledTask task(const std::string& id, const std::string& folder) {
    ScheduledTask t;
    t.id = id;
    t.group_folder = folder;
    t.prompt = "do " + id;
    t.schedule_type = "cron";
    t.schedule_value = "0 9 * * *";
    t.status = "active";
    return t;
}

static AvailableGroup chat(const std::string& jid, const std::string& name) {
    AvailableGroup g;
    g.jid = jid;
    g.name = name;
    g.last_activity = "2026-01-01T00:00:00.000Z";
    return g;
}

class SnapshotWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = make_settings(tmp_.path());
        tasks_.push_back(task("t1", "main"));
        tasks_.push_back(task("t2", "family"));
        tasks_.push_back(task("t3", "work"));
        chats_.push_back(chat("1@g.us", "Family"));
        chats_.push_back(chat("2@g.us", "Book club"));
        registered_.insert("1@g.us");
    }

    TempDir tmp_;
    Settings settings_;
    std::vector<ScheduledTask> tasks_;
    std::vector<AvailableGroup> chats_;
    std::set<std::string> registered_;
};

TEST_F(SnapshotWriterTest, MainSeesAllTasks) {
    EXPECT_EQ(3u, SnapshotWriter::visible_tasks("main", true, tasks_).size());
}

TEST_F(SnapshotWriterTest, NonMainSeesOnlyOwnTasks) {
    std::vector<ScheduledTask> visible = SnapshotWriter::visible_tasks("family", false, tasks_);
    ASSERT_EQ(1u, visible.size());
    EXPECT_EQ("t2", visible[0].id);
    EXPECT_TRUE(SnapshotWriter::visible_tasks("nobody", false, tasks_).empty());
}

TEST_F(SnapshotWriterTest, OnlyMainSeesAvailableGroups) {
    EXPECT_TRUE(SnapshotWriter::visible_groups(false, chats_, registered_).empty());

    std::vector<AvailableGroup> visible = SnapshotWriter::visible_groups(true, chats_, registered_);
    ASSERT_EQ(2u, visible.size());
    EXPECT_TRUE(visible[0].is_registered);
    EXPECT_FALSE(visible[1].is_registered);
}

TEST_F(SnapshotWriterTest, WritesTaskSnapshotFile) {
    SnapshotWriter writer(settings_);
    ASSERT_TRUE(writer.write_tasks("family", false, tasks_));

    EXPECT_EQ(join_path(settings_.ipc_dir("family"), "current_tasks.json"), writer.tasks_path("family"));
    Json j = Json::parse(read_text(writer.tasks_path("family")));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(1u, j.size());
    EXPECT_EQ("t2", j[0]["id"]);
    EXPECT_EQ("family", j[0]["groupFolder"]);
    EXPECT_EQ("cron", j[0]["schedule_type"]);
    EXPECT_TRUE(j[0]["next_run"].is_null());
}

TEST_F(SnapshotWriterTest, WritesGroupSnapshotFile) {
    SnapshotWriter writer(settings_);
    ASSERT_TRUE(writer.write_groups("main", true, chats_, registered_));

    Json j = Json::parse(read_text(writer.groups_path("main")));
    ASSERT_TRUE(j["groups"].is_array());
    EXPECT_EQ(2u, j["groups"].size());
    EXPECT_EQ(true, j["groups"][0]["isRegistered"]);
    EXPECT_TRUE(j["lastSync"].is_string());
}

TEST_F(SnapshotWriterTest, NonMainGroupSnapshotIsEmpty) {
    SnapshotWriter writer(settings_);
    ASSERT_TRUE(writer.write_groups("family", false, chats_, registered_));

    Json j = Json::parse(read_text(writer.groups_path("family")));
    EXPECT_TRUE(j["groups"].empty());
}

TEST_F(SnapshotWriterTest, RewriteReplacesPreviousSnapshot) {
    SnapshotWriter writer(settings_);
    ASSERT_TRUE(writer.write_tasks("main", true, tasks_));
    tasks_.pop_back();
    ASSERT_TRUE(writer.write_tasks("main", true, tasks_));

    EXPECT_EQ(2u, Json::parse(read_text(writer.tasks_path("main"))).size());
    EXPECT_EQ(std::vector<std::string>(1, "current_tasks.json"), list_files(settings_.ipc_dir("main")));
}
