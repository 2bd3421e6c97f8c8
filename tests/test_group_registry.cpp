#include <gtest/gtest.h>
#include <nanoclaw/core/group_registry.hpp>
#include <nanoclaw/core/utils.hpp>
#include "test_helpers.hpp"

using namespace nanoclaw;
using namespace nanoclaw::test_support;

class GroupRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = make_settings(tmp_.path());
    }

    static Group group(const std::string& jid, const std::string& name, const std::string& folder) {
        Group g;
        g.jid = jid;
        g.name = name;
        g.folder = folder;
        g.trigger = "@Andy";
        return g;
    }

    TempDir tmp_;
    Settings settings_;
};

TEST_F(GroupRegistryTest, MissingFileMeansNoGroups) {
    GroupRegistry registry(settings_);
    std::string error;
    ASSERT_TRUE(registry.load(error)) << error;
    EXPECT_TRUE(registry.all().empty());
}

TEST_F(GroupRegistryTest, MalformedFileFailsToLoad) {
    write_text(join_path(settings_.data_dir, "registered_groups.json"), "{ oops");
    GroupRegistry registry(settings_);
    std::string error;
    EXPECT_FALSE(registry.load(error));
    EXPECT_FALSE(error.empty());
}

TEST_F(GroupRegistryTest, RegisterPersistsAcrossInstances) {
    {
        GroupRegistry registry(settings_);
        std::string error;
        ASSERT_TRUE(registry.load(error));
        ASSERT_TRUE(registry.register_group(group("1@g.us", "Main", "main"), error)) << error;
        ASSERT_TRUE(registry.register_group(group("2@g.us", "Family", "family"), error)) << error;
    }

    GroupRegistry reloaded(settings_);
    std::string error;
    ASSERT_TRUE(reloaded.load(error)) << error;
    EXPECT_EQ(2u, reloaded.all().size());

    Group g;
    ASSERT_TRUE(reloaded.find_by_folder("family", g));
    EXPECT_EQ("2@g.us", g.jid);
    EXPECT_EQ("Family", g.name);
    EXPECT_FALSE(g.is_main);
    EXPECT_FALSE(g.added_at.empty());

    ASSERT_TRUE(reloaded.find_by_jid("1@g.us", g));
    EXPECT_TRUE(g.is_main);
    EXPECT_FALSE(reloaded.find_by_folder("work", g));
}

TEST_F(GroupRegistryTest, RegisterCreatesGroupDirectories) {
    GroupRegistry registry(settings_);
    std::string error;
    ASSERT_TRUE(registry.register_group(group("2@g.us", "Family", "family"), error)) << error;
    EXPECT_TRUE(is_directory(settings_.logs_dir("family")));
}

TEST_F(GroupRegistryTest, PrivilegeFollowsConfiguredMainFolder) {
    settings_.main_group_folder = "admin";
    GroupRegistry registry(settings_);
    std::string error;
    ASSERT_TRUE(registry.register_group(group("1@g.us", "Main", "main"), error));
    ASSERT_TRUE(registry.register_group(group("2@g.us", "Admin", "admin"), error));

    Group g;
    ASSERT_TRUE(registry.find_by_folder("main", g));
    EXPECT_FALSE(g.is_main);
    ASSERT_TRUE(registry.find_by_folder("admin", g));
    EXPECT_TRUE(g.is_main);
}

TEST_F(GroupRegistryTest, RefusesDuplicates) {
    GroupRegistry registry(settings_);
    std::string error;
    ASSERT_TRUE(registry.register_group(group("1@g.us", "Family", "family"), error));

    EXPECT_FALSE(registry.register_group(group("2@g.us", "Family again", "family"), error));
    EXPECT_NE(std::string::npos, error.find("already used"));
    EXPECT_FALSE(registry.register_group(group("1@g.us", "Same chat", "other"), error));
    EXPECT_NE(std::string::npos, error.find("already registered"));
}

TEST_F(GroupRegistryTest, FailedSaveLeavesNothingRegistered) {
    write_text(tmp_.sub("blocker"), "not a directory");
    const std::string real_data_dir = settings_.data_dir;
    settings_.data_dir = join_path(tmp_.sub("blocker"), "data");

    GroupRegistry registry(settings_);
    std::string error;
    EXPECT_FALSE(registry.register_group(group("123@g.us", "Family", "family"), error));
    EXPECT_FALSE(error.empty());

    Group g;
    EXPECT_FALSE(registry.find_by_jid("123@g.us", g));
    EXPECT_FALSE(registry.find_by_folder("family", g));
    EXPECT_TRUE(registry.all().empty());

    settings_.data_dir = real_data_dir;
    ASSERT_TRUE(registry.register_group(group("123@g.us", "Family", "family"), error)) << error;
    EXPECT_TRUE(registry.find_by_jid("123@g.us", g));
}

TEST_F(GroupRegistryTest, PairingCodeRegistersChat) {
    GroupRegistry registry(settings_);
    PairingStore pairings;
    const int64_t now = 1760000000000LL;
    std::string code = pairings.issue("telegram:42", 42, "Book Club!", now);

    Group g;
    std::string error;
    ASSERT_TRUE(registry.register_pairing(pairings, code, "@Andy", now + 1000, g, error)) << error;
    EXPECT_EQ("telegram:42", g.jid);
    EXPECT_EQ("Book Club!", g.name);
    EXPECT_EQ("tg-book-club-", g.folder);
    EXPECT_EQ("@Andy", g.trigger);
    EXPECT_FALSE(g.is_main);
    EXPECT_EQ(0u, pairings.size());

    GroupRegistry reloaded(settings_);
    ASSERT_TRUE(reloaded.load(error)) << error;
    EXPECT_TRUE(reloaded.find_by_folder("tg-book-club-", g));

    // Consumed
    EXPECT_FALSE(registry.register_pairing(pairings, code, "@Andy", now + 2000, g, error));
    EXPECT_NE(std::string::npos, error.find("unknown or expired"));
}

TEST_F(GroupRegistryTest, PairingRefusesRegisteredChatAndExpiredCode) {
    GroupRegistry registry(settings_);
    std::string error;
    ASSERT_TRUE(registry.register_group(group("telegram:1", "Family", "family"), error)) << error;

    PairingStore pairings;
    const int64_t now = 1760000000000LL;
    std::string code = pairings.issue("telegram:1", 1, "Family", now);
    Group g;
    EXPECT_FALSE(registry.register_pairing(pairings, code, "@Andy", now, g, error));
    EXPECT_NE(std::string::npos, error.find("already registered"));
    EXPECT_EQ(0u, pairings.size());

    code = pairings.issue("telegram:2", 2, "Work", now);
    EXPECT_FALSE(registry.register_pairing(pairings, code, "@Andy", now + PairingStore::DEFAULT_EXPIRY_MS + 1, g, error));
    EXPECT_FALSE(registry.find_by_jid("telegram:2", g));
    EXPECT_EQ(1u, registry.all().size());
}

TEST_F(GroupRegistryTest, RefusesBadFolders) {
    GroupRegistry registry(settings_);
    const char* bad[] = { "", "global", "Family", "../etc", "a/b", "-lead", "_lead", "has space", NULL };
    for (int i = 0; bad[i] != NULL; ++i) {
        std::string error;
        EXPECT_FALSE(registry.register_group(group(std::string("x") + bad[i], "X", bad[i]), error)) << bad[i];
    }
    EXPECT_TRUE(GroupRegistry::valid_folder("tg-book-club_2"));
}

TEST_F(GroupRegistryTest, LoadSkipsEntriesWithBadFolders) {
    write_text(join_path(settings_.data_dir, "registered_groups.json"),
               "{\"1@g.us\":{\"name\":\"Ok\",\"folder\":\"ok\"},"
               " \"2@g.us\":{\"name\":\"Escape\",\"folder\":\"../../etc\"},"
               " \"3@g.us\":{\"name\":\"No folder\"}}");
    GroupRegistry registry(settings_);
    std::string error;
    ASSERT_TRUE(registry.load(error));
    ASSERT_EQ(1u, registry.all().size());
    EXPECT_EQ("ok", registry.all()[0].folder);
}

TEST_F(GroupRegistryTest, LoadsContainerConfig) {
    write_text(join_path(settings_.data_dir, "registered_groups.json"),
               "{\"1@g.us\":{\"name\":\"Dev\",\"folder\":\"dev\",\"trigger\":\"@Andy\","
               " \"containerConfig\":{\"timeout\":120000,"
               "   \"additionalMounts\":[{\"hostPath\":\"~/projects/app\",\"containerPath\":\"app\"}]}}}");
    GroupRegistry registry(settings_);
    std::string error;
    ASSERT_TRUE(registry.load(error));

    Group g;
    ASSERT_TRUE(registry.find_by_jid("1@g.us", g));
    EXPECT_EQ(120000, g.config.timeout_ms);
    ASSERT_EQ(1u, g.config.additional_mounts.size());
    EXPECT_EQ("~/projects/app", g.config.additional_mounts[0].host_path);
}

TEST(RegistrationFolderTest, SlugFromTitle) {
    EXPECT_EQ("tg-book-club", GroupRegistry::registration_folder_for("Book Club"));
    EXPECT_EQ("tg-family-chat-", GroupRegistry::registration_folder_for("Family Chat!!"));
    EXPECT_EQ("tg--dev-ops", GroupRegistry::registration_folder_for("  Dev & Ops"));
    EXPECT_EQ("tg-abcdefghijklmnopqrst",
              GroupRegistry::registration_folder_for("ABCDEFGHIJKLMNOPQRSTUVWXYZ"));
    EXPECT_TRUE(GroupRegistry::valid_folder(GroupRegistry::registration_folder_for("Émile's group")));
}
