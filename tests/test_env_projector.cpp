#include <gtest/gtest.h>
#include <nanoclaw/core/env_projector.hpp>
#include <nanoclaw/core/utils.hpp>
#include "test_helpers.hpp"

using namespace nanoclaw;
using namespace nanoclaw::test_support;

TEST(EnvProjectorTest, FilterKeepsOnlyAllowedNames) {
    std::vector<std::string> kept = EnvironmentProjector::filter_lines(
        "# comment\n"
        "ANTHROPIC_API_KEY=sk-1\n"
        "  CLAUDE_CODE_OAUTH_TOKEN=tok  \r\n"
        "DATABASE_PASSWORD=hunter2\n"
        "ANTHROPIC_API_KEY_BACKUP=sk-2\n"
        "\n"
        "#ANTHROPIC_API_KEY=commented\n");
    ASSERT_EQ(2u, kept.size());
    EXPECT_EQ("ANTHROPIC_API_KEY=sk-1", kept[0]);
    EXPECT_EQ("CLAUDE_CODE_OAUTH_TOKEN=tok", kept[1]);
}

TEST(EnvProjectorTest, RenderAppendsConfiguredTimezone) {
    TempDir tmp;
    Settings s = make_settings(tmp.path());
    s.timezone = "Europe/Berlin";
    write_text(s.env_file, "ANTHROPIC_API_KEY=sk-1\nOTHER=x\n");

    EnvironmentProjector env(s);
    EXPECT_EQ("ANTHROPIC_API_KEY=sk-1\nTZ=Europe/Berlin\n", env.render());
}

TEST(EnvProjectorTest, MissingEnvFileStillExportsTimezone) {
    TempDir tmp;
    Settings s = make_settings(tmp.path());
    s.timezone = "UTC";

    EnvironmentProjector env(s);
    EXPECT_EQ("TZ=UTC\n", env.render());
}

TEST(EnvProjectorTest, DetectedTimezoneWhenUnset) {
    TempDir tmp;
    Settings s = make_settings(tmp.path());
    s.timezone.clear();

    EnvironmentProjector env(s);
    EXPECT_FALSE(env.timezone().empty());
    EXPECT_EQ(EnvironmentProjector::detect_system_timezone(), env.timezone());
}

TEST(EnvProjectorTest, WriteCreatesSandboxEnvFile) {
    TempDir tmp;
    Settings s = make_settings(tmp.path());
    write_text(s.env_file, "CLAUDE_CODE_OAUTH_TOKEN=tok\nAWS_SECRET_ACCESS_KEY=nope\n");

    EnvironmentProjector env(s);
    std::string error;
    ASSERT_TRUE(env.write(error)) << error;
    EXPECT_EQ(join_path(s.env_dir(), "env"), env.env_file_path());

    std::string content = read_text(env.env_file_path());
    EXPECT_NE(std::string::npos, content.find("CLAUDE_CODE_OAUTH_TOKEN=tok"));
    EXPECT_EQ(std::string::npos, content.find("AWS_SECRET_ACCESS_KEY"));
    EXPECT_NE(std::string::npos, content.find("TZ=UTC"));
}

TEST(EnvProjectorTest, WriteFailsWhenDataDirUnusable) {
    TempDir tmp;
    Settings s = make_settings(tmp.path());
    write_text(tmp.sub("blocker"), "x");
    s.data_dir = tmp.sub("blocker/data");

    EnvironmentProjector env(s);
    std::string error;
    EXPECT_FALSE(env.write(error));
    EXPECT_FALSE(error.empty());
}
