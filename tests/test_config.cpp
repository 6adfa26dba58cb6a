#include <gtest/gtest.h>
#include "temp_paths.hpp"
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.preset().empty());
    EXPECT_TRUE(r.value.ports().empty());
    EXPECT_EQ(r.value.endpoint().auth_path, "/api/auth");
    EXPECT_FALSE(r.value.payload_dir().has_value());
    EXPECT_FALSE(r.value.post_install().enabled());
}

TEST(Config, FullDocument) {
    auto r = Config::parse(
        "preset: conservative\n"
        "settings:\n"
        "  timeout: 2.5\n"
        "  max_wait: 30s\n"
        "  retries: 4\n"
        "  concurrency: 2\n"
        "  probe_jitter: 0.1\n"
        "  credential_ttl: 10m\n"
        "target:\n"
        "  ports: [22, 8080, 22]\n"
        "  user: admin\n"
        "  password: secret\n"
        "endpoint:\n"
        "  scheme_port: 8080\n"
        "  deliver_path: /cgi-bin/upgrade\n"
        "payload:\n"
        "  dir: /srv/payload\n"
        "post_install:\n"
        "  user: admin\n"
        "  commands:\n"
        "    - /etc/init.d/dropbear restart\n"
        "    - sync\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.preset(), "conservative");
    EXPECT_EQ(c.overrides().timeout->count(), 2500);
    EXPECT_EQ(c.overrides().max_service_wait->count(), 30000);
    EXPECT_EQ(*c.overrides().retries, 4);
    EXPECT_EQ(*c.overrides().max_concurrency, 2);
    EXPECT_DOUBLE_EQ(*c.overrides().probe_jitter, 0.1);
    EXPECT_EQ(c.overrides().credential_ttl->count(), 600);
    EXPECT_FALSE(c.overrides().read_timeout.has_value());

    EXPECT_EQ(c.ports(), (std::vector<int>{22, 8080}));
    EXPECT_EQ(c.user(), "admin");
    EXPECT_EQ(c.password(), "secret");
    EXPECT_EQ(c.endpoint().port, 8080);
    EXPECT_EQ(c.endpoint().auth_path, "/api/auth");
    EXPECT_EQ(c.endpoint().deliver_path, "/cgi-bin/upgrade");
    EXPECT_EQ(c.payload_dir()->string(), "/srv/payload");

    EXPECT_TRUE(c.post_install().enabled());
    EXPECT_EQ(c.post_install().user, "admin");
    EXPECT_EQ(c.post_install().port, 22);
    ASSERT_EQ(c.post_install().commands.size(), 2u);
    EXPECT_EQ(c.post_install().commands[1], "sync");
}

TEST(Config, UnknownSettingRejected) {
    auto r = Config::parse("settings:\n  timout: 3\n", "test.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("unknown setting 'timout'"), std::string::npos);
    EXPECT_EQ(r.error.rfind("test.yaml", 0), 0u);
}

TEST(Config, BadValuesRejected) {
    EXPECT_TRUE(Config::parse("settings:\n  timeout: soon\n").is_err());
    EXPECT_TRUE(Config::parse("settings:\n  retries: many\n").is_err());
    EXPECT_TRUE(Config::parse("target:\n  ports: [0]\n").is_err());
    EXPECT_TRUE(Config::parse("endpoint:\n  scheme_port: 70000\n").is_err());
    EXPECT_TRUE(Config::parse("post_install:\n  commands: reboot\n").is_err());
    EXPECT_TRUE(Config::parse("- a\n- b\n").is_err());
    EXPECT_TRUE(Config::parse("key: [unclosed\n").is_err());
}

TEST(Config, LoadMissingFileFails) {
    auto r = Config::load(unique_temp_path("rprov_no_such_config"));
    EXPECT_TRUE(r.is_err());
}

TEST(Config, LoadFromFile) {
    auto path = unique_temp_path("rprov_config_test");
    path += ".yaml";
    std::ofstream(path) << "preset: v2\ntarget:\n  ports: 2222\n";

    auto r = Config::load(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.preset(), "v2");
    EXPECT_EQ(r.value.ports(), (std::vector<int>{2222}));
}
