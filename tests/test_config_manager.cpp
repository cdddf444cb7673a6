#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "ConfigManager.hpp"
#include "config.hpp"

namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test
{
protected:
    fs::path dir;
    fs::path file;

    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("hub_oauth_config_") + info->name());
        fs::remove_all(dir);
        file = dir / "nested" / "hub_config.json";
        unsetenv("HUB_SIGNING_SECRET");
        unsetenv("HUB_DB_PASSWORD");
        unsetenv("HUB_UPSTREAM_CLIENT_SECRET");
    }

    void TearDown() override
    {
        unsetenv("HUB_SIGNING_SECRET");
        unsetenv("HUB_DB_PASSWORD");
        unsetenv("HUB_UPSTREAM_CLIENT_SECRET");
        fs::remove_all(dir);
    }

    void write_config(const nlohmann::json &config)
    {
        fs::create_directories(file.parent_path());
        std::ofstream out(file);
        out << config.dump(4);
    }
};

TEST_F(ConfigManagerTest, WritesDefaultsWhenMissing)
{
    ConfigManager manager(file.string());
    ASSERT_TRUE(manager.load_config());
    ASSERT_TRUE(fs::exists(file));

    std::ifstream in(file);
    nlohmann::json written;
    in >> written;
    EXPECT_EQ(written["server"]["port"], config::DEFAULT_PORT);
    EXPECT_EQ(written["oauth"]["code_ttl"], config::DEFAULT_CODE_TTL);
    EXPECT_FALSE(written["oauth"].contains("signing_secret"));

    EXPECT_EQ(manager.get_oauth_config().access_token_ttl, config::DEFAULT_ACCESS_TOKEN_TTL);
    EXPECT_EQ(manager.get_database_config().backend, "mysql");
}

TEST_F(ConfigManagerTest, ParsesFileValues)
{
    write_config({{"database", {{"backend", "memory"}, {"pool", {{"max_size", 4}}}}},
                  {"server", {{"port", 9100}, {"issuer", "https://hub.example.com/"}}},
                  {"oauth", {{"signing_secret", std::string(40, 'k')}, {"code_ttl", 120}}},
                  {"upstream", {{"discovery_url", "https://adfs.example.com/.well-known/openid-configuration"}}}});

    ConfigManager manager(file.string());
    ASSERT_TRUE(manager.load_config());
    EXPECT_EQ(manager.get_database_config().backend, "memory");
    EXPECT_EQ(manager.get_database_config().pool_config.max_size, 4u);
    EXPECT_EQ(manager.get_server_config().port, 9100);
    EXPECT_EQ(manager.get_server_config().issuer, "https://hub.example.com");
    EXPECT_EQ(manager.get_oauth_config().code_ttl, 120);
    EXPECT_EQ(manager.get_oauth_config().refresh_token_ttl, config::DEFAULT_REFRESH_TOKEN_TTL);
    EXPECT_EQ(manager.get_upstream_config().discovery_url,
              "https://adfs.example.com/.well-known/openid-configuration");

    std::string error;
    EXPECT_TRUE(manager.validate(error)) << error;
}

TEST_F(ConfigManagerTest, EnvironmentOverridesSecrets)
{
    write_config({{"oauth", {{"signing_secret", "short"}}}, {"database", {{"password", "from-file"}}}});
    setenv("HUB_SIGNING_SECRET", "env-secret-0123456789abcdefghijklmnop", 1);
    setenv("HUB_DB_PASSWORD", "from-env", 1);

    ConfigManager manager(file.string());
    ASSERT_TRUE(manager.load_config());
    EXPECT_EQ(manager.get_oauth_config().signing_secret, "env-secret-0123456789abcdefghijklmnop");
    EXPECT_EQ(manager.get_database_config().password, "from-env");
}

TEST_F(ConfigManagerTest, UpstreamClientSecretComesFromEnvironmentAndIsNotSaved)
{
    write_config({{"upstream", {{"client_id", "hub-upstream"}, {"client_secret", "from-file"}}},
                  {"oauth", {{"session_ttl", 900}}}});
    setenv("HUB_UPSTREAM_CLIENT_SECRET", "upstream-from-env", 1);

    ConfigManager manager(file.string());
    ASSERT_TRUE(manager.load_config());
    EXPECT_EQ(manager.get_upstream_config().client_secret, "upstream-from-env");
    EXPECT_EQ(manager.get_oauth_config().session_ttl, 900);

    ASSERT_TRUE(manager.save_config());
    std::ifstream in(file);
    nlohmann::json written;
    in >> written;
    EXPECT_FALSE(written["upstream"].contains("client_secret"));
    EXPECT_EQ(written["oauth"]["session_ttl"], 900);
}

TEST_F(ConfigManagerTest, ValidateRejectsWeakSettings)
{
    ConfigManager manager(file.string());
    ASSERT_TRUE(manager.load_config());

    std::string error;
    EXPECT_FALSE(manager.validate(error));
    EXPECT_NE(error.find("signing_secret"), std::string::npos);

    OAuthConfig oauth = manager.get_oauth_config();
    oauth.signing_secret = std::string(config::MIN_SIGNING_SECRET_LENGTH, 'x');
    manager.set_oauth_config(oauth);
    EXPECT_TRUE(manager.validate(error));

    oauth.code_ttl = 0;
    manager.set_oauth_config(oauth);
    EXPECT_FALSE(manager.validate(error));

    oauth.code_ttl = 60;
    manager.set_oauth_config(oauth);
    DatabaseConfig db = manager.get_database_config();
    db.backend = "sqlite";
    manager.set_database_config(db);
    EXPECT_FALSE(manager.validate(error));
}

TEST_F(ConfigManagerTest, MalformedFileFailsToLoad)
{
    fs::create_directories(file.parent_path());
    std::ofstream(file) << "{ not json";
    ConfigManager manager(file.string());
    EXPECT_FALSE(manager.load_config());
}
