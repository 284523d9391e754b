#include <gtest/gtest.h>
#include <glib.h>
#include <glib/gstdio.h>
#include <cstdlib>
#include <string>
#include "utils/Config.hpp"

using NewsDesk::Config;
using NewsDesk::NewsApiSettings;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        gchar* dir = g_dir_make_tmp("newsdesk-config-XXXXXX", nullptr);
        ASSERT_NE(dir, nullptr);
        dir_ = dir;
        g_free(dir);
        path_ = dir_ + "/config.json";
        unsetenv("NEWSDESK_API_KEY");
    }

    void TearDown() override {
        g_remove(path_.c_str());
        g_rmdir(dir_.c_str());
    }

    void write(const std::string& json) {
        ASSERT_TRUE(g_file_set_contents(path_.c_str(), json.c_str(), -1, nullptr));
    }

    std::string dir_;
    std::string path_;
};

}

TEST_F(ConfigTest, MissingFileYieldsDefaultsAndIsCreated) {
    Config config(path_);
    config.load();

    auto api = config.getNewsApiSettings();
    EXPECT_EQ(api.baseUrl, "https://newsapi.org/v2");
    EXPECT_EQ(api.country, "us");
    EXPECT_EQ(api.connectTimeout, 10);
    EXPECT_EQ(api.receiveTimeout, 10);
    EXPECT_EQ(api.apiKey, "");

    auto categories = config.getCategories();
    ASSERT_EQ(categories.size(), 6u);
    EXPECT_EQ(categories.front(), "business");
    EXPECT_EQ(categories.back(), "technology");
    EXPECT_EQ(config.getDefaultCategory(), "business");
    EXPECT_EQ(config.getLogLevel(), "warn");

    EXPECT_TRUE(g_file_test(path_.c_str(), G_FILE_TEST_EXISTS));
}

TEST_F(ConfigTest, LoadsValuesFromFile) {
    write(R"({
        "baseUrl": "https://mirror.example/v2",
        "apiKey": "abc123",
        "country": "gb",
        "connectTimeout": 4,
        "receiveTimeout": 20,
        "categories": ["science", "technology", "science"],
        "defaultCategory": "technology",
        "databasePath": "/tmp/elsewhere/bookmarks.db",
        "logLevel": "debug"
    })");

    Config config(path_);
    config.load();

    auto api = config.getNewsApiSettings();
    EXPECT_EQ(api.baseUrl, "https://mirror.example/v2");
    EXPECT_EQ(api.apiKey, "abc123");
    EXPECT_EQ(api.country, "gb");
    EXPECT_EQ(api.connectTimeout, 4);
    EXPECT_EQ(api.receiveTimeout, 20);
    EXPECT_EQ(config.getCategories(), (std::vector<std::string>{"science", "technology"}));
    EXPECT_EQ(config.getDefaultCategory(), "technology");
    EXPECT_EQ(config.getDatabasePath(), "/tmp/elsewhere/bookmarks.db");
    EXPECT_EQ(config.getLogLevel(), "debug");
}

TEST_F(ConfigTest, MalformedMembersFallBackToDefaults) {
    write(R"({
        "baseUrl": 17,
        "country": null,
        "connectTimeout": "soon",
        "receiveTimeout": -3,
        "categories": "business",
        "defaultCategory": "gossip"
    })");

    Config config(path_);
    config.load();

    auto api = config.getNewsApiSettings();
    EXPECT_EQ(api.baseUrl, "https://newsapi.org/v2");
    EXPECT_EQ(api.country, "us");
    EXPECT_EQ(api.connectTimeout, 10);
    EXPECT_EQ(api.receiveTimeout, 10);
    EXPECT_EQ(config.getCategories().size(), 6u);
    EXPECT_EQ(config.getDefaultCategory(), "business");
}

TEST_F(ConfigTest, NonObjectRootKeepsDefaults) {
    write("[\"business\"]");
    Config config(path_);
    config.load();
    EXPECT_EQ(config.getDefaultCategory(), "business");
    EXPECT_EQ(config.getNewsApiSettings().country, "us");
}

TEST_F(ConfigTest, SaveThenLoadRestoresSettings) {
    {
        Config config(path_);
        NewsApiSettings api;
        api.apiKey = "saved-key";
        api.country = "de";
        api.connectTimeout = 3;
        config.setNewsApiSettings(api);
        config.setCategories({"health", "sports"});
        config.setDefaultCategory("sports");
        config.setDatabasePath(dir_ + "/db/bookmarks.db");
        ASSERT_TRUE(config.save());
    }

    Config reloaded(path_);
    reloaded.load();
    auto api = reloaded.getNewsApiSettings();
    EXPECT_EQ(api.apiKey, "saved-key");
    EXPECT_EQ(api.country, "de");
    EXPECT_EQ(api.connectTimeout, 3);
    EXPECT_EQ(api.receiveTimeout, 10);
    EXPECT_EQ(reloaded.getCategories(), (std::vector<std::string>{"health", "sports"}));
    EXPECT_EQ(reloaded.getDefaultCategory(), "sports");
    EXPECT_EQ(reloaded.getDatabasePath(), dir_ + "/db/bookmarks.db");
}

TEST_F(ConfigTest, EnvironmentOverridesApiKey) {
    write(R"({"apiKey": "from-file"})");
    Config config(path_);
    config.load();

    setenv("NEWSDESK_API_KEY", "from-env", 1);
    EXPECT_EQ(config.getNewsApiSettings().apiKey, "from-env");
    unsetenv("NEWSDESK_API_KEY");
    EXPECT_EQ(config.getNewsApiSettings().apiKey, "from-file");
}

TEST_F(ConfigTest, DefaultDatabaseLivesInUserDataDir) {
    Config config(path_);
    config.load();
    std::string expected = std::string(g_get_user_data_dir()) + "/newsdesk/bookmarks.db";
    EXPECT_EQ(config.getDatabasePath(), expected);
    EXPECT_EQ(Config::defaultDatabasePath(), expected);
}
