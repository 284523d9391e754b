#pragma once
#include <string>
#include <vector>

namespace NewsDesk {

struct NewsApiSettings {
    std::string baseUrl = "https://newsapi.org/v2";
    std::string apiKey;
    std::string country = "us";
    long connectTimeout = 10;  // seconds
    long receiveTimeout = 10;  // seconds
};

class Config {
public:
    static Config& getInstance();

    // Settings stored at an explicit path; nothing is read until load()
    explicit Config(const std::string& path);

    NewsApiSettings getNewsApiSettings() const;
    void setNewsApiSettings(const NewsApiSettings& settings);

    // Headline categories
    std::vector<std::string> getCategories() const;
    void setCategories(const std::vector<std::string>& categories);
    bool hasCategory(const std::string& category) const;
    std::string getDefaultCategory() const;
    void setDefaultCategory(const std::string& category);

    // Bookmark database; resolves to the user data directory when unset
    std::string getDatabasePath() const;
    void setDatabasePath(const std::string& path);

    std::string getLogLevel() const;
    void setLogLevel(const std::string& level);

    bool save();
    void load();

    static std::string defaultConfigPath();
    static std::string defaultDatabasePath();

private:
    Config();
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void ensureDefaults();

    std::string path_;
    NewsApiSettings api_;
    std::vector<std::string> categories_;
    std::string defaultCategory_;
    std::string databasePath_;
    std::string logLevel_ = "warn";
};

}
