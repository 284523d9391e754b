#include "utils/Config.hpp"
#include "utils/Logger.hpp"
#include <json-glib/json-glib.h>
#include <glib/gstdio.h>
#include <algorithm>
#include <cstdlib>

namespace NewsDesk {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() : path_(defaultConfigPath()) {
    load();
}

Config::Config(const std::string& path) : path_(path) {
    ensureDefaults();
}

std::string Config::defaultConfigPath() {
    gchar* path = g_build_filename(g_get_user_config_dir(), "newsdesk", "config.json", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

std::string Config::defaultDatabasePath() {
    gchar* path = g_build_filename(g_get_user_data_dir(), "newsdesk", "bookmarks.db", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

void Config::ensureDefaults() {
    if (categories_.empty()) {
        categories_ = {"business", "entertainment", "health", "science", "sports", "technology"};
    }
    if (defaultCategory_.empty() || !hasCategory(defaultCategory_)) {
        defaultCategory_ = categories_.front();
    }
    if (api_.baseUrl.empty()) api_.baseUrl = NewsApiSettings().baseUrl;
    if (api_.country.empty()) api_.country = NewsApiSettings().country;
    if (api_.connectTimeout <= 0) api_.connectTimeout = NewsApiSettings().connectTimeout;
    if (api_.receiveTimeout <= 0) api_.receiveTimeout = NewsApiSettings().receiveTimeout;
}

static std::string getStringMember(JsonObject* obj, const char* member, const std::string& fallback) {
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) {
        return fallback;
    }
    const char* val = json_node_get_string(node);
    return val ? val : fallback;
}

static long getIntMember(JsonObject* obj, const char* member, long fallback) {
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_INT64) {
        return fallback;
    }
    return static_cast<long>(json_node_get_int(node));
}

void Config::load() {
    gchar* dir = g_path_get_dirname(path_.c_str());
    g_mkdir_with_parents(dir, 0755);
    g_free(dir);

    api_ = NewsApiSettings();
    categories_.clear();
    defaultCategory_.clear();
    databasePath_.clear();
    logLevel_ = "warn";

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, path_.c_str(), &error)) {
        if (error) {
            LOG_INFO("No usable config at {}: {}", path_, error->message);
            g_error_free(error);
        }
        g_object_unref(parser);
        ensureDefaults();
        save();
        return;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        LOG_WARN("Ignoring config {}: root is not an object", path_);
        g_object_unref(parser);
        ensureDefaults();
        return;
    }

    JsonObject* obj = json_node_get_object(root);

    api_.baseUrl = getStringMember(obj, "baseUrl", api_.baseUrl);
    api_.apiKey = getStringMember(obj, "apiKey", "");
    api_.country = getStringMember(obj, "country", api_.country);
    api_.connectTimeout = getIntMember(obj, "connectTimeout", api_.connectTimeout);
    api_.receiveTimeout = getIntMember(obj, "receiveTimeout", api_.receiveTimeout);

    JsonNode* catsNode = json_object_get_member(obj, "categories");
    if (catsNode && JSON_NODE_HOLDS_ARRAY(catsNode)) {
        JsonArray* cats = json_node_get_array(catsNode);
        guint len = json_array_get_length(cats);
        for (guint i = 0; i < len; i++) {
            JsonNode* el = json_array_get_element(cats, i);
            if (!JSON_NODE_HOLDS_VALUE(el) || json_node_get_value_type(el) != G_TYPE_STRING) continue;
            std::string cat = json_node_get_string(el);
            if (!cat.empty() && !hasCategory(cat)) categories_.push_back(cat);
        }
    }

    defaultCategory_ = getStringMember(obj, "defaultCategory", "");
    databasePath_ = getStringMember(obj, "databasePath", "");
    logLevel_ = getStringMember(obj, "logLevel", logLevel_);

    g_object_unref(parser);
    ensureDefaults();
}

bool Config::save() {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "baseUrl");
    json_builder_add_string_value(builder, api_.baseUrl.c_str());
    json_builder_set_member_name(builder, "apiKey");
    json_builder_add_string_value(builder, api_.apiKey.c_str());
    json_builder_set_member_name(builder, "country");
    json_builder_add_string_value(builder, api_.country.c_str());
    json_builder_set_member_name(builder, "connectTimeout");
    json_builder_add_int_value(builder, api_.connectTimeout);
    json_builder_set_member_name(builder, "receiveTimeout");
    json_builder_add_int_value(builder, api_.receiveTimeout);

    json_builder_set_member_name(builder, "categories");
    json_builder_begin_array(builder);
    for (const auto& cat : categories_) {
        json_builder_add_string_value(builder, cat.c_str());
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "defaultCategory");
    json_builder_add_string_value(builder, defaultCategory_.c_str());
    json_builder_set_member_name(builder, "databasePath");
    json_builder_add_string_value(builder, databasePath_.c_str());
    json_builder_set_member_name(builder, "logLevel");
    json_builder_add_string_value(builder, logLevel_.c_str());

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    JsonNode* root = json_builder_get_root(builder);
    json_generator_set_root(gen, root);
    json_generator_set_pretty(gen, TRUE);

    GError* error = nullptr;
    bool ok = json_generator_to_file(gen, path_.c_str(), &error);
    if (!ok) {
        LOG_WARN("Failed to save config {}: {}", path_, error ? error->message : "unknown error");
        if (error) g_error_free(error);
    }

    json_node_free(root);
    g_object_unref(gen);
    g_object_unref(builder);
    return ok;
}

NewsApiSettings Config::getNewsApiSettings() const {
    NewsApiSettings settings = api_;
    const char* envKey = std::getenv("NEWSDESK_API_KEY");
    if (envKey && *envKey) settings.apiKey = envKey;
    return settings;
}

void Config::setNewsApiSettings(const NewsApiSettings& settings) {
    api_ = settings;
    ensureDefaults();
}

std::vector<std::string> Config::getCategories() const { return categories_; }

void Config::setCategories(const std::vector<std::string>& categories) {
    categories_.clear();
    for (const auto& c : categories) {
        if (!c.empty() && !hasCategory(c)) categories_.push_back(c);
    }
    ensureDefaults();
}

bool Config::hasCategory(const std::string& category) const {
    return std::find(categories_.begin(), categories_.end(), category) != categories_.end();
}

std::string Config::getDefaultCategory() const { return defaultCategory_; }

void Config::setDefaultCategory(const std::string& category) {
    defaultCategory_ = category;
    ensureDefaults();
}

std::string Config::getDatabasePath() const {
    return databasePath_.empty() ? defaultDatabasePath() : databasePath_;
}

void Config::setDatabasePath(const std::string& path) { databasePath_ = path; }

std::string Config::getLogLevel() const { return logLevel_; }
void Config::setLogLevel(const std::string& level) { logLevel_ = level; }

}
