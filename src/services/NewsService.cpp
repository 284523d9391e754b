#include "services/NewsService.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include <json-glib/json-glib.h>
#include <cctype>
#include <cstdio>

namespace NewsDesk {

const char* toString(FetchError::Kind kind) {
    switch (kind) {
        case FetchError::Kind::None: return "none";
        case FetchError::Kind::Network: return "network";
        case FetchError::Kind::Timeout: return "timeout";
        case FetchError::Kind::Upstream: return "upstream";
        case FetchError::Kind::Decode: return "decode";
    }
    return "unknown";
}

NewsService::NewsService(HttpClient& http, const NewsApiSettings& settings)
    : http_(http), settings_(settings) {
    http_.setConnectTimeout(settings_.connectTimeout);
    http_.setReceiveTimeout(settings_.receiveTimeout);
}

// URL-encode a query parameter value
static std::string urlEncode(const std::string& str) {
    std::string result;
    for (unsigned char c : str) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

std::string NewsService::buildUrl(const std::string& base,
                                  const std::vector<std::pair<std::string, std::string>>& params) {
    std::string url = base;
    char sep = (url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& p : params) {
        url += sep;
        url += urlEncode(p.first) + "=" + urlEncode(p.second);
        sep = '&';
    }
    return url;
}

// Null, missing and non-string members all read as ""
static std::string safeGetString(JsonObject* obj, const char* member) {
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) {
        return "";
    }
    const char* val = json_node_get_string(node);
    return val ? val : "";
}

static std::string sourceName(JsonObject* obj) {
    JsonNode* node = json_object_get_member(obj, "source");
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) return "";
    return safeGetString(json_node_get_object(node), "name");
}

FeedResponse NewsService::parseArticles(const std::string& body) {
    FeedResponse result;
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &error)) {
        result.error = {FetchError::Kind::Decode, 0, error ? error->message : "invalid JSON"};
        if (error) g_error_free(error);
        g_object_unref(parser);
        return result;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        result.error = {FetchError::Kind::Decode, 0, "response is not a JSON object"};
        g_object_unref(parser);
        return result;
    }

    JsonObject* obj = json_node_get_object(root);
    if (safeGetString(obj, "status") == "error") {
        std::string message = safeGetString(obj, "message");
        result.error = {FetchError::Kind::Upstream, 0, message.empty() ? "upstream reported an error" : message};
        g_object_unref(parser);
        return result;
    }

    JsonNode* articlesNode = json_object_get_member(obj, "articles");
    if (!articlesNode || !JSON_NODE_HOLDS_ARRAY(articlesNode)) {
        result.error = {FetchError::Kind::Decode, 0, "response has no articles array"};
        g_object_unref(parser);
        return result;
    }

    JsonArray* items = json_node_get_array(articlesNode);
    guint len = json_array_get_length(items);
    result.articles.reserve(len);
    for (guint i = 0; i < len; i++) {
        JsonNode* el = json_array_get_element(items, i);
        if (!JSON_NODE_HOLDS_OBJECT(el)) {
            LOG_DEBUG("Skipping article {}: not an object", i);
            continue;
        }
        JsonObject* item = json_node_get_object(el);

        Article article;
        article.url = safeGetString(item, "url");
        if (article.url.empty()) {
            LOG_DEBUG("Skipping article {}: no url", i);
            continue;
        }
        article.title = safeGetString(item, "title");
        article.description = safeGetString(item, "description");
        article.imageUrl = safeGetString(item, "urlToImage");
        article.publishedAt = safeGetString(item, "publishedAt");
        article.source = sourceName(item);
        result.articles.push_back(std::move(article));
    }

    g_object_unref(parser);
    result.success = true;
    return result;
}

FeedResponse NewsService::execute(const std::string& url) {
    auto response = http_.get(url);
    FeedResponse result;

    if (!response.error.empty()) {
        FetchError::Kind kind = response.timedOut ? FetchError::Kind::Timeout : FetchError::Kind::Network;
        result.error = {kind, 0, response.error};
    } else if (!response.success) {
        // NewsAPI explains rejections in the body
        std::string message = "HTTP " + std::to_string(response.statusCode);
        auto detail = parseArticles(response.body);
        if (detail.error.kind == FetchError::Kind::Upstream) message = detail.error.message;
        result.error = {FetchError::Kind::Upstream, response.statusCode, message};
    } else {
        result = parseArticles(response.body);
        if (result.error.kind == FetchError::Kind::Upstream) {
            result.error.status = response.statusCode;
        }
    }

    if (!result.success) {
        LOG_WARN("News request failed ({}): {}", toString(result.error.kind), result.error.message);
    } else {
        LOG_DEBUG("News request returned {} articles", result.articles.size());
    }
    return result;
}

FeedResponse NewsService::fetchHeadlines(const std::optional<std::string>& category) {
    std::vector<std::pair<std::string, std::string>> params = {
        {"apiKey", settings_.apiKey},
        {"country", settings_.country},
    };
    if (category) params.emplace_back("category", *category);
    return execute(buildUrl(settings_.baseUrl + "/top-headlines", params));
}

FeedResponse NewsService::search(const std::string& query) {
    return execute(buildUrl(settings_.baseUrl + "/everything", {
        {"apiKey", settings_.apiKey},
        {"q", query},
    }));
}

}
